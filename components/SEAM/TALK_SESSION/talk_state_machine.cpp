#include "talk_state_machine.h"
#include "esp_log.h"
#include <algorithm>

static const char* TAG = "TalkStateMachine";

TalkState TalkStateMachine::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_state_;
}

bool TalkStateMachine::transitionTo(TalkState new_state) {
    TalkState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = current_state_;

        if (old_state == new_state) {
            return true;
        }

        if (!isValidTransition(old_state, new_state)) {
            ESP_LOGW(TAG, "Invalid transition: %s -> %s",
                     GetTalkStateName(old_state), GetTalkStateName(new_state));
            return false;
        }

        current_state_ = new_state;
    }

    ESP_LOGI(TAG, "State transition: %s -> %s",
             GetTalkStateName(old_state), GetTalkStateName(new_state));

    notifyStateChange(old_state, new_state);
    return true;
}

bool TalkStateMachine::canTransitionTo(TalkState target) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isValidTransition(current_state_, target);
}

bool TalkStateMachine::isValidTransition(TalkState from, TalkState to) const {
    switch (from) {
        case kTalkStateIdle:
            return to == kTalkStateAwaiting ||
                   to == kTalkStateRecording;

        case kTalkStateAwaiting:
            return to == kTalkStateRecording ||
                   to == kTalkStateFinalizing ||
                   to == kTalkStateIdle;

        case kTalkStateRecording:
            return to == kTalkStateFinalizing ||
                   to == kTalkStateIdle;

        case kTalkStateFinalizing:
            // 只能回到 Idle，一轮结束
            return to == kTalkStateIdle;

        default:
            return false;
    }
}

int TalkStateMachine::addStateChangeListener(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    int id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(callback));
    ESP_LOGD(TAG, "Added state change listener: %d", id);
    return id;
}

void TalkStateMachine::removeStateChangeListener(int listener_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
                       [listener_id](const auto& pair) {
                           return pair.first == listener_id;
                       }),
        listeners_.end());
}

void TalkStateMachine::reset() {
    TalkState old_state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old_state = current_state_;
        current_state_ = kTalkStateIdle;
    }
    if (old_state != kTalkStateIdle) {
        ESP_LOGI(TAG, "State machine reset from %s", GetTalkStateName(old_state));
        notifyStateChange(old_state, kTalkStateIdle);
    }
}

void TalkStateMachine::notifyStateChange(TalkState old_state, TalkState new_state) {
    std::vector<std::pair<int, StateCallback>> listeners_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_copy = listeners_;
    }
    for (const auto& [id, callback] : listeners_copy) {
        if (callback) {
            callback(old_state, new_state);
        }
    }
}
