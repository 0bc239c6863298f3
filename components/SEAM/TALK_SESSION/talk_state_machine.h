#ifndef _TALK_STATE_MACHINE_H_
#define _TALK_STATE_MACHINE_H_

#include <functional>
#include <mutex>
#include <vector>

#include "talk_state.h"

/**
 * @brief 会话状态机
 *
 * 只负责校验状态转换并通知监听器，每个 TalkSession 持有一个实例。
 *
 * @example
 *   TalkStateMachine sm;
 *   sm.addStateChangeListener([](TalkState old, TalkState now) {
 *       ESP_LOGI("SM", "%s -> %s", GetTalkStateName(old), GetTalkStateName(now));
 *   });
 *   sm.transitionTo(kTalkStateRecording);
 */
class TalkStateMachine {
public:
    TalkStateMachine() = default;

    TalkStateMachine(const TalkStateMachine&) = delete;
    TalkStateMachine& operator=(const TalkStateMachine&) = delete;

    TalkState getState() const;

    /**
     * @brief 尝试转换到新状态
     * @return true 转换成功（或已在目标状态）, false 转换无效
     */
    bool transitionTo(TalkState new_state);

    bool canTransitionTo(TalkState target) const;

    /**
     * @brief 状态变化回调类型
     * 参数: (旧状态, 新状态)
     */
    using StateCallback = std::function<void(TalkState, TalkState)>;

    int addStateChangeListener(StateCallback callback);
    void removeStateChangeListener(int listener_id);

    /**
     * @brief 无条件回到 Idle，并通知监听器
     */
    void reset();

private:
    TalkState current_state_{kTalkStateIdle};
    std::vector<std::pair<int, StateCallback>> listeners_;
    int next_listener_id_{0};
    mutable std::mutex mutex_;

    bool isValidTransition(TalkState from, TalkState to) const;
    void notifyStateChange(TalkState old_state, TalkState new_state);
};

#endif // _TALK_STATE_MACHINE_H_
