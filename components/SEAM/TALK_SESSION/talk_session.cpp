#include "talk_session.h"

#include "esp_log.h"
#include "seam_err.h"

static const char *TAG = "TalkSession";

TalkSession::TalkSession(AudioSource &audio, SessionLink &link,
                         FinalizeTimer &timer, const TalkSessionConfig &config)
    : m_audio(audio), m_link(link), m_timer(timer), m_config(config),
      m_turns(config.max_turns) {}

esp_err_t TalkSession::setConfig(const TalkSessionConfig &config) {
  if (m_sm.getState() != kTalkStateIdle) {
    ESP_LOGW(TAG, "Config change rejected while %s",
             GetTalkStateName(m_sm.getState()));
    return ESP_ERR_INVALID_STATE;
  }
  m_config = config;
  ESP_LOGI(TAG, "Config: mode=%s, A=%s, B=%s",
           GetSessionModeName(config.mode), config.side_a_lang.c_str(),
           config.side_b_lang.c_str());
  return ESP_OK;
}

void TalkSession::setOnStateChanged(StateCallback cb) {
  m_sm.addStateChangeListener(std::move(cb));
}

uint32_t TalkSession::activeTurnId() {
  Turn *turn = m_turns.active();
  return turn ? turn->id : 0;
}

// ==================== 按键 ====================

esp_err_t TalkSession::pressDown(Side side) {
  TalkState state = m_sm.getState();
  if (state != kTalkStateIdle) {
    ESP_LOGI(TAG, "Press ignored, turn busy (%s)", GetTalkStateName(state));
    return ESP_ERR_INVALID_STATE;
  }

  if (m_config.mode == SessionMode::AutoDetect) {
    side = Side::Undetermined;
  } else if (side == Side::Undetermined) {
    ESP_LOGW(TAG, "fixed_sides mode needs a side");
    return ESP_ERR_INVALID_ARG;
  }

  Turn &turn = m_turns.open(side);
  const uint32_t turnId = turn.id;
  if (side == Side::A) {
    turn.source_lang = m_config.side_a_lang;
    turn.target_lang = m_config.side_b_lang;
  } else if (side == Side::B) {
    turn.source_lang = m_config.side_b_lang;
    turn.target_lang = m_config.side_a_lang;
  }
  m_activeSide = side;
  m_pending.clear();
  m_droppedFrames = 0;
  m_commitPending = false;

  bool openedHere = false;
  if (!m_link.isOpen()) {
    m_configSent = false;
    esp_err_t err = m_link.open();
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "Relay connect failed: %s", seam_err_to_name(err));
      m_link.close();
      m_turns.discard(turnId);
      return SEAM_ERR_UPSTREAM_TRANSPORT;
    }
    openedHere = true;
  }

  esp_err_t err = m_audio.start();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Audio start failed: %s", seam_err_to_name(err));
    m_audio.stop();
    if (openedHere) {
      m_link.close();
      m_configSent = false;
    }
    m_turns.discard(turnId);
    return SEAM_ERR_DEVICE_UNAVAILABLE;
  }

  if (m_link.isOpen()) {
    sendConfigOnce(side);
    m_sm.transitionTo(kTalkStateRecording);
  } else {
    m_sm.transitionTo(kTalkStateAwaiting);
  }

  ESP_LOGI(TAG, "Turn #%lu started (%s)", (unsigned long)turnId,
           GetSideName(side));
  return ESP_OK;
}

esp_err_t TalkSession::pressUp() {
  TalkState state = m_sm.getState();
  if (state != kTalkStateRecording && state != kTalkStateAwaiting) {
    return ESP_ERR_INVALID_STATE;
  }

  m_audio.stop();

  if (state == kTalkStateRecording) {
    sendCommit();
  } else {
    m_commitPending = true;
  }

  m_sm.transitionTo(kTalkStateFinalizing);

  uint32_t turnId = activeTurnId();
  m_timer.arm(turnId, m_config.finalize_timeout_ms);
  ESP_LOGI(TAG, "Turn #%lu finalizing (timeout %lu ms)", (unsigned long)turnId,
           (unsigned long)m_config.finalize_timeout_ms);
  return ESP_OK;
}

// ==================== 音频与连接 ====================

void TalkSession::onAudioFrame(std::string &&payload) {
  switch (m_sm.getState()) {
  case kTalkStateRecording:
    m_link.sendText(BuildAudioAppend(payload));
    break;
  case kTalkStateAwaiting:
    m_pending.push_back(std::move(payload));
    if (m_pending.size() > m_config.max_pending_frames) {
      m_pending.pop_front();
      if (m_droppedFrames++ == 0) {
        ESP_LOGW(TAG, "Relay not ready, dropping oldest frames");
      }
    }
    break;
  default:
    break;
  }
}

void TalkSession::onLinkOpened() {
  TalkState state = m_sm.getState();

  if (state == kTalkStateAwaiting) {
    sendConfigOnce(m_activeSide);
    flushPending();
    m_sm.transitionTo(kTalkStateRecording);
    return;
  }

  if (state == kTalkStateFinalizing && m_commitPending) {
    sendConfigOnce(m_activeSide);
    flushPending();
    sendCommit();
    m_commitPending = false;
    return;
  }

  if (state == kTalkStateIdle) {
    // 这一轮已经放弃了
    ESP_LOGD(TAG, "Link opened while idle, closing");
    m_link.close();
  }
}

void TalkSession::onLinkClosed() {
  m_configSent = false;
  if (m_sm.getState() != kTalkStateIdle) {
    abandonTurn("relay connection closed");
  }
}

// ==================== 识别事件 ====================

void TalkSession::onRecognitionEvent(const RecognitionEvent &event) {
  TalkState state = m_sm.getState();

  switch (event.type) {
  case RecognitionEventType::PartialTranscript: {
    if (state == kTalkStateIdle) {
      return;
    }
    if (m_turns.applyPartial(event.text)) {
      notifyUpdated(*m_turns.active());
    }
    return;
  }

  case RecognitionEventType::CompletedTranscript: {
    if (state == kTalkStateIdle) {
      ESP_LOGD(TAG, "Completed transcript while idle, ignored");
      return;
    }

    Direction dir;
    if (m_config.mode == SessionMode::AutoDetect) {
      if (event.routed) {
        dir.side = event.side;
        dir.source_lang = event.source_lang;
        dir.target_lang = event.target_lang;
      } else {
        dir = DecideDirection(m_config.side_a_lang, m_config.side_b_lang,
                              event.language);
      }
    } else {
      dir.side = m_activeSide;
      if (m_activeSide == Side::B) {
        dir.source_lang = m_config.side_b_lang;
        dir.target_lang = m_config.side_a_lang;
      } else {
        dir.source_lang = m_config.side_a_lang;
        dir.target_lang = m_config.side_b_lang;
      }
    }

    Turn &turn = m_turns.claimForCompletion(dir.side);
    turn.side = dir.side;
    turn.source_lang = dir.source_lang;
    turn.target_lang = dir.target_lang;
    turn.final_text = event.text;
    turn.finalized = true;
    turn.translation = event.text.empty() ? TranslationStatus::None
                                          : TranslationStatus::Pending;

    ESP_LOGI(TAG, "Turn #%lu final [%s %s->%s]: %s", (unsigned long)turn.id,
             GetSideName(turn.side), turn.source_lang.c_str(),
             turn.target_lang.c_str(), turn.final_text.c_str());

    notifyUpdated(turn);
    if (m_onTurnFinalized) {
      m_onTurnFinalized(turn);
    }

    if (state == kTalkStateFinalizing) {
      finishTurn();
    }
    return;
  }

  case RecognitionEventType::SessionFinished:
    if (state != kTalkStateIdle) {
      ESP_LOGW(TAG, "Session finished before transcript: %s",
               event.reason.c_str());
      abandonTurn("session finished");
    }
    return;

  case RecognitionEventType::Error:
    ESP_LOGW(TAG, "Relay error: %s %s", event.error_message.c_str(),
             event.error_detail.c_str());
    if (state != kTalkStateIdle) {
      abandonTurn("relay error");
    }
    return;

  default:
    ESP_LOGD(TAG, "Unhandled event: %s", event.type_name.c_str());
    return;
  }
}

void TalkSession::onFinalizeTimeout(uint32_t turnId) {
  if (m_sm.getState() != kTalkStateFinalizing) {
    return;
  }
  if (turnId != activeTurnId()) {
    ESP_LOGD(TAG, "Stale timeout for turn #%lu", (unsigned long)turnId);
    return;
  }
  ESP_LOGW(TAG, "Turn #%lu: %s", (unsigned long)turnId,
           seam_err_to_name(SEAM_ERR_FINALIZE_TIMEOUT));
  abandonTurn("finalize timeout");
}

esp_err_t TalkSession::applyTranslation(uint32_t turnId, esp_err_t err,
                                        const std::string &translated) {
  Turn *turn = m_turns.find(turnId);
  if (turn == nullptr) {
    return ESP_ERR_NOT_FOUND;
  }
  if (turn->translation != TranslationStatus::Pending) {
    return ESP_ERR_INVALID_STATE;
  }

  if (err == ESP_OK) {
    turn->translated_text = translated;
    turn->translation = TranslationStatus::Done;
  } else {
    ESP_LOGW(TAG, "Turn #%lu translation failed: %s", (unsigned long)turnId,
             seam_err_to_name(err));
    turn->translation = TranslationStatus::Failed;
  }
  notifyUpdated(*turn);
  return ESP_OK;
}

// ==================== 内部 ====================

void TalkSession::sendConfigOnce(Side side) {
  if (m_configSent) {
    return;
  }
  SessionConfig cfg;
  cfg.mode = m_config.mode;
  cfg.side_a_lang = m_config.side_a_lang;
  cfg.side_b_lang = m_config.side_b_lang;
  cfg.model = m_config.model;
  if (m_config.mode == SessionMode::FixedSides) {
    cfg.language_hint =
        side == Side::B ? m_config.side_b_lang : m_config.side_a_lang;
  }
  m_link.sendText(BuildSessionUpdate(cfg));
  m_configSent = true;
}

void TalkSession::flushPending() {
  while (!m_pending.empty()) {
    m_link.sendText(BuildAudioAppend(m_pending.front()));
    m_pending.pop_front();
  }
}

void TalkSession::sendCommit() {
  m_link.sendText(BuildAudioCommit());
  m_link.sendText(BuildSessionFinish());
}

void TalkSession::finishTurn() {
  m_timer.cancel();
  m_turns.clearActive();
  m_activeSide = Side::Undetermined;
  m_sm.transitionTo(kTalkStateIdle);
  // 连接不跨轮复用
  m_link.close();
  m_configSent = false;
}

void TalkSession::abandonTurn(const char *reason) {
  TalkState state = m_sm.getState();
  m_timer.cancel();
  if (state == kTalkStateRecording || state == kTalkStateAwaiting) {
    m_audio.stop();
  }
  m_pending.clear();
  m_commitPending = false;

  Turn *turn = m_turns.active();
  if (turn != nullptr && !turn->finalized) {
    ESP_LOGW(TAG, "Turn #%lu abandoned: %s", (unsigned long)turn->id, reason);
    m_turns.discard(turn->id);
  } else {
    m_turns.clearActive();
  }
  m_activeSide = Side::Undetermined;

  m_link.close();
  m_configSent = false;
  m_sm.transitionTo(kTalkStateIdle);
}

void TalkSession::notifyUpdated(const Turn &turn) {
  if (m_onTurnUpdated) {
    m_onTurnUpdated(turn);
  }
}
