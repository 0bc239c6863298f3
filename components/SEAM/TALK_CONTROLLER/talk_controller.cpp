#include "talk_controller.h"

#include "audio_pipeline.h"
#include "cloud_translate.h"
#include "cloud_tts.h"
#include "esp_log.h"
#include "relay_link.h"
#include "seam_err.h"

static const char *TAG = "TalkController";

static constexpr TickType_t POST_TIMEOUT = pdMS_TO_TICKS(50);
static constexpr UBaseType_t TRANSLATE_QUEUE_LENGTH = 8;

TalkController &TalkController::instance() {
  static TalkController instance;
  return instance;
}

// ==================== 端口适配 ====================

esp_err_t TalkController::MicSource::start() {
  return AudioPipeline::instance().start();
}

void TalkController::MicSource::stop() { AudioPipeline::instance().stop(); }

esp_err_t TalkController::LinkPort::open() {
  return RelayLink::instance().open();
}

bool TalkController::LinkPort::isOpen() const {
  return RelayLink::instance().isOpen();
}

esp_err_t TalkController::LinkPort::sendText(const std::string &text) {
  return RelayLink::instance().sendText(text);
}

void TalkController::LinkPort::close() { RelayLink::instance().close(); }

esp_err_t TalkController::EspFinalizeTimer::init() {
  esp_timer_create_args_t args = {};
  args.callback = &EspFinalizeTimer::onExpired;
  args.arg = this;
  args.dispatch_method = ESP_TIMER_TASK;
  args.name = "finalize";
  return esp_timer_create(&args, &m_timer);
}

void TalkController::EspFinalizeTimer::arm(uint32_t turnId,
                                           uint32_t timeoutMs) {
  cancel();
  m_turnId.store(turnId);
  esp_err_t err = esp_timer_start_once(m_timer, (uint64_t)timeoutMs * 1000);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "finalize timer start failed: %s", esp_err_to_name(err));
  }
}

void TalkController::EspFinalizeTimer::cancel() {
  // 未启动时返回 ESP_ERR_INVALID_STATE，忽略
  esp_timer_stop(m_timer);
}

void TalkController::EspFinalizeTimer::onExpired(void *arg) {
  auto *self = static_cast<EspFinalizeTimer *>(arg);
  Message msg = {};
  msg.cmd = Cmd::FinalizeTimeout;
  msg.arg = self->m_turnId.load();
  // 投递失败时下一次按键前状态仍是 Finalizing，用长一点的超时
  if (!TalkController::instance().post(msg, pdMS_TO_TICKS(500))) {
    ESP_LOGE(TAG, "finalize timeout lost");
  }
}

// ==================== 初始化 ====================

esp_err_t TalkController::init(const TalkControllerConfig &config) {
  if (m_initialized) {
    return ESP_OK;
  }
  m_config = config;

  esp_err_t err = m_timer.init();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(err));
    return err;
  }

  m_queue = xQueueCreate(config.queue_length, sizeof(Message));
  m_translateQueue = xQueueCreate(TRANSLATE_QUEUE_LENGTH, sizeof(TranslateJob));
  if (!m_queue || !m_translateQueue) {
    return ESP_ERR_NO_MEM;
  }

  m_session.reset(new TalkSession(m_mic, m_link, m_timer, config.session));
  m_session->setOnStateChanged([this](TalkState, TalkState now) {
    m_state.store(now);
  });
  m_session->setOnTurnUpdated([this](const Turn &turn) {
    if (m_onTurnUpdated) {
      m_onTurnUpdated(turn);
    }
  });
  m_session->setOnTurnFinalized(
      [this](const Turn &turn) { requestTranslation(turn); });

  // 采集任务：不阻塞，满了就丢
  AudioPipeline::instance().setFrameCallback([this](std::string &&payload) {
    Message msg = {};
    msg.cmd = Cmd::AudioFrame;
    msg.text = new std::string(std::move(payload));
    if (!post(msg, 0)) {
      delete msg.text;
    }
  });

  auto &link = RelayLink::instance();
  link.setOnOpened([this](uint32_t gen) {
    Message msg = {};
    msg.cmd = Cmd::LinkOpened;
    msg.arg = gen;
    post(msg, POST_TIMEOUT);
  });
  link.setOnClosed([this](uint32_t gen) {
    Message msg = {};
    msg.cmd = Cmd::LinkClosed;
    msg.arg = gen;
    post(msg, POST_TIMEOUT);
  });
  link.setOnEvent([this](uint32_t gen, RecognitionEvent &&event) {
    Message msg = {};
    msg.cmd = Cmd::LinkEvent;
    msg.arg = gen;
    msg.event = new RecognitionEvent(std::move(event));
    if (!post(msg, POST_TIMEOUT)) {
      ESP_LOGW(TAG, "queue full, relay event dropped");
      delete msg.event;
    }
  });

  m_initialized = true;
  ESP_LOGI(TAG, "初始化完成, mode=%s, A=%s, B=%s",
           GetSessionModeName(config.session.mode),
           config.session.side_a_lang.c_str(),
           config.session.side_b_lang.c_str());
  return ESP_OK;
}

esp_err_t TalkController::start() {
  if (!m_initialized) {
    return ESP_ERR_INVALID_STATE;
  }
  if (m_task) {
    return ESP_OK;
  }

  BaseType_t ret = xTaskCreatePinnedToCore(
      actorTask, "talk_ctl", m_config.task_stack, this, m_config.task_priority,
      &m_task, m_config.task_core);
  if (ret != pdPASS) {
    ESP_LOGE(TAG, "会话任务创建失败");
    m_task = nullptr;
    return ESP_FAIL;
  }

  ret = xTaskCreatePinnedToCore(translateTask, "translate", 8192, this, 4,
                                &m_translateTask, m_config.task_core);
  if (ret != pdPASS) {
    ESP_LOGE(TAG, "翻译任务创建失败");
    m_translateTask = nullptr;
    return ESP_FAIL;
  }
  return ESP_OK;
}

// ==================== 投递 ====================

bool TalkController::post(const Message &msg, TickType_t timeout) {
  if (!m_queue) {
    return false;
  }
  return xQueueSend(m_queue, &msg, timeout) == pdTRUE;
}

void TalkController::pressDown(Side side) {
  Message msg = {};
  msg.cmd = Cmd::PressDown;
  msg.side = side;
  post(msg, POST_TIMEOUT);
}

void TalkController::pressUp() {
  Message msg = {};
  msg.cmd = Cmd::PressUp;
  // 松开不能丢，否则一直在录音
  post(msg, portMAX_DELAY);
}

// ==================== 执行器 ====================

void TalkController::actorTask(void *arg) {
  auto *self = static_cast<TalkController *>(arg);
  ESP_LOGI(TAG, "会话任务已启动");

  Message msg;
  while (true) {
    if (xQueueReceive(self->m_queue, &msg, portMAX_DELAY) == pdTRUE) {
      self->dispatch(msg);
    }
  }
}

void TalkController::dispatch(Message &msg) {
  TalkSession &session = *m_session;
  const uint32_t linkGen = RelayLink::instance().generation();

  switch (msg.cmd) {
  case Cmd::PressDown: {
    esp_err_t err = session.pressDown(msg.side);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
      ESP_LOGW(TAG, "press rejected: %s", seam_err_to_name(err));
    }
    break;
  }

  case Cmd::PressUp:
    session.pressUp();
    break;

  case Cmd::AudioFrame:
    session.onAudioFrame(std::move(*msg.text));
    delete msg.text;
    break;

  case Cmd::LinkOpened:
    if (msg.arg == linkGen) {
      session.onLinkOpened();
    }
    break;

  case Cmd::LinkClosed:
    if (msg.arg == linkGen) {
      session.onLinkClosed();
    }
    break;

  case Cmd::LinkEvent:
    if (msg.arg == linkGen) {
      session.onRecognitionEvent(*msg.event);
    } else {
      ESP_LOGD(TAG, "stale event from gen %lu", (unsigned long)msg.arg);
    }
    delete msg.event;
    break;

  case Cmd::FinalizeTimeout:
    session.onFinalizeTimeout(msg.arg);
    break;

  case Cmd::TranslationDone:
    session.applyTranslation(msg.arg, msg.err, msg.text ? *msg.text : "");
    delete msg.text;
    break;
  }
}

// ==================== 翻译 ====================

void TalkController::requestTranslation(const Turn &turn) {
  if (turn.final_text.empty()) {
    return;
  }

  TranslateJob job = {};
  job.turn_id = turn.id;
  job.text = new std::string(turn.final_text);
  job.source_lang = new std::string(turn.source_lang);
  job.target_lang = new std::string(turn.target_lang);

  if (xQueueSend(m_translateQueue, &job, 0) != pdTRUE) {
    ESP_LOGW(TAG, "translate queue full, turn #%lu", (unsigned long)turn.id);
    delete job.text;
    delete job.source_lang;
    delete job.target_lang;
    Message msg = {};
    msg.cmd = Cmd::TranslationDone;
    msg.arg = turn.id;
    msg.err = SEAM_ERR_TRANSLATION_FAILED;
    post(msg, 0);
  }
}

void TalkController::translateTask(void *arg) {
  auto *self = static_cast<TalkController *>(arg);
  auto &translator = CloudTranslate::instance();
  auto &tts = CloudTts::instance();

  TranslateJob job;
  while (true) {
    if (xQueueReceive(self->m_translateQueue, &job, portMAX_DELAY) != pdTRUE) {
      continue;
    }

    std::string translated;
    esp_err_t err = translator.translate(*job.text, *job.source_lang,
                                         *job.target_lang, translated);

    Message msg = {};
    msg.cmd = Cmd::TranslationDone;
    msg.arg = job.turn_id;
    msg.err = err;
    msg.text = new std::string(translated);
    if (!self->post(msg, pdMS_TO_TICKS(1000))) {
      delete msg.text;
    }

    if (err == ESP_OK && self->m_config.speak_translation &&
        tts.isConfigured()) {
      esp_err_t ttsErr = tts.speak(translated, *job.target_lang);
      if (ttsErr != ESP_OK) {
        ESP_LOGW(TAG, "turn #%lu: %s", (unsigned long)job.turn_id,
                 seam_err_to_name(ttsErr));
      }
    }

    delete job.text;
    delete job.source_lang;
    delete job.target_lang;
  }
}
