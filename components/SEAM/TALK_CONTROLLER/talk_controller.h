#pragma once

#include "esp_err.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"
#include "talk_session.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

struct TalkControllerConfig {
  TalkSessionConfig session;
  UBaseType_t queue_length = 48;
  uint32_t task_stack = 6144;
  UBaseType_t task_priority = 5;
  BaseType_t task_core = 1;
  bool speak_translation = true; ///< 翻译完成后播放译文
};

/**
 * @brief 会话执行器
 *
 * 一个 FreeRTOS 任务 + 一个队列，TalkSession 只在这个任务里被调用。
 * 按键任务、采集任务、websocket 任务、esp_timer、翻译任务都只往队列里投递。
 *
 * @example
 *   auto& ctl = TalkController::instance();
 *   ctl.init({.session = {.mode = SessionMode::FixedSides}});
 *   ctl.start();
 *   ctl.pressDown(Side::A);
 */
class TalkController {
public:
  static TalkController &instance();

  TalkController(const TalkController &) = delete;
  TalkController &operator=(const TalkController &) = delete;
  TalkController(TalkController &&) = delete;
  TalkController &operator=(TalkController &&) = delete;

  /**
   * @brief 需要 AudioPipeline、RelayLink 已 init
   */
  esp_err_t init(const TalkControllerConfig &config);
  esp_err_t start();

  // 以下可在任意任务调用
  void pressDown(Side side);
  void pressUp();

  TalkState state() const { return m_state.load(); }

  /// 在执行器任务中回调
  void setOnTurnUpdated(TalkSession::TurnCallback cb) { m_onTurnUpdated = cb; }

private:
  TalkController() = default;
  ~TalkController() = default;

  enum class Cmd : uint8_t {
    PressDown,
    PressUp,
    AudioFrame,
    LinkOpened,
    LinkClosed,
    LinkEvent,
    FinalizeTimeout,
    TranslationDone,
  };

  // 队列里按值拷贝，指针成员由接收方释放
  struct Message {
    Cmd cmd;
    Side side;
    uint32_t arg;
    esp_err_t err;
    std::string *text;
    RecognitionEvent *event;
  };

  struct TranslateJob {
    uint32_t turn_id;
    std::string *text;
    std::string *source_lang;
    std::string *target_lang;
  };

  class MicSource : public AudioSource {
  public:
    esp_err_t start() override;
    void stop() override;
  };

  class LinkPort : public SessionLink {
  public:
    esp_err_t open() override;
    bool isOpen() const override;
    esp_err_t sendText(const std::string &text) override;
    void close() override;
  };

  class EspFinalizeTimer : public FinalizeTimer {
  public:
    esp_err_t init();
    void arm(uint32_t turnId, uint32_t timeoutMs) override;
    void cancel() override;

  private:
    static void onExpired(void *arg);
    esp_timer_handle_t m_timer = nullptr;
    std::atomic<uint32_t> m_turnId{0};
  };

  bool post(const Message &msg, TickType_t timeout);
  void dispatch(Message &msg);
  void requestTranslation(const Turn &turn);

  static void actorTask(void *arg);
  static void translateTask(void *arg);

  TalkControllerConfig m_config;
  bool m_initialized = false;

  MicSource m_mic;
  LinkPort m_link;
  EspFinalizeTimer m_timer;
  std::unique_ptr<TalkSession> m_session;

  QueueHandle_t m_queue = nullptr;
  QueueHandle_t m_translateQueue = nullptr;
  TaskHandle_t m_task = nullptr;
  TaskHandle_t m_translateTask = nullptr;

  std::atomic<TalkState> m_state{kTalkStateIdle};
  TalkSession::TurnCallback m_onTurnUpdated;
};
