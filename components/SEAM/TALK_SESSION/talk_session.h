#pragma once

#include "esp_err.h"
#include "session_protocol.h"
#include "talk_state_machine.h"
#include "turn_book.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <string>

/**
 * @brief 麦克风采集
 */
class AudioSource {
public:
  virtual ~AudioSource() = default;
  /// @return ESP_OK 或 SEAM_ERR_DEVICE_UNAVAILABLE
  virtual esp_err_t start() = 0;
  /// 部分启动失败后调用也必须安全
  virtual void stop() = 0;
};

/**
 * @brief 到中继的连接
 *
 * open() 只发起连接，连上后由外部调用 TalkSession::onLinkOpened()。
 */
class SessionLink {
public:
  virtual ~SessionLink() = default;
  virtual esp_err_t open() = 0;
  virtual bool isOpen() const = 0;
  virtual esp_err_t sendText(const std::string &text) = 0;
  virtual void close() = 0;
};

/**
 * @brief 单次定时器，到期后由外部调用 TalkSession::onFinalizeTimeout(turnId)
 */
class FinalizeTimer {
public:
  virtual ~FinalizeTimer() = default;
  virtual void arm(uint32_t turnId, uint32_t timeoutMs) = 0;
  virtual void cancel() = 0;
};

struct TalkSessionConfig {
  SessionMode mode = SessionMode::FixedSides;
  std::string side_a_lang = "zh";
  std::string side_b_lang = "en";
  std::string model;
  uint32_t finalize_timeout_ms = 3000;
  size_t max_pending_frames = 64; ///< Awaiting 期间最多缓存的音频帧
  size_t max_turns = 32;
};

/**
 * @brief 客户端会话：按键事件 -> 协议消息，管理当前发言
 *
 * 非线程安全。所有入口（按键、音频帧、连接事件、识别事件、超时、
 * 翻译结果）必须在同一个任务里调用，见 TalkController。
 *
 * 一轮的流程：
 *   pressDown -> (Awaiting) -> Recording -> pressUp -> Finalizing
 *   -> completed 或超时 -> Idle
 */
class TalkSession {
public:
  using TurnCallback = std::function<void(const Turn &)>;
  using StateCallback = TalkStateMachine::StateCallback;

  TalkSession(AudioSource &audio, SessionLink &link, FinalizeTimer &timer,
              const TalkSessionConfig &config = TalkSessionConfig{});

  TalkSession(const TalkSession &) = delete;
  TalkSession &operator=(const TalkSession &) = delete;

  /**
   * @brief 修改配置，只能在 Idle 时调用
   */
  esp_err_t setConfig(const TalkSessionConfig &config);
  const TalkSessionConfig &config() const { return m_config; }

  void setOnStateChanged(StateCallback cb);
  void setOnTurnUpdated(TurnCallback cb) { m_onTurnUpdated = cb; }
  /// 最终文本已写入，外部据此发起翻译
  void setOnTurnFinalized(TurnCallback cb) { m_onTurnFinalized = cb; }

  /**
   * @brief 按下
   *
   * @param side 按下的是哪一方的按钮；自动识别模式下忽略
   * @return ESP_OK 开始新一轮；ESP_ERR_INVALID_STATE 已有一轮未结束（忽略）；
   *         ESP_ERR_INVALID_ARG 双按钮模式下未指明一方；
   *         SEAM_ERR_DEVICE_UNAVAILABLE 麦克风打不开，保持 Idle；
   *         SEAM_ERR_UPSTREAM_TRANSPORT 连接发起失败，保持 Idle
   */
  esp_err_t pressDown(Side side);

  /**
   * @brief 松开
   * @return ESP_ERR_INVALID_STATE 没有在录音
   */
  esp_err_t pressUp();

  void onAudioFrame(std::string &&payload);
  void onLinkOpened();
  void onLinkClosed();
  void onRecognitionEvent(const RecognitionEvent &event);
  void onFinalizeTimeout(uint32_t turnId);

  /**
   * @brief 写入翻译结果
   * @param err ESP_OK 成功，否则标记翻译失败
   */
  esp_err_t applyTranslation(uint32_t turnId, esp_err_t err,
                             const std::string &translated);

  TalkState state() const { return m_sm.getState(); }
  const TurnBook &turns() const { return m_turns; }
  /// 当前发言 id，没有时为 0
  uint32_t activeTurnId();
  size_t pendingFrames() const { return m_pending.size(); }

private:
  void sendConfigOnce(Side side);
  void flushPending();
  void sendCommit();
  void finishTurn();
  void abandonTurn(const char *reason);
  void notifyUpdated(const Turn &turn);

  AudioSource &m_audio;
  SessionLink &m_link;
  FinalizeTimer &m_timer;
  TalkSessionConfig m_config;

  TalkStateMachine m_sm;
  TurnBook m_turns;

  Side m_activeSide = Side::Undetermined;
  bool m_configSent = false;
  bool m_commitPending = false; // Awaiting 时松开，连上后补发 commit
  std::deque<std::string> m_pending;
  uint32_t m_droppedFrames = 0;

  TurnCallback m_onTurnUpdated;
  TurnCallback m_onTurnFinalized;
};
