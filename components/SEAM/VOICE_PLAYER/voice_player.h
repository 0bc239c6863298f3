#pragma once

#include "driver/gpio.h"
#include "audio_player.h"
#include "driver/i2s_std.h"
#include "esp_err.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>

enum class VoicePlayerState {
  Idle = 0,
  Playing,
};

/**
 * @brief 功放 I2S 引脚与播放参数
 */
struct VoicePlayerConfig {
  gpio_num_t bck_io = GPIO_NUM_NC;
  gpio_num_t ws_io = GPIO_NUM_NC;
  gpio_num_t dout_io = GPIO_NUM_NC;
  int port = 1;              ///< 麦克风占用 I2S0
  int volume_percent = 80;   ///< 软件音量，MAX98357 没有音量控制
  size_t max_queued = 3;     ///< 排队中的译文条数上限，超出丢最旧的
};

/**
 * @brief 译文语音播放器（单例）
 *
 * 基于 esp-audio-player 播放合成服务返回的 WAV/MP3。连续几轮的译文
 * 按到达顺序排队播放，不互相打断。
 */
class VoicePlayer {
public:
  using StateCallback = std::function<void(VoicePlayerState state)>;

  static VoicePlayer &instance();

  VoicePlayer(const VoicePlayer &) = delete;
  VoicePlayer &operator=(const VoicePlayer &) = delete;
  VoicePlayer(VoicePlayer &&) = delete;
  VoicePlayer &operator=(VoicePlayer &&) = delete;

  esp_err_t init(const VoicePlayerConfig &config);

  /**
   * @brief 排队播放一段音频（WAV/MP3）
   *
   * @note data 由 malloc 分配；无论返回什么，所有权都归播放器。
   */
  esp_err_t enqueue(uint8_t *data, size_t len);

  /// 停止当前播放并清空队列
  void stopAll();

  VoicePlayerState getState() const { return m_state; }
  size_t queued() const;

  void setCallback(StateCallback callback) { m_callback = callback; }

private:
  VoicePlayer() = default;
  ~VoicePlayer() = default;

  struct Clip {
    uint8_t *data;
    size_t len;
  };

  esp_err_t openTx(const VoicePlayerConfig &config);
  esp_err_t startClip(const Clip &clip);
  void onPlayerEvent(audio_player_callback_event_t event);
  void playNext();

  static esp_err_t writeScaled(void *buf, size_t len, size_t *written,
                               uint32_t timeout_ms);
  static esp_err_t reclock(uint32_t rate, uint32_t bits, i2s_slot_mode_t ch);

  VoicePlayerConfig m_config;
  bool m_initialized = false;
  volatile VoicePlayerState m_state = VoicePlayerState::Idle;
  StateCallback m_callback;

  mutable std::mutex m_mutex;
  std::deque<Clip> m_queue;
  Clip m_current = {nullptr, 0};
};
