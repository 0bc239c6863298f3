#include "voice_player.h"

#include "esp_log.h"
#include "freertos/FreeRTOS.h"

#include <cstdio>
#include <cstdlib>

static const char *TAG = "VoicePlayer";

// audio_player 的回调都是 C 函数指针
static i2s_chan_handle_t s_tx = nullptr;
static uint32_t s_bits = 16;
static int32_t s_gainQ8 = 256; // 音量，Q8 定点

VoicePlayer &VoicePlayer::instance() {
  static VoicePlayer instance;
  return instance;
}

esp_err_t VoicePlayer::writeScaled(void *buf, size_t len, size_t *written,
                                   uint32_t timeout_ms) {
  if (s_tx == nullptr) {
    return ESP_ERR_INVALID_STATE;
  }
  // 解码器输出 16 位时就地缩放，其他位宽原样输出
  if (s_bits == 16 && s_gainQ8 != 256) {
    auto *pcm = static_cast<int16_t *>(buf);
    for (size_t i = 0; i < len / sizeof(int16_t); i++) {
      pcm[i] = (int16_t)(((int32_t)pcm[i] * s_gainQ8) >> 8);
    }
  }
  return i2s_channel_write(s_tx, buf, len, written, pdMS_TO_TICKS(timeout_ms));
}

esp_err_t VoicePlayer::reclock(uint32_t rate, uint32_t bits,
                               i2s_slot_mode_t ch) {
  if (s_tx == nullptr) {
    return ESP_ERR_INVALID_STATE;
  }
  i2s_std_clk_config_t clk = I2S_STD_CLK_DEFAULT_CONFIG(rate);
  i2s_std_slot_config_t slot = I2S_STD_MSB_SLOT_DEFAULT_CONFIG(
      static_cast<i2s_data_bit_width_t>(bits), ch);

  i2s_channel_disable(s_tx);
  esp_err_t err = i2s_channel_reconfig_std_clock(s_tx, &clk);
  if (err == ESP_OK) {
    err = i2s_channel_reconfig_std_slot(s_tx, &slot);
  }
  // 失败也要重新使能，否则下一段也放不出来
  esp_err_t enableErr = i2s_channel_enable(s_tx);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "reclock %lu Hz/%lu bit failed: %s", (unsigned long)rate,
             (unsigned long)bits, esp_err_to_name(err));
    return err;
  }
  s_bits = bits;
  return enableErr;
}

esp_err_t VoicePlayer::openTx(const VoicePlayerConfig &config) {
  i2s_chan_config_t chan =
      I2S_CHANNEL_DEFAULT_CONFIG((i2s_port_t)config.port, I2S_ROLE_MASTER);
  chan.auto_clear = true; // underflow 时输出静音
  esp_err_t err = i2s_new_channel(&chan, &s_tx, nullptr);
  if (err != ESP_OK) {
    return err;
  }

  i2s_std_config_t std = {};
  std.clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(16000);
  std.slot_cfg = I2S_STD_MSB_SLOT_DEFAULT_CONFIG(I2S_DATA_BIT_WIDTH_16BIT,
                                                 I2S_SLOT_MODE_MONO);
  std.gpio_cfg.mclk = I2S_GPIO_UNUSED;
  std.gpio_cfg.bclk = config.bck_io;
  std.gpio_cfg.ws = config.ws_io;
  std.gpio_cfg.dout = config.dout_io;
  std.gpio_cfg.din = I2S_GPIO_UNUSED;

  err = i2s_channel_init_std_mode(s_tx, &std);
  if (err == ESP_OK) {
    err = i2s_channel_enable(s_tx);
  }
  if (err != ESP_OK) {
    i2s_del_channel(s_tx);
    s_tx = nullptr;
  }
  return err;
}

esp_err_t VoicePlayer::init(const VoicePlayerConfig &config) {
  if (m_initialized) {
    return ESP_OK;
  }
  if (config.dout_io == GPIO_NUM_NC) {
    return ESP_ERR_INVALID_ARG;
  }

  m_config = config;
  int volume = config.volume_percent < 0     ? 0
               : config.volume_percent > 100 ? 100
                                             : config.volume_percent;
  s_gainQ8 = volume * 256 / 100;

  esp_err_t err = openTx(config);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "I2S%d open failed: %s", config.port, esp_err_to_name(err));
    return err;
  }

  audio_player_config_t cfg = {};
  cfg.mute_fn = [](AUDIO_PLAYER_MUTE_SETTING) { return ESP_OK; };
  cfg.clk_set_fn = reclock;
  cfg.write_fn = writeScaled;
  cfg.priority = 5;
  cfg.coreID = 1;
  err = audio_player_new(cfg);
  if (err == ESP_OK) {
    err = audio_player_callback_register(
        [](audio_player_cb_ctx_t *ctx) {
          VoicePlayer::instance().onPlayerEvent(ctx->audio_event);
        },
        nullptr);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "audio_player setup failed: %s", esp_err_to_name(err));
    return err;
  }

  m_initialized = true;
  ESP_LOGI(TAG, "播放器就绪 (I2S%d BCK:%d WS:%d DOUT:%d, 音量 %d%%)",
           config.port, config.bck_io, config.ws_io, config.dout_io, volume);
  return ESP_OK;
}

size_t VoicePlayer::queued() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

esp_err_t VoicePlayer::enqueue(uint8_t *data, size_t len) {
  if (!m_initialized) {
    free(data);
    return ESP_ERR_INVALID_STATE;
  }
  if (data == nullptr || len == 0) {
    free(data);
    return ESP_ERR_INVALID_ARG;
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current.data != nullptr) {
      m_queue.push_back({data, len});
      while (m_queue.size() > m_config.max_queued) {
        ESP_LOGW(TAG, "queue full, dropping oldest clip");
        free(m_queue.front().data);
        m_queue.pop_front();
      }
      return ESP_OK;
    }
    m_current = {data, len};
  }

  esp_err_t err = startClip(m_current);
  if (err != ESP_OK) {
    playNext();
  }
  return err;
}

esp_err_t VoicePlayer::startClip(const Clip &clip) {
  FILE *fp = fmemopen(clip.data, clip.len, "rb");
  if (fp == nullptr) {
    ESP_LOGE(TAG, "fmemopen failed");
    return ESP_FAIL;
  }
  esp_err_t err = audio_player_play(fp);
  if (err != ESP_OK) {
    // play 失败时 fp 仍归调用方
    fclose(fp);
    ESP_LOGE(TAG, "play failed: %s", esp_err_to_name(err));
    return err;
  }
  ESP_LOGI(TAG, "播放译文 (%u bytes)", (unsigned)clip.len);
  return ESP_OK;
}

void VoicePlayer::playNext() {
  while (true) {
    Clip next = {nullptr, 0};
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      free(m_current.data);
      m_current = {nullptr, 0};
      if (m_queue.empty()) {
        return;
      }
      next = m_queue.front();
      m_queue.pop_front();
      m_current = next;
    }
    if (startClip(next) == ESP_OK) {
      return;
    }
  }
}

void VoicePlayer::onPlayerEvent(audio_player_callback_event_t event) {
  switch (event) {
  case AUDIO_PLAYER_CALLBACK_EVENT_PLAYING:
  case AUDIO_PLAYER_CALLBACK_EVENT_COMPLETED_PLAYING_NEXT:
    m_state = VoicePlayerState::Playing;
    break;

  case AUDIO_PLAYER_CALLBACK_EVENT_IDLE:
    // 上一段已放完（或被停止），fp 已由 audio_player 关闭
    m_state = VoicePlayerState::Idle;
    playNext();
    break;

  default:
    return;
  }

  if (m_callback) {
    m_callback(m_state);
  }
}

void VoicePlayer::stopAll() {
  if (!m_initialized) {
    return;
  }
  bool playing = false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const Clip &clip : m_queue) {
      free(clip.data);
    }
    m_queue.clear();
    playing = m_current.data != nullptr;
  }
  if (!playing) {
    return;
  }
  // IDLE 回调里释放当前这段
  esp_err_t err = audio_player_stop();
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "stop failed: %s", esp_err_to_name(err));
  }
}
