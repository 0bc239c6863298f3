#include "audio_pipeline.h"

#include "esp_log.h"
#include "pcm_codec.h"
#include "seam_err.h"

#include <vector>

static const char *TAG = "AudioPipeline";

static constexpr TickType_t READ_TIMEOUT = pdMS_TO_TICKS(100);
static constexpr TickType_t EXIT_TIMEOUT = pdMS_TO_TICKS(500);

AudioPipeline &AudioPipeline::instance() {
  static AudioPipeline instance;
  return instance;
}

esp_err_t AudioPipeline::init(const AudioPipelineConfig &config) {
  if (m_initialized) {
    return ESP_OK;
  }

  m_config = config;

  PcmFormat fmt;
  fmt.sample_rate_hz = config.native_sample_rate_hz;
  fmt.channels = 1;
  fmt.bits_per_sample = config.bits_per_sample;
  esp_err_t ret = m_resampler.configure(fmt, 16000);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "Resampler config failed: %s", esp_err_to_name(ret));
    return ret;
  }

  m_exitSem = xSemaphoreCreateBinary();
  if (m_exitSem == nullptr) {
    return ESP_ERR_NO_MEM;
  }

  m_initialized = true;
  ESP_LOGI(TAG, "初始化完成 (BCK:%d, WS:%d, DIN:%d, %d Hz)", config.bck_io,
           config.ws_io, config.din_io, config.native_sample_rate_hz);
  return ESP_OK;
}

esp_err_t AudioPipeline::openChannel() {
  i2s_chan_config_t chanCfg =
      I2S_CHANNEL_DEFAULT_CONFIG((i2s_port_t)m_config.port, I2S_ROLE_MASTER);
  chanCfg.auto_clear = true;

  esp_err_t ret = i2s_new_channel(&chanCfg, nullptr, &m_rxHandle);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "i2s_new_channel failed: %s", esp_err_to_name(ret));
    m_rxHandle = nullptr;
    return ret;
  }

  i2s_data_bit_width_t width = m_config.bits_per_sample == 32
                                   ? I2S_DATA_BIT_WIDTH_32BIT
                                   : I2S_DATA_BIT_WIDTH_16BIT;
  i2s_std_slot_config_t slotCfg =
      I2S_STD_PHILIPS_SLOT_DEFAULT_CONFIG(width, I2S_SLOT_MODE_MONO);
  slotCfg.slot_mask = I2S_STD_SLOT_LEFT; // L/R 接 GND

  i2s_std_config_t stdCfg = {
      .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(
          (uint32_t)m_config.native_sample_rate_hz),
      .slot_cfg = slotCfg,
      .gpio_cfg =
          {
              .mclk = I2S_GPIO_UNUSED,
              .bclk = (gpio_num_t)m_config.bck_io,
              .ws = (gpio_num_t)m_config.ws_io,
              .dout = I2S_GPIO_UNUSED,
              .din = (gpio_num_t)m_config.din_io,
              .invert_flags =
                  {
                      .mclk_inv = false,
                      .bclk_inv = false,
                      .ws_inv = false,
                  },
          },
  };

  ret = i2s_channel_init_std_mode(m_rxHandle, &stdCfg);
  if (ret == ESP_OK) {
    ret = i2s_channel_enable(m_rxHandle);
  }
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "I2S 配置失败: %s", esp_err_to_name(ret));
    closeChannel();
    return ret;
  }
  return ESP_OK;
}

void AudioPipeline::closeChannel() {
  if (m_rxHandle == nullptr) {
    return;
  }
  // 未 enable 的通道 disable 会返回 INVALID_STATE，忽略
  esp_err_t ret = i2s_channel_disable(m_rxHandle);
  if (ret != ESP_OK && ret != ESP_ERR_INVALID_STATE) {
    ESP_LOGW(TAG, "i2s_channel_disable: %s", esp_err_to_name(ret));
  }
  i2s_del_channel(m_rxHandle);
  m_rxHandle = nullptr;
}

esp_err_t AudioPipeline::start() {
  if (!m_initialized) {
    ESP_LOGE(TAG, "未初始化");
    return SEAM_ERR_DEVICE_UNAVAILABLE;
  }
  if (m_running) {
    ESP_LOGW(TAG, "已在采集中");
    return ESP_OK;
  }

  if (openChannel() != ESP_OK) {
    return SEAM_ERR_DEVICE_UNAVAILABLE;
  }

  m_resampler.reset();
  xSemaphoreTake(m_exitSem, 0);
  m_running = true;

  BaseType_t ret = xTaskCreatePinnedToCore(
      captureTask, "audio_capture", m_config.task_stack, this,
      m_config.task_priority, &m_taskHandle, m_config.task_core);
  if (ret != pdPASS) {
    ESP_LOGE(TAG, "采集任务创建失败");
    m_running = false;
    m_taskHandle = nullptr;
    closeChannel();
    return SEAM_ERR_DEVICE_UNAVAILABLE;
  }

  ESP_LOGI(TAG, "🎙️ 开始采集");
  return ESP_OK;
}

void AudioPipeline::stop() {
  if (m_taskHandle != nullptr) {
    m_running = false;
    if (xSemaphoreTake(m_exitSem, EXIT_TIMEOUT) != pdTRUE) {
      ESP_LOGW(TAG, "采集任务退出超时");
    }
    m_taskHandle = nullptr;
  }
  m_running = false;
  closeChannel();
}

void AudioPipeline::captureTask(void *arg) {
  auto *self = static_cast<AudioPipeline *>(arg);

  const size_t frames = self->m_config.window_frames;
  const size_t bytesPerFrame = self->m_config.bits_per_sample / 8;
  std::vector<uint8_t> raw(frames * bytesPerFrame);
  std::vector<int16_t> pcm(self->m_resampler.outputCapacity(frames));
  std::string payload;

  uint32_t emitted = 0;

  while (self->m_running) {
    size_t bytesRead = 0;
    esp_err_t ret = i2s_channel_read(self->m_rxHandle, raw.data(), raw.size(),
                                     &bytesRead, READ_TIMEOUT);
    if (ret == ESP_ERR_TIMEOUT) {
      continue;
    }
    if (ret != ESP_OK) {
      ESP_LOGW(TAG, "I2S 读取失败: %s", esp_err_to_name(ret));
      continue;
    }

    size_t got = bytesRead / bytesPerFrame;
    size_t n = self->m_resampler.process(raw.data(), got, pcm.data(), pcm.size());
    if (n == 0) {
      continue;
    }

    if (EncodePcmBase64(pcm.data(), n, payload) != ESP_OK) {
      continue;
    }
    if (self->m_frameCallback) {
      self->m_frameCallback(std::move(payload));
    }
    payload.clear();
    emitted++;
  }

  ESP_LOGI(TAG, "采集任务退出, frames=%lu", (unsigned long)emitted);
  xSemaphoreGive(self->m_exitSem);
  vTaskDelete(nullptr);
}
