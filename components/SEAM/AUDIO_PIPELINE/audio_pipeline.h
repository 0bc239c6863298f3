#pragma once

#include "driver/i2s_std.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include "pcm_resampler.h"

#include <atomic>
#include <functional>
#include <string>

/**
 * @brief 编码后的音频帧回调
 *
 * 在采集任务中调用，payload 为 16 kHz 单声道 16-bit 小端 PCM 的 base64。
 * 回调内不能阻塞，应把帧投递到自己的队列后立即返回。
 */
using FrameCallback = std::function<void(std::string &&payload)>;

/**
 * @brief I2S 麦克风采集配置
 */
struct AudioPipelineConfig {
  int port = 0;
  int bck_io = 41;
  int ws_io = 42;
  int din_io = 2;
  int native_sample_rate_hz = 48000; ///< 麦克风原生采样率
  int bits_per_sample = 32;          ///< INMP441 等数字麦为 32 位槽
  size_t window_frames = 1024;       ///< 每次读取的帧数
  uint32_t task_stack = 4096;
  UBaseType_t task_priority = 6;
  BaseType_t task_core = 0;
};

/**
 * @brief 麦克风采集 + 重采样 + 编码
 *
 * 单例，ESP32 只接一个麦克风。start() 时才创建 I2S 通道，
 * stop() 时释放，按住说话期间之外不占用设备。
 *
 * @example
 *   auto& mic = AudioPipeline::instance();
 *   mic.init({.bck_io = 41, .ws_io = 42, .din_io = 2});
 *   mic.setFrameCallback([](std::string&& b64) { ... });
 *   mic.start();
 */
class AudioPipeline {
public:
  static AudioPipeline &instance();

  AudioPipeline(const AudioPipeline &) = delete;
  AudioPipeline &operator=(const AudioPipeline &) = delete;
  AudioPipeline(AudioPipeline &&) = delete;
  AudioPipeline &operator=(AudioPipeline &&) = delete;

  esp_err_t init(const AudioPipelineConfig &config = AudioPipelineConfig{});

  void setFrameCallback(FrameCallback cb) { m_frameCallback = cb; }

  /**
   * @brief 打开麦克风并开始采集
   * @return ESP_OK 成功；SEAM_ERR_DEVICE_UNAVAILABLE 设备无法打开
   */
  esp_err_t start();

  /**
   * @brief 停止采集并释放设备，start() 部分失败后调用也是安全的
   */
  void stop();

  bool isRunning() const { return m_running.load(); }

private:
  AudioPipeline() = default;
  ~AudioPipeline() = default;

  static void captureTask(void *arg);

  esp_err_t openChannel();
  void closeChannel();

  AudioPipelineConfig m_config;
  bool m_initialized = false;

  i2s_chan_handle_t m_rxHandle = nullptr;
  TaskHandle_t m_taskHandle = nullptr;
  SemaphoreHandle_t m_exitSem = nullptr;
  std::atomic<bool> m_running{false};

  PcmResampler m_resampler;
  FrameCallback m_frameCallback;
};
