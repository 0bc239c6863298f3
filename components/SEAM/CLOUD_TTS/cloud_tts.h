#pragma once

#include "esp_err.h"
#include <string>

/**
 * @brief 语音合成服务配置
 *
 * POST application/json {"text","lang","voice","language_type"}，
 * 响应 audio/wav 或 audio/mpeg。
 */
struct CloudTtsConfig {
  std::string url; ///< 例如 http://192.168.1.10:8000/tts

  int timeout_ms = 15000;
  int max_response_bytes = 1024 * 1024; // 1 MiB
};

/**
 * @brief 语音合成客户端（单例）
 *
 * 尽力而为：失败只记录日志，不影响会话。
 */
class CloudTts {
public:
  static CloudTts &instance();

  CloudTts(const CloudTts &) = delete;
  CloudTts &operator=(const CloudTts &) = delete;
  CloudTts(CloudTts &&) = delete;
  CloudTts &operator=(CloudTts &&) = delete;

  esp_err_t init(const CloudTtsConfig &cfg);

  /**
   * @brief 合成并播放（阻塞到下载完成，播放在后台进行）
   * @return ESP_OK；失败返回 SEAM_ERR_SYNTHESIS_FAILED
   */
  esp_err_t speak(const std::string &text, const std::string &lang);

  bool isConfigured() const { return m_inited && !m_cfg.url.empty(); }

private:
  CloudTts() = default;
  ~CloudTts() = default;

  CloudTtsConfig m_cfg;
  bool m_inited = false;
};
