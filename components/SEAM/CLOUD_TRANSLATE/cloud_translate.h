#pragma once

#include "esp_err.h"
#include <string>

/**
 * @brief 翻译服务配置
 *
 * POST application/json {"text","source_lang","target_lang"}，
 * 响应 {"translation": "..."}。
 */
struct CloudTranslateConfig {
  std::string url; ///< 例如 http://192.168.1.10:8080/api/v1/translate/text
  int timeout_ms = 30000;
};

/**
 * @brief 翻译客户端（单例），阻塞调用，只在翻译任务中使用
 */
class CloudTranslate {
public:
  static CloudTranslate &instance();

  CloudTranslate(const CloudTranslate &) = delete;
  CloudTranslate &operator=(const CloudTranslate &) = delete;
  CloudTranslate(CloudTranslate &&) = delete;
  CloudTranslate &operator=(CloudTranslate &&) = delete;

  esp_err_t init(const CloudTranslateConfig &cfg);

  /**
   * @return ESP_OK；非 2xx 或回复格式不对返回 SEAM_ERR_TRANSLATION_FAILED
   */
  esp_err_t translate(const std::string &text, const std::string &sourceLang,
                      const std::string &targetLang, std::string &translated);

  bool isConfigured() const { return m_inited && !m_cfg.url.empty(); }

private:
  CloudTranslate() = default;
  ~CloudTranslate() = default;

  CloudTranslateConfig m_cfg;
  bool m_inited = false;
};
