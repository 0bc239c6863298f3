#include "cloud_translate.h"

#include "esp_log.h"
#include "http_post.h"
#include "seam_err.h"
#include "translate_codec.h"

#include <algorithm>

static const char *TAG = "CloudTranslate";

CloudTranslate &CloudTranslate::instance() {
  static CloudTranslate inst;
  return inst;
}

esp_err_t CloudTranslate::init(const CloudTranslateConfig &cfg) {
  m_cfg = cfg;
  m_inited = true;
  if (m_cfg.url.empty()) {
    ESP_LOGW(TAG, "Translate url is empty, translation disabled");
  }
  return ESP_OK;
}

esp_err_t CloudTranslate::translate(const std::string &text,
                                    const std::string &sourceLang,
                                    const std::string &targetLang,
                                    std::string &translated) {
  if (!isConfigured()) {
    return ESP_ERR_INVALID_STATE;
  }
  if (text.empty()) {
    translated.clear();
    return ESP_OK;
  }

  HttpPostOptions opts;
  opts.timeout_ms = m_cfg.timeout_ms;

  HttpBody body;
  esp_err_t err = HttpPost(
      m_cfg.url, BuildTranslateRequest(text, sourceLang, targetLang), opts, body);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Translate request failed: %s", esp_err_to_name(err));
    return SEAM_ERR_TRANSLATION_FAILED;
  }
  if (body.status < 200 || body.status >= 300) {
    ESP_LOGE(TAG, "Translate http status=%d: %.*s", body.status,
             (int)std::min(body.size, (size_t)200), body.data ? (const char *)body.data : "");
    return SEAM_ERR_TRANSLATION_FAILED;
  }

  err = ParseTranslateReply((const char *)body.data, body.size, translated);
  if (err == ESP_OK) {
    ESP_LOGI(TAG, "[%s->%s] %s", sourceLang.c_str(), targetLang.c_str(),
             translated.c_str());
  }
  return err;
}
