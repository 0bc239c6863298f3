#pragma once

#include "esp_err.h"

#include <cstddef>
#include <string>

/**
 * @brief 翻译请求体 {"text","source_lang","target_lang"}
 */
std::string BuildTranslateRequest(const std::string &text,
                                  const std::string &sourceLang,
                                  const std::string &targetLang);

/**
 * @brief 解析翻译服务的回复 {"translation": "..."}
 * @return ESP_OK；格式不对返回 SEAM_ERR_TRANSLATION_FAILED
 */
esp_err_t ParseTranslateReply(const char *body, size_t len,
                              std::string &translation);
