#pragma once

#include "esp_err.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief 16-bit PCM 样本按小端序打包后做 base64 编码
 */
esp_err_t EncodePcmBase64(const int16_t *samples, size_t count,
                          std::string &out);

/**
 * @brief base64 解码为 16-bit 小端 PCM；字节数为奇数时返回 ESP_ERR_INVALID_SIZE
 */
esp_err_t DecodePcmBase64(const std::string &encoded,
                          std::vector<int16_t> &out);
