#include "pcm_codec.h"

#include "esp_log.h"
#include "mbedtls/base64.h"

static const char *TAG = "PcmCodec";

esp_err_t EncodePcmBase64(const int16_t *samples, size_t count,
                          std::string &out) {
  out.clear();
  if (count == 0) {
    return ESP_OK;
  }
  if (samples == nullptr) {
    return ESP_ERR_INVALID_ARG;
  }

  std::vector<unsigned char> bytes(count * 2);
  for (size_t i = 0; i < count; i++) {
    uint16_t v = (uint16_t)samples[i];
    bytes[i * 2] = (unsigned char)(v & 0xFF);
    bytes[i * 2 + 1] = (unsigned char)(v >> 8);
  }

  size_t olen = 0;
  // 先探测输出长度（返回 BUFFER_TOO_SMALL）
  mbedtls_base64_encode(nullptr, 0, &olen, bytes.data(), bytes.size());
  std::vector<unsigned char> encoded(olen + 1);
  int ret = mbedtls_base64_encode(encoded.data(), encoded.size(), &olen,
                                  bytes.data(), bytes.size());
  if (ret != 0) {
    ESP_LOGE(TAG, "base64 encode failed: -0x%04x", -ret);
    return ESP_FAIL;
  }
  out.assign((const char *)encoded.data(), olen);
  return ESP_OK;
}

esp_err_t DecodePcmBase64(const std::string &encoded,
                          std::vector<int16_t> &out) {
  out.clear();
  if (encoded.empty()) {
    return ESP_OK;
  }

  const auto *src = (const unsigned char *)encoded.data();
  size_t olen = 0;
  int ret = mbedtls_base64_decode(nullptr, 0, &olen, src, encoded.size());
  if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
    ESP_LOGW(TAG, "Invalid base64 payload");
    return ESP_ERR_INVALID_ARG;
  }

  std::vector<unsigned char> bytes(olen);
  ret = mbedtls_base64_decode(bytes.data(), bytes.size(), &olen, src,
                              encoded.size());
  if (ret != 0) {
    ESP_LOGW(TAG, "base64 decode failed: -0x%04x", -ret);
    return ESP_ERR_INVALID_ARG;
  }
  if (olen % 2 != 0) {
    return ESP_ERR_INVALID_SIZE;
  }

  out.resize(olen / 2);
  for (size_t i = 0; i < out.size(); i++) {
    out[i] = (int16_t)((uint16_t)bytes[i * 2] | ((uint16_t)bytes[i * 2 + 1] << 8));
  }
  return ESP_OK;
}
