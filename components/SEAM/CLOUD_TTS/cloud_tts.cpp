#include "cloud_tts.h"

#include "esp_log.h"
#include "http_post.h"
#include "seam_err.h"
#include "tts_voice.h"
#include "voice_player.h"

#include <algorithm>
#include <cstring>

static const char *TAG = "CloudTts";

CloudTts &CloudTts::instance() {
  static CloudTts inst;
  return inst;
}

esp_err_t CloudTts::init(const CloudTtsConfig &cfg) {
  m_cfg = cfg;
  m_inited = true;
  return ESP_OK;
}

esp_err_t CloudTts::speak(const std::string &text, const std::string &lang) {
  if (!m_inited) {
    ESP_LOGE(TAG, "CloudTts not initialized");
    return ESP_ERR_INVALID_STATE;
  }
  if (m_cfg.url.empty()) {
    return ESP_ERR_INVALID_ARG;
  }
  if (text.empty()) {
    return ESP_OK;
  }

  HttpPostOptions opts;
  opts.accept = "audio/wav";
  opts.timeout_ms = m_cfg.timeout_ms;
  opts.max_response_bytes = (size_t)std::max(16 * 1024, m_cfg.max_response_bytes);

  HttpBody body;
  esp_err_t err = HttpPost(m_cfg.url, BuildTtsRequest(text, lang), opts, body);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "TTS request failed: %s", esp_err_to_name(err));
    return SEAM_ERR_SYNTHESIS_FAILED;
  }
  if (body.status != 200) {
    ESP_LOGE(TAG, "TTS server http status=%d: %.*s", body.status,
             (int)std::min(body.size, (size_t)200), body.data ? (const char *)body.data : "");
    return SEAM_ERR_SYNTHESIS_FAILED;
  }

  // WAV 以 RIFF 开头，MP3 以 ID3 或帧同步字开头
  bool wav = body.size >= 4 && memcmp(body.data, "RIFF", 4) == 0;
  bool mp3 = body.size >= 3 && (memcmp(body.data, "ID3", 3) == 0 ||
                                (body.data[0] == 0xFF &&
                                 (body.data[1] & 0xE0) == 0xE0));
  if (!wav && !mp3) {
    ESP_LOGE(TAG, "unexpected audio header, size=%u", (unsigned)body.size);
    return SEAM_ERR_SYNTHESIS_FAILED;
  }

  ESP_LOGI(TAG, "TTS audio bytes: %u (%s)", (unsigned)body.size, lang.c_str());

  size_t len = body.size;
  err = VoicePlayer::instance().enqueue(body.release(), len);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "enqueue failed: %s", esp_err_to_name(err));
    return SEAM_ERR_SYNTHESIS_FAILED;
  }
  return ESP_OK;
}
