#include "pcm_resampler.h"

#include "esp_log.h"

#include <cmath>

static const char *TAG = "PcmResampler";

esp_err_t PcmResampler::configure(const PcmFormat &input, int outputRateHz) {
  if (input.sample_rate_hz <= 0 || outputRateHz <= 0 || input.channels <= 0) {
    return ESP_ERR_INVALID_ARG;
  }
  if (input.bits_per_sample != 16 && input.bits_per_sample != 32) {
    ESP_LOGE(TAG, "Unsupported sample width: %d", input.bits_per_sample);
    return ESP_ERR_NOT_SUPPORTED;
  }

  m_in = input;
  m_outRate = outputRateHz;
  m_step = (double)input.sample_rate_hz / (double)outputRateHz;
  reset();

  ESP_LOGI(TAG, "Resampler %d Hz x%d ch (%d bit) -> %d Hz mono",
           input.sample_rate_hz, input.channels, input.bits_per_sample,
           outputRateHz);
  return ESP_OK;
}

void PcmResampler::reset() {
  m_pos = 0.0;
  m_prev = 0.0f;
}

size_t PcmResampler::outputCapacity(size_t inputFrames) const {
  if (m_step <= 0.0) {
    return 0;
  }
  return (size_t)((double)inputFrames / m_step) + 1;
}

float PcmResampler::monoSample(const void *input, size_t frame) const {
  const int ch = m_in.channels;
  float sum = 0.0f;
  if (m_in.bits_per_sample == 16) {
    const auto *s = static_cast<const int16_t *>(input) + frame * ch;
    for (int c = 0; c < ch; c++) {
      sum += (float)s[c];
    }
  } else {
    const auto *s = static_cast<const int32_t *>(input) + frame * ch;
    for (int c = 0; c < ch; c++) {
      sum += (float)(s[c] >> 16);
    }
  }
  return sum / (float)ch;
}

size_t PcmResampler::process(const void *input, size_t inputFrames,
                             int16_t *output, size_t capacity) {
  if (!isConfigured() || input == nullptr || output == nullptr ||
      inputFrames == 0) {
    return 0;
  }

  const double last = (double)(inputFrames - 1);
  size_t produced = 0;

  while (m_pos <= last && produced < capacity) {
    double base = std::floor(m_pos);
    long i = (long)base;
    float frac = (float)(m_pos - base);

    // i == -1: between the previous window's tail and sample 0
    float s0 = (i < 0) ? m_prev : monoSample(input, (size_t)i);
    float s1 = ((size_t)(i + 1) <= (size_t)last) ? monoSample(input, (size_t)(i + 1))
                                                 : s0;
    float v = s0 + (s1 - s0) * frac;

    if (v > 32767.0f) {
      v = 32767.0f;
    } else if (v < -32768.0f) {
      v = -32768.0f;
    }
    output[produced++] = (int16_t)std::lround(v);
    m_pos += m_step;
  }

  m_prev = monoSample(input, inputFrames - 1);
  m_pos -= (double)inputFrames;
  if (m_pos < -1.0) {
    // capacity ran out; drop the backlog instead of drifting
    m_pos = 0.0;
  }
  return produced;
}

size_t PcmResampler::process(const void *input, size_t inputFrames,
                             std::vector<int16_t> &output) {
  output.resize(outputCapacity(inputFrames));
  size_t n = process(input, inputFrames, output.data(), output.size());
  output.resize(n);
  return n;
}
