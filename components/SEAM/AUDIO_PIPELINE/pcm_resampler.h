#pragma once

#include "esp_err.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/**
 * @brief 采集端原始 PCM 格式
 */
struct PcmFormat {
  int sample_rate_hz = 48000;
  int channels = 1;
  int bits_per_sample = 16; ///< 16 或 32（32 位槽取高 16 位）
};

/**
 * @brief 把任意采样率/声道的整型 PCM 转成 16 kHz 单声道 16-bit
 *
 * 多声道先取平均混成单声道，再做线性插值重采样。相邻两次 process()
 * 之间保留插值相位和上一帧末尾样本，连续的采集窗口输出是连续的。
 *
 * 只在采集任务里使用，非线程安全。
 */
class PcmResampler {
public:
  esp_err_t configure(const PcmFormat &input, int outputRateHz = 16000);

  /**
   * @brief 输出缓冲容量：按采样率比例缩放并留一帧余量
   */
  size_t outputCapacity(size_t inputFrames) const;

  /**
   * @brief 转换一个采集窗口
   *
   * @param input       交错排列的原始样本
   * @param inputFrames 帧数（每帧 channels 个样本）
   * @param output      输出缓冲
   * @param capacity    输出缓冲可容纳的样本数
   * @return 实际输出的样本数，可能为 0
   */
  size_t process(const void *input, size_t inputFrames, int16_t *output,
                 size_t capacity);

  size_t process(const void *input, size_t inputFrames,
                 std::vector<int16_t> &output);

  void reset();

  bool isConfigured() const { return m_step > 0.0; }
  const PcmFormat &inputFormat() const { return m_in; }
  int outputRate() const { return m_outRate; }

private:
  float monoSample(const void *input, size_t frame) const;

  PcmFormat m_in;
  int m_outRate = 16000;
  double m_step = 0.0; // input frames per output sample
  double m_pos = 0.0;  // next output position relative to current window
  float m_prev = 0.0f; // last mono sample of the previous window
};
