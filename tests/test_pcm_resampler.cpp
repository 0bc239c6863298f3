#include <gtest/gtest.h>

#include "pcm_resampler.h"

#include <cmath>
#include <cstdlib>
#include <vector>

TEST(PcmResamplerTest, RejectsUnsupportedFormats) {
  PcmResampler rs;
  EXPECT_EQ(rs.configure({48000, 1, 24}), ESP_ERR_NOT_SUPPORTED);
  EXPECT_EQ(rs.configure({0, 1, 16}), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(rs.configure({48000, 0, 16}), ESP_ERR_INVALID_ARG);
  EXPECT_FALSE(rs.isConfigured());
}

TEST(PcmResamplerTest, OutputLengthTracksRateRatio) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({48000, 1, 16}), ESP_OK);

  for (size_t n : {48u, 1000u, 1024u, 4801u, 48000u}) {
    rs.reset();
    std::vector<int16_t> in(n, 100);
    std::vector<int16_t> out;
    size_t produced = rs.process(in.data(), n, out);
    double expected = (double)n * 16000.0 / 48000.0;
    EXPECT_LE(std::fabs((double)produced - expected), 1.0) << "n=" << n;
    EXPECT_EQ(out.size(), produced);
  }
}

TEST(PcmResamplerTest, ConsecutiveWindowsKeepLongRunRate) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({44100, 1, 16}), ESP_OK);

  std::vector<int16_t> in(1000, 0);
  std::vector<int16_t> out;
  size_t total = 0;
  for (int i = 0; i < 441; i++) {
    total += rs.process(in.data(), in.size(), out);
  }
  // 441000 帧 @44.1k = 10 s
  EXPECT_NEAR((double)total, 160000.0, 1.0);
}

TEST(PcmResamplerTest, ConstantSignalIsPreserved) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({48000, 1, 16}), ESP_OK);
  std::vector<int16_t> in(960, 1234);
  std::vector<int16_t> out;
  rs.process(in.data(), in.size(), out);
  ASSERT_FALSE(out.empty());
  for (int16_t v : out) {
    EXPECT_EQ(v, 1234);
  }
}

TEST(PcmResamplerTest, StereoIsAveraged) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({32000, 2, 16}), ESP_OK);
  std::vector<int16_t> in;
  for (int i = 0; i < 64; i++) {
    in.push_back(1000);
    in.push_back(3000);
  }
  std::vector<int16_t> out;
  size_t produced = rs.process(in.data(), 64, out);
  EXPECT_EQ(produced, 32u);
  for (int16_t v : out) {
    EXPECT_EQ(v, 2000);
  }
}

TEST(PcmResamplerTest, ThirtyTwoBitSlotsUseHighHalf) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({16000, 1, 32}), ESP_OK);
  std::vector<int32_t> in(16, (int32_t)(-500 * 65536));
  std::vector<int16_t> out;
  size_t produced = rs.process(in.data(), in.size(), out);
  EXPECT_EQ(produced, 16u);
  for (int16_t v : out) {
    EXPECT_EQ(v, -500);
  }
}

TEST(PcmResamplerTest, RampStaysContinuousAcrossWindows) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({48000, 1, 16}), ESP_OK);

  // 0,1,2,... 的斜坡拆成两段喂进去，输出应为 0,3,6,...
  std::vector<int16_t> ramp(3000);
  for (size_t i = 0; i < ramp.size(); i++) {
    ramp[i] = (int16_t)i;
  }
  std::vector<int16_t> a, b;
  rs.process(ramp.data(), 1000, a);
  rs.process(ramp.data() + 1000, 2000, b);

  std::vector<int16_t> all(a);
  all.insert(all.end(), b.begin(), b.end());
  ASSERT_EQ(all.size(), 1000u);
  for (size_t k = 0; k < all.size(); k++) {
    EXPECT_NEAR(all[k], (int)(3 * k), 1) << "k=" << k;
  }
}

TEST(PcmResamplerTest, RespectsOutputCapacity) {
  PcmResampler rs;
  ASSERT_EQ(rs.configure({48000, 1, 16}), ESP_OK);
  std::vector<int16_t> in(300, 7);
  int16_t out[10];
  EXPECT_EQ(rs.process(in.data(), in.size(), out, 10), 10u);
  EXPECT_EQ(rs.outputCapacity(300), 101u);
}
