#include <gtest/gtest.h>

#include "pcm_codec.h"

#include <vector>

TEST(PcmCodecTest, EncodesLittleEndian) {
  const int16_t samples[] = {0x0201, -1};
  std::string out;
  ASSERT_EQ(EncodePcmBase64(samples, 2, out), ESP_OK);
  // 01 02 FF FF
  EXPECT_EQ(out, "AQL//w==");
}

TEST(PcmCodecTest, EmptyInputIsEmptyString) {
  std::string out = "x";
  ASSERT_EQ(EncodePcmBase64(nullptr, 0, out), ESP_OK);
  EXPECT_TRUE(out.empty());
}

TEST(PcmCodecTest, DecodesWhatWasEncoded) {
  std::vector<int16_t> samples = {0, 1, -2, 32767, -32768, 12345};
  std::string encoded;
  ASSERT_EQ(EncodePcmBase64(samples.data(), samples.size(), encoded), ESP_OK);

  std::vector<int16_t> decoded;
  ASSERT_EQ(DecodePcmBase64(encoded, decoded), ESP_OK);
  EXPECT_EQ(decoded, samples);
}

TEST(PcmCodecTest, RejectsMalformedInput) {
  std::vector<int16_t> decoded;
  EXPECT_EQ(DecodePcmBase64("!!!!", decoded), ESP_ERR_INVALID_ARG);
  // 3 个字节，不是完整样本
  EXPECT_EQ(DecodePcmBase64("AQID", decoded), ESP_ERR_INVALID_SIZE);
}
