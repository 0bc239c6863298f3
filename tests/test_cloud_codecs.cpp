#include <gtest/gtest.h>

#include "cJSON.h"
#include "seam_err.h"
#include "translate_codec.h"
#include "tts_voice.h"

#include <cstring>
#include <string>

TEST(TtsVoiceTest, MapsPrimarySubtag) {
  EXPECT_EQ(SelectTtsVoice("zh").language_type, "Chinese");
  EXPECT_EQ(SelectTtsVoice("en-US").language_type, "English");
  EXPECT_EQ(SelectTtsVoice("JA").language_type, "Japanese");
  EXPECT_EQ(SelectTtsVoice("ko_KR").language_type, "Korean");
  EXPECT_EQ(SelectTtsVoice("de").voice, kDefaultTtsVoice);
}

TEST(TtsVoiceTest, UnknownLanguageFallsBackToEnglish) {
  EXPECT_EQ(SelectTtsVoice("sw").language_type, "English");
  EXPECT_EQ(SelectTtsVoice("").language_type, "English");
}

TEST(TtsVoiceTest, RequestCarriesVoiceParameters) {
  std::string body = BuildTtsRequest("bonjour", "fr");
  cJSON *root = cJSON_Parse(body.c_str());
  ASSERT_NE(root, nullptr);
  EXPECT_STREQ(cJSON_GetObjectItem(root, "text")->valuestring, "bonjour");
  EXPECT_STREQ(cJSON_GetObjectItem(root, "lang")->valuestring, "fr");
  EXPECT_STREQ(cJSON_GetObjectItem(root, "voice")->valuestring, "Cherry");
  EXPECT_STREQ(cJSON_GetObjectItem(root, "language_type")->valuestring, "French");
  cJSON_Delete(root);
}

TEST(TranslateCodecTest, RequestHasTextAndLanguages) {
  std::string body = BuildTranslateRequest("你好", "zh", "en");
  cJSON *root = cJSON_Parse(body.c_str());
  ASSERT_NE(root, nullptr);
  EXPECT_STREQ(cJSON_GetObjectItem(root, "text")->valuestring, "你好");
  EXPECT_STREQ(cJSON_GetObjectItem(root, "source_lang")->valuestring, "zh");
  EXPECT_STREQ(cJSON_GetObjectItem(root, "target_lang")->valuestring, "en");
  cJSON_Delete(root);
}

TEST(TranslateCodecTest, ParsesTranslation) {
  const char *reply = R"({"translation":"hello"})";
  std::string out;
  ASSERT_EQ(ParseTranslateReply(reply, strlen(reply), out), ESP_OK);
  EXPECT_EQ(out, "hello");
}

TEST(TranslateCodecTest, MalformedReplyIsTranslationFailure) {
  std::string out = "keep";
  const char *noField = R"({"error":"quota exceeded"})";
  EXPECT_EQ(ParseTranslateReply(noField, strlen(noField), out),
            SEAM_ERR_TRANSLATION_FAILED);
  const char *notJson = "<html>502</html>";
  EXPECT_EQ(ParseTranslateReply(notJson, strlen(notJson), out),
            SEAM_ERR_TRANSLATION_FAILED);
  const char *wrongType = R"({"translation":42})";
  EXPECT_EQ(ParseTranslateReply(wrongType, strlen(wrongType), out),
            SEAM_ERR_TRANSLATION_FAILED);
  EXPECT_EQ(out, "keep");
}

TEST(SeamErrTest, NamesProjectCodes) {
  EXPECT_STREQ(seam_err_to_name(SEAM_ERR_FINALIZE_TIMEOUT),
               "SEAM_ERR_FINALIZE_TIMEOUT");
  EXPECT_STREQ(seam_err_to_name(SEAM_ERR_MISSING_CREDENTIAL),
               "SEAM_ERR_MISSING_CREDENTIAL");
}
