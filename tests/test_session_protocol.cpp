#include <gtest/gtest.h>

#include "cJSON.h"
#include "seam_err.h"
#include "session_protocol.h"

#include <string>

namespace {
// 取顶层字符串字段，不存在返回空
std::string field(const std::string &json, const char *key) {
  cJSON *root = cJSON_Parse(json.c_str());
  std::string out;
  const cJSON *item = cJSON_GetObjectItem(root, key);
  if (cJSON_IsString(item)) {
    out = item->valuestring;
  }
  cJSON_Delete(root);
  return out;
}
} // namespace

TEST(SessionProtocolTest, ParsesSessionUpdate) {
  SessionConfig defaults;
  ClientMessage msg;
  const std::string text =
      R"({"type":"session.update","session":{"mode":"auto_detect",)"
      R"("left_lang":"ja","right_lang":"ko","model":"m1"}})";

  ASSERT_EQ(ParseClientMessage(text, defaults, msg), ESP_OK);
  EXPECT_EQ(msg.type, ClientMessageType::SessionUpdate);
  EXPECT_EQ(msg.session.mode, SessionMode::AutoDetect);
  EXPECT_EQ(msg.session.side_a_lang, "ja");
  EXPECT_EQ(msg.session.side_b_lang, "ko");
  EXPECT_EQ(msg.session.model, "m1");
}

TEST(SessionProtocolTest, SessionUpdateUsesDefaultsAndLegacyNames) {
  SessionConfig defaults;
  defaults.side_a_lang = "de";
  defaults.side_b_lang = "fr";
  ClientMessage msg;

  ASSERT_EQ(ParseClientMessage(
                R"({"type":"session.update","session":{"mode":"single_button","rightLang":"es"}})",
                defaults, msg),
            ESP_OK);
  EXPECT_EQ(msg.session.mode, SessionMode::AutoDetect);
  EXPECT_EQ(msg.session.side_a_lang, "de");
  EXPECT_EQ(msg.session.side_b_lang, "es");
}

TEST(SessionProtocolTest, RejectsUnknownModeAndBadJson) {
  SessionConfig defaults;
  ClientMessage msg;
  EXPECT_EQ(ParseClientMessage(
                R"({"type":"session.update","session":{"mode":"telepathy"}})",
                defaults, msg),
            SEAM_ERR_PROTOCOL_VIOLATION);
  EXPECT_EQ(ParseClientMessage("not json", defaults, msg), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(ParseClientMessage("[1,2]", defaults, msg), ESP_ERR_INVALID_ARG);
  EXPECT_EQ(ParseClientMessage(R"({"audio":"AAAA"})", defaults, msg),
            SEAM_ERR_PROTOCOL_VIOLATION);
}

TEST(SessionProtocolTest, ClassifiesAudioMessages) {
  SessionConfig defaults;
  ClientMessage msg;
  ASSERT_EQ(ParseClientMessage(BuildAudioAppend("AAAA"), defaults, msg), ESP_OK);
  EXPECT_EQ(msg.type, ClientMessageType::AudioAppend);
  ASSERT_EQ(ParseClientMessage(BuildAudioCommit(), defaults, msg), ESP_OK);
  EXPECT_EQ(msg.type, ClientMessageType::AudioCommit);
  ASSERT_EQ(ParseClientMessage(BuildSessionFinish(), defaults, msg), ESP_OK);
  EXPECT_EQ(msg.type, ClientMessageType::SessionFinish);
}

TEST(SessionProtocolTest, SessionUpdateCarriesHintOnlyForFixedSides) {
  SessionConfig cfg;
  cfg.mode = SessionMode::FixedSides;
  cfg.language_hint = "en";
  std::string fixed = BuildSessionUpdate(cfg);
  EXPECT_NE(fixed.find("input_audio_transcription"), std::string::npos);
  EXPECT_NE(fixed.find("\"fixed_sides\""), std::string::npos);

  cfg.mode = SessionMode::AutoDetect;
  std::string autoDetect = BuildSessionUpdate(cfg);
  EXPECT_EQ(autoDetect.find("input_audio_transcription"), std::string::npos);
  EXPECT_NE(autoDetect.find("\"auto_detect\""), std::string::npos);
}

TEST(SessionProtocolTest, ParsesPartialWithStash) {
  const std::string text =
      R"({"type":"conversation.item.input_audio_transcription.text","text":"你好","stash":"世界"})";
  RecognitionEvent ev;
  ASSERT_EQ(ParseRecognitionEvent(text.data(), text.size(), ev), ESP_OK);
  EXPECT_EQ(ev.type, RecognitionEventType::PartialTranscript);
  EXPECT_EQ(ev.text, "你好世界");
}

TEST(SessionProtocolTest, ParsesRoutedCompleted) {
  const std::string text =
      R"({"type":"conversation.item.input_audio_transcription.completed",)"
      R"("transcript":"hello","language":"en","ui_side":"right",)"
      R"("ui_source_lang":"en","ui_target_lang":"zh","ui_mode":"auto_detect"})";
  RecognitionEvent ev;
  ASSERT_EQ(ParseRecognitionEvent(text.data(), text.size(), ev), ESP_OK);
  EXPECT_EQ(ev.type, RecognitionEventType::CompletedTranscript);
  EXPECT_EQ(ev.text, "hello");
  EXPECT_TRUE(ev.routed);
  EXPECT_EQ(ev.side, Side::B);
  EXPECT_EQ(ev.source_lang, "en");
  EXPECT_EQ(ev.target_lang, "zh");
}

TEST(SessionProtocolTest, ParsesErrorShapes) {
  RecognitionEvent ev;
  std::string nested = BuildErrorMessage("Upstream Handshake failed: 401", "bad key");
  ASSERT_EQ(ParseRecognitionEvent(nested.data(), nested.size(), ev), ESP_OK);
  EXPECT_EQ(ev.type, RecognitionEventType::Error);
  EXPECT_EQ(ev.error_message, "Upstream Handshake failed: 401");
  EXPECT_EQ(ev.error_detail, "bad key");

  const std::string flat = R"({"type":"error","error":"boom"})";
  ASSERT_EQ(ParseRecognitionEvent(flat.data(), flat.size(), ev), ESP_OK);
  EXPECT_EQ(ev.error_message, "boom");

  EXPECT_EQ(ParseRecognitionEvent("{}", 2, ev), ESP_ERR_INVALID_ARG);
}

TEST(SessionProtocolTest, AnnotatesCompletedWithDirection) {
  SessionConfig cfg;
  cfg.mode = SessionMode::AutoDetect;
  cfg.side_a_lang = "zh";
  cfg.side_b_lang = "en";

  std::string out;
  bool annotated = false;
  ASSERT_EQ(AnnotateUpstreamEvent(
                R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"hi","language":"en-US"})",
                cfg, out, annotated),
            ESP_OK);
  ASSERT_TRUE(annotated);
  EXPECT_EQ(field(out, "ui_side"), "right");
  EXPECT_EQ(field(out, "ui_source_lang"), "en");
  EXPECT_EQ(field(out, "ui_target_lang"), "zh");
  EXPECT_EQ(field(out, "ui_mode"), "auto_detect");
  EXPECT_EQ(field(out, "transcript"), "hi");
}

TEST(SessionProtocolTest, AnnotateLeavesOtherEventsAlone) {
  SessionConfig cfg;
  std::string out = "untouched";
  bool annotated = true;
  EXPECT_EQ(AnnotateUpstreamEvent(R"({"type":"session.created"})", cfg, out,
                                  annotated),
            ESP_OK);
  EXPECT_FALSE(annotated);
  EXPECT_EQ(out, "untouched");
  EXPECT_EQ(AnnotateUpstreamEvent("garbage", cfg, out, annotated),
            ESP_ERR_INVALID_ARG);
}

TEST(SessionProtocolTest, ClosePayloadCarriesCodeAndReason) {
  const uint8_t payload[] = {0x03, 0xE8, 's', 'e', 's', 's', 'i', 'o', 'n',
                             ' ',  'e',  'n', 'd', 'e', 'd'};
  int code = 0;
  std::string reason;
  ASSERT_EQ(ParseWsClosePayload(payload, sizeof(payload), code, reason),
            ESP_OK);
  EXPECT_EQ(code, 1000);
  EXPECT_EQ(reason, "session ended");

  // 关闭原因会原样出现在 session.finished 里
  EXPECT_EQ(field(BuildSessionFinished(reason), "reason"), "session ended");
}

TEST(SessionProtocolTest, ClosePayloadWithoutReasonOrStatus) {
  const uint8_t codeOnly[] = {0x0F, 0xA1}; // 4001
  int code = 0;
  std::string reason = "stale";
  ASSERT_EQ(ParseWsClosePayload(codeOnly, sizeof(codeOnly), code, reason),
            ESP_OK);
  EXPECT_EQ(code, 4001);
  EXPECT_TRUE(reason.empty());

  ASSERT_EQ(ParseWsClosePayload(nullptr, 0, code, reason), ESP_OK);
  EXPECT_EQ(code, kWsCloseNoStatus);

  const uint8_t truncated[] = {0x03};
  EXPECT_EQ(ParseWsClosePayload(truncated, sizeof(truncated), code, reason),
            ESP_ERR_INVALID_SIZE);
}

TEST(SessionProtocolTest, RecognizesWebSocketUpgradeHeader) {
  EXPECT_TRUE(IsWebSocketUpgrade("websocket"));
  EXPECT_TRUE(IsWebSocketUpgrade("WebSocket"));
  EXPECT_FALSE(IsWebSocketUpgrade("h2c"));
  EXPECT_FALSE(IsWebSocketUpgrade("websockets"));
  EXPECT_FALSE(IsWebSocketUpgrade(""));
  EXPECT_FALSE(IsWebSocketUpgrade(nullptr));
}
