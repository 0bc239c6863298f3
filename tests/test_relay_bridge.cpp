#include <gtest/gtest.h>

#include "cJSON.h"
#include "relay_bridge.h"
#include "seam_err.h"

#include <memory>
#include <string>
#include <vector>

namespace {

class FakeClient : public ClientChannel {
public:
  esp_err_t sendText(const std::string &text) override {
    sent.push_back(text);
    return ESP_OK;
  }
  void close() override { closes++; }

  std::vector<std::string> sent;
  int closes = 0;
};

class FakeUpstream : public UpstreamChannel {
public:
  esp_err_t send(const std::string &text) override {
    sent.push_back(text);
    return send_result;
  }
  void terminate() override { terminated = true; }

  esp_err_t send_result = ESP_OK;
  std::vector<std::string> sent;
  bool terminated = false;
};

class FakeConnector : public UpstreamConnector {
public:
  std::unique_ptr<UpstreamChannel> connect(const std::string &url,
                                           const std::string &authorization,
                                           esp_err_t &err) override {
    connects++;
    last_url = url;
    last_auth = authorization;
    if (fail) {
      err = ESP_FAIL;
      return nullptr;
    }
    err = ESP_OK;
    auto *channel = new FakeUpstream();
    upstream = channel;
    return std::unique_ptr<UpstreamChannel>(channel);
  }

  int connects = 0;
  bool fail = false;
  std::string last_url;
  std::string last_auth;
  FakeUpstream *upstream = nullptr; // 由 bridge 持有
};

std::string errorMessage(const std::string &json) {
  cJSON *root = cJSON_Parse(json.c_str());
  std::string out;
  const cJSON *type = cJSON_GetObjectItem(root, "type");
  const cJSON *error = cJSON_GetObjectItem(root, "error");
  if (cJSON_IsString(type) && std::string(type->valuestring) == "error" &&
      cJSON_IsObject(error)) {
    const cJSON *message = cJSON_GetObjectItem(error, "message");
    if (cJSON_IsString(message)) {
      out = message->valuestring;
    }
  }
  cJSON_Delete(root);
  return out;
}

std::string stringField(const std::string &json, const char *key) {
  cJSON *root = cJSON_Parse(json.c_str());
  std::string out;
  const cJSON *item = cJSON_GetObjectItem(root, key);
  if (cJSON_IsString(item)) {
    out = item->valuestring;
  }
  cJSON_Delete(root);
  return out;
}

const char *kFixedUpdate =
    R"({"type":"session.update","session":{"mode":"fixed_sides","left_lang":"zh","right_lang":"en"}})";
const char *kAutoUpdate =
    R"({"type":"session.update","session":{"mode":"auto_detect","left_lang":"zh","right_lang":"en"}})";
const char *kAppend = R"({"type":"input_audio_buffer.append","audio":"AAAA"})";

class RelayBridgeTest : public ::testing::Test {
protected:
  RelayBridgeTest() {
    config.api_key = "sk-test";
    config.max_pending_messages = 8;
  }

  RelayBridge &make() {
    bridge.reset(new RelayBridge(client, connector, config));
    return *bridge;
  }

  RelayConfig config;
  FakeClient client;
  FakeConnector connector;
  std::unique_ptr<RelayBridge> bridge;
};

} // namespace

TEST_F(RelayBridgeTest, AudioBeforeSessionUpdateIsRejected) {
  RelayBridge &b = make();
  EXPECT_EQ(b.onClientText(kAppend), SEAM_ERR_PROTOCOL_VIOLATION);
  ASSERT_EQ(client.sent.size(), 1u);
  EXPECT_EQ(errorMessage(client.sent[0]), "First message must be session.update");
  EXPECT_EQ(connector.connects, 0);
  EXPECT_EQ(b.upstreamState(), UpstreamState::None);
  EXPECT_FALSE(b.configured());
}

TEST_F(RelayBridgeTest, InvalidJsonIsReported) {
  RelayBridge &b = make();
  EXPECT_EQ(b.onClientText("{oops"), SEAM_ERR_PROTOCOL_VIOLATION);
  ASSERT_EQ(client.sent.size(), 1u);
  EXPECT_EQ(errorMessage(client.sent[0]), "Invalid JSON from client");
  EXPECT_EQ(connector.connects, 0);
}

TEST_F(RelayBridgeTest, UnknownModeDoesNotOpenUpstream) {
  RelayBridge &b = make();
  EXPECT_EQ(b.onClientText(
                R"({"type":"session.update","session":{"mode":"psychic"}})"),
            SEAM_ERR_PROTOCOL_VIOLATION);
  EXPECT_EQ(errorMessage(client.sent.at(0)), "Invalid session.update");
  EXPECT_EQ(connector.connects, 0);
}

TEST_F(RelayBridgeTest, SessionUpdateOpensUpstream) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  EXPECT_EQ(connector.connects, 1);
  EXPECT_EQ(connector.last_url, std::string(kDefaultUpstreamBaseUrl) +
                                    "?model=" + kDefaultRecognitionModel);
  EXPECT_EQ(connector.last_auth, "Bearer sk-test");
  EXPECT_EQ(b.upstreamState(), UpstreamState::Connecting);
  EXPECT_EQ(b.session().mode, SessionMode::FixedSides);
  EXPECT_TRUE(client.sent.empty());
}

TEST_F(RelayBridgeTest, ModelFromSessionAndQueryInBaseUrl) {
  config.upstream_base_url = "wss://asr.example/realtime?region=eu";
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(
                R"({"type":"session.update","session":{"mode":"auto_detect","model":"custom-asr"}})"),
            ESP_OK);
  EXPECT_EQ(connector.last_url,
            "wss://asr.example/realtime?region=eu&model=custom-asr");
}

TEST_F(RelayBridgeTest, BuffersUntilUpstreamOpens) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  ASSERT_EQ(b.onClientText(kAppend), ESP_OK);
  ASSERT_EQ(b.onClientText(R"({"type":"input_audio_buffer.commit"})"), ESP_OK);
  EXPECT_EQ(b.pendingMessages(), 3u);
  ASSERT_NE(connector.upstream, nullptr);
  EXPECT_TRUE(connector.upstream->sent.empty());

  b.onUpstreamOpen();
  EXPECT_EQ(b.upstreamState(), UpstreamState::Open);
  EXPECT_EQ(b.pendingMessages(), 0u);
  ASSERT_EQ(connector.upstream->sent.size(), 3u);
  EXPECT_EQ(connector.upstream->sent[0], kFixedUpdate);
  EXPECT_EQ(connector.upstream->sent[1], kAppend);

  // 打开后直接转发
  ASSERT_EQ(b.onClientText(kAppend), ESP_OK);
  EXPECT_EQ(connector.upstream->sent.size(), 4u);
}

TEST_F(RelayBridgeTest, FlushKeepsGoingWhenUpstreamSendFails) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  ASSERT_EQ(b.onClientText(kAppend), ESP_OK);
  ASSERT_NE(connector.upstream, nullptr);
  connector.upstream->send_result = ESP_FAIL;

  b.onUpstreamOpen();
  EXPECT_EQ(b.upstreamState(), UpstreamState::Open);
  EXPECT_EQ(b.pendingMessages(), 0u);
  EXPECT_EQ(connector.upstream->sent.size(), 2u);
  EXPECT_TRUE(client.sent.empty());
  EXPECT_EQ(client.closes, 0);

  // 发送失败不影响后续转发
  connector.upstream->send_result = ESP_OK;
  ASSERT_EQ(b.onClientText(kAppend), ESP_OK);
  EXPECT_EQ(connector.upstream->sent.size(), 3u);
}

TEST_F(RelayBridgeTest, PendingQueueIsBounded) {
  config.max_pending_messages = 3;
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  for (int i = 0; i < 5; i++) {
    b.onClientText(kAppend);
  }
  EXPECT_EQ(b.pendingMessages(), 3u);
  b.onUpstreamOpen();
  EXPECT_EQ(connector.upstream->sent[0], kFixedUpdate);
}

TEST_F(RelayBridgeTest, SecondSessionUpdateIsRejected) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  b.onUpstreamOpen();
  EXPECT_EQ(b.onClientText(kAutoUpdate), SEAM_ERR_PROTOCOL_VIOLATION);
  EXPECT_EQ(errorMessage(client.sent.at(0)), "session.update already received");
  EXPECT_EQ(connector.upstream->sent.size(), 1u);
  EXPECT_EQ(b.session().mode, SessionMode::FixedSides);
  EXPECT_EQ(connector.connects, 1);
}

TEST_F(RelayBridgeTest, MissingCredentialClosesConnection) {
  config.api_key.clear();
  RelayBridge &b = make();
  EXPECT_EQ(b.onClientText(kFixedUpdate), SEAM_ERR_MISSING_CREDENTIAL);
  EXPECT_EQ(errorMessage(client.sent.at(0)), "Missing upstream credential");
  EXPECT_EQ(client.closes, 1);
  EXPECT_EQ(connector.connects, 0);
}

TEST_F(RelayBridgeTest, ConnectFailureIsReported) {
  connector.fail = true;
  RelayBridge &b = make();
  EXPECT_EQ(b.onClientText(kFixedUpdate), SEAM_ERR_UPSTREAM_TRANSPORT);
  EXPECT_EQ(errorMessage(client.sent.at(0)), "Upstream error: connect failed");
  EXPECT_EQ(client.closes, 1);
  EXPECT_EQ(b.upstreamState(), UpstreamState::Closed);
}

TEST_F(RelayBridgeTest, HandshakeFailureCarriesStatusAndBody) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  FakeUpstream *up = connector.upstream;

  b.onUpstreamHandshakeFailed(401, "invalid api key");
  ASSERT_EQ(client.sent.size(), 1u);
  EXPECT_EQ(errorMessage(client.sent[0]), "Upstream Handshake failed: 401");
  EXPECT_NE(client.sent[0].find("invalid api key"), std::string::npos);
  EXPECT_TRUE(up->terminated);
  EXPECT_EQ(client.closes, 1);
  EXPECT_EQ(b.pendingMessages(), 0u);

  // 后续的 closed 不再给客户端发消息
  b.onUpstreamClosed(1006, "");
  EXPECT_EQ(client.sent.size(), 1u);
}

TEST_F(RelayBridgeTest, AnnotatesCompletedTranscripts) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kAutoUpdate), ESP_OK);
  b.onUpstreamOpen();

  b.onUpstreamText(
      R"({"type":"conversation.item.input_audio_transcription.completed","transcript":"hello","language":"en"})");
  ASSERT_EQ(client.sent.size(), 1u);
  EXPECT_EQ(stringField(client.sent[0], "ui_side"), "right");
  EXPECT_EQ(stringField(client.sent[0], "ui_source_lang"), "en");
  EXPECT_EQ(stringField(client.sent[0], "ui_target_lang"), "zh");
  EXPECT_EQ(stringField(client.sent[0], "ui_mode"), "auto_detect");
}

TEST_F(RelayBridgeTest, OtherUpstreamMessagesPassThroughVerbatim) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  b.onUpstreamOpen();

  const std::string partial =
      R"({"type":"conversation.item.input_audio_transcription.text","text":"he"})";
  b.onUpstreamText(partial);
  b.onUpstreamText("not json at all");
  ASSERT_EQ(client.sent.size(), 2u);
  EXPECT_EQ(client.sent[0], partial);
  EXPECT_EQ(client.sent[1], "not json at all");
}

TEST_F(RelayBridgeTest, UpstreamCloseFinishesSessionOnce) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  b.onUpstreamOpen();

  b.onUpstreamClosed(1000, "done");
  b.onUpstreamClosed(1000, "done");
  ASSERT_EQ(client.sent.size(), 1u);
  EXPECT_EQ(stringField(client.sent[0], "type"), "session.finished");
  EXPECT_EQ(stringField(client.sent[0], "reason"), "done");
  EXPECT_EQ(client.closes, 1);
  EXPECT_EQ(b.upstreamState(), UpstreamState::Closed);

  // 关闭后的客户端消息不再转发
  size_t forwarded = connector.upstream->sent.size();
  b.onClientText(kAppend);
  EXPECT_EQ(connector.upstream->sent.size(), forwarded);
}

TEST_F(RelayBridgeTest, UpstreamErrorIsSurfaced) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  b.onUpstreamOpen();
  b.onUpstreamError("socket error");
  ASSERT_EQ(client.sent.size(), 1u);
  EXPECT_EQ(errorMessage(client.sent[0]), "Upstream error: socket error");
}

TEST_F(RelayBridgeTest, ClientCloseTerminatesUpstream) {
  RelayBridge &b = make();
  ASSERT_EQ(b.onClientText(kFixedUpdate), ESP_OK);
  b.onUpstreamOpen();
  FakeUpstream *up = connector.upstream;

  b.onClientClosed();
  EXPECT_TRUE(up->terminated);
  EXPECT_EQ(b.upstreamState(), UpstreamState::Closed);
  EXPECT_EQ(b.onClientText(kAppend), ESP_ERR_INVALID_STATE);
}
