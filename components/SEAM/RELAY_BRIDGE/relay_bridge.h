#pragma once

#include "esp_err.h"
#include "session_protocol.h"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

constexpr const char *kRelayPath = "/api/v1/asr/realtime";
constexpr const char *kDefaultUpstreamBaseUrl =
    "wss://dashscope-intl.aliyuncs.com/api-ws/v1/realtime";
constexpr const char *kDefaultRecognitionModel = "qwen3-asr-flash-realtime";

/**
 * @brief 中继配置，启动时确定，所有连接共用
 */
struct RelayConfig {
  std::string api_key; ///< 上游凭据，为空时每个连接在 session.update 时报错
  std::string upstream_base_url = kDefaultUpstreamBaseUrl;
  std::string default_model = kDefaultRecognitionModel;
  SessionConfig session_defaults; ///< session.update 缺省字段
  bool buffer_until_open = true;  ///< 上游握手完成前缓存客户端消息
  size_t max_pending_messages = 256;
};

/**
 * @brief 客户端一侧的 socket
 */
class ClientChannel {
public:
  virtual ~ClientChannel() = default;
  virtual esp_err_t sendText(const std::string &text) = 0;
  virtual void close() = 0;
};

/**
 * @brief 上游 socket
 */
class UpstreamChannel {
public:
  virtual ~UpstreamChannel() = default;
  virtual esp_err_t send(const std::string &text) = 0;
  /// 不等待，尽力关闭
  virtual void terminate() = 0;
};

/**
 * @brief 发起上游连接
 *
 * connect() 只发起连接；握手结果通过 RelayBridge::onUpstreamOpen() /
 * onUpstreamHandshakeFailed() 回报。
 */
class UpstreamConnector {
public:
  virtual ~UpstreamConnector() = default;
  virtual std::unique_ptr<UpstreamChannel>
  connect(const std::string &url, const std::string &authorization,
          esp_err_t &err) = 0;
};

enum class UpstreamState {
  None = 0,   ///< 还没收到 session.update
  Connecting, ///< 握手中
  Open,
  Closed,
};

inline const char *GetUpstreamStateName(UpstreamState state) {
  switch (state) {
  case UpstreamState::None:       return "None";
  case UpstreamState::Connecting: return "Connecting";
  case UpstreamState::Open:       return "Open";
  case UpstreamState::Closed:     return "Closed";
  default:                        return "Invalid";
  }
}

/**
 * @brief 一个客户端连接对应一个 RelayBridge
 *
 * 持有会话配置和最多一个上游连接。非线程安全，同一连接的所有事件
 * 必须在同一个任务里按顺序调用（RelayServer 用 httpd_queue_work 保证）。
 */
class RelayBridge {
public:
  RelayBridge(ClientChannel &client, UpstreamConnector &connector,
              const RelayConfig &config);
  ~RelayBridge();

  RelayBridge(const RelayBridge &) = delete;
  RelayBridge &operator=(const RelayBridge &) = delete;

  /**
   * @brief 客户端消息
   * @return ESP_OK 已处理（转发、缓存或丢弃）；其他值表示已向客户端回复 error
   */
  esp_err_t onClientText(const std::string &text);

  /// 客户端断开：关闭上游，丢弃状态
  void onClientClosed();

  void onUpstreamOpen();
  void onUpstreamText(const std::string &text);
  void onUpstreamHandshakeFailed(int status, const std::string &body);
  void onUpstreamClosed(int code, const std::string &reason);
  void onUpstreamError(const std::string &message);

  UpstreamState upstreamState() const { return m_state; }
  bool configured() const { return m_state != UpstreamState::None; }
  const SessionConfig &session() const { return m_session; }
  size_t pendingMessages() const { return m_pending.size(); }
  const std::string &upstreamUrl() const { return m_url; }

private:
  esp_err_t startUpstream(const std::string &text, const ClientMessage &msg);
  void forward(const std::string &text);
  void sendError(const std::string &message,
                 const std::string &detail = std::string());
  void closeUpstream();
  void closeClient();

  ClientChannel &m_client;
  UpstreamConnector &m_connector;
  RelayConfig m_config;

  UpstreamState m_state = UpstreamState::None;
  SessionConfig m_session;
  std::string m_url;
  std::unique_ptr<UpstreamChannel> m_upstream;
  std::deque<std::string> m_pending; // 握手前收到的消息，第一条是 session.update
  bool m_clientClosed = false;
  bool m_finishedSent = false;
  uint32_t m_dropped = 0;
};
