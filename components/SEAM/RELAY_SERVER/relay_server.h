#pragma once

#include "esp_err.h"
#include "esp_http_server.h"
#include "esp_websocket_client.h"
#include "relay_bridge.h"

#include <atomic>
#include <memory>
#include <string>

struct RelayServerConfig {
  uint16_t port = 8080;
  uint16_t max_clients = 4;
  RelayConfig relay;
  int upstream_buffer_size = 8192;
  int upstream_timeout_ms = 10000;
};

/**
 * @brief 中继服务（单例）
 *
 *   GET  /health               -> {"ok":true}
 *   WS   /api/v1/asr/realtime  -> 每个连接一个 RelayBridge
 *
 * 所有 RelayBridge 调用都在 httpd 任务里执行：上游 websocket 事件
 * 通过 httpd_queue_work 投递过来，再按 fd + 会话编号找回对应连接。
 */
class RelayServer {
public:
  static RelayServer &instance();

  RelayServer(const RelayServer &) = delete;
  RelayServer &operator=(const RelayServer &) = delete;
  RelayServer(RelayServer &&) = delete;
  RelayServer &operator=(RelayServer &&) = delete;

  esp_err_t init(const RelayServerConfig &config);
  esp_err_t start();
  void stop();

  bool isRunning() const { return m_server.load() != nullptr; }

private:
  RelayServer() = default;
  ~RelayServer() = default;

  class Session;
  class EspUpstreamChannel;
  class EspUpstreamConnector;

  enum class UpstreamEvent : uint8_t {
    Open,
    Text,
    HandshakeFailed,
    Closed,
    Error,
  };

  struct UpstreamWork {
    RelayServer *server;
    int fd;
    uint32_t session_id;
    UpstreamEvent event;
    int status;
    std::string text;
  };

  static esp_err_t handleHealth(httpd_req_t *req);
  static esp_err_t handleRealtime(httpd_req_t *req);
  static esp_err_t handleNotFound(httpd_req_t *req, httpd_err_code_t err);
  static void freeSession(void *ctx);
  static void runUpstreamWork(void *arg);

  esp_err_t openSession(httpd_req_t *req);
  esp_err_t receiveFrame(httpd_req_t *req, Session &session);
  void postUpstream(int fd, uint32_t sessionId, UpstreamEvent event,
                    int status = 0, std::string &&text = std::string());

  RelayServerConfig m_config;
  bool m_initialized = false;
  // 上游 websocket 任务也会读
  std::atomic<httpd_handle_t> m_server{nullptr};
  std::atomic<uint32_t> m_nextSessionId{1};
};
