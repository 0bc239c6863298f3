#include "relay_server.h"
#include "esp_crt_bundle.h"
#include "esp_log.h"
#include "seam_err.h"

#include <cstdlib>
#include <cstring>

static const char *TAG = "RelayServer";

/**
 * @brief 到上游识别服务的一条 websocket
 *
 * 事件回调运行在 esp_websocket_client 自己的任务里，这里只做分帧重组，
 * 然后整条消息投递回 httpd 任务。
 */
class RelayServer::EspUpstreamChannel : public UpstreamChannel {
public:
  EspUpstreamChannel(RelayServer &server, int fd, uint32_t sessionId)
      : m_server(server), m_fd(fd), m_sessionId(sessionId) {}

  ~EspUpstreamChannel() override { terminate(); }

  esp_err_t connect(const std::string &url, const std::string &authorization) {
    m_headers = "Authorization: " + authorization + "\r\n";

    esp_websocket_client_config_t cfg = {};
    cfg.uri = url.c_str();
    cfg.headers = m_headers.c_str();
    cfg.buffer_size = m_server.m_config.upstream_buffer_size;
    cfg.network_timeout_ms = m_server.m_config.upstream_timeout_ms;
    cfg.disable_auto_reconnect = true;
    cfg.crt_bundle_attach = esp_crt_bundle_attach;

    m_client = esp_websocket_client_init(&cfg);
    if (!m_client) {
      return ESP_ERR_NO_MEM;
    }
    esp_websocket_register_events(m_client, WEBSOCKET_EVENT_ANY, eventHandler,
                                  this);
    esp_err_t err = esp_websocket_client_start(m_client);
    if (err != ESP_OK) {
      esp_websocket_client_destroy(m_client);
      m_client = nullptr;
    }
    return err;
  }

  esp_err_t send(const std::string &text) override {
    if (!m_client || !esp_websocket_client_is_connected(m_client)) {
      return ESP_ERR_INVALID_STATE;
    }
    int sent = esp_websocket_client_send_text(
        m_client, text.c_str(), (int)text.size(), pdMS_TO_TICKS(1000));
    return sent < 0 ? ESP_FAIL : ESP_OK;
  }

  void terminate() override {
    if (!m_client) {
      return;
    }
    m_terminated.store(true);
    // destroy 会停止 client 任务，之后不再有回调
    esp_websocket_client_destroy(m_client);
    m_client = nullptr;
  }

private:
  static void eventHandler(void *arg, esp_event_base_t base, int32_t eventId,
                           void *eventData) {
    static_cast<EspUpstreamChannel *>(arg)->handleEvent(
        eventId, static_cast<esp_websocket_event_data_t *>(eventData));
  }

  void handleEvent(int32_t eventId, esp_websocket_event_data_t *data) {
    if (m_terminated.load()) {
      return;
    }
    switch (eventId) {
    case WEBSOCKET_EVENT_CONNECTED:
      m_connected = true;
      post(UpstreamEvent::Open);
      break;

    case WEBSOCKET_EVENT_DATA:
      onData(data);
      break;

    case WEBSOCKET_EVENT_ERROR: {
      int status = data ? data->error_handle.esp_ws_handshake_status_code : 0;
      if (!m_connected && status != 0 && status != 101) {
        post(UpstreamEvent::HandshakeFailed, status,
             "HTTP " + std::to_string(status));
      } else {
        post(UpstreamEvent::Error, 0, "socket error");
      }
      postClosedOnce(1006);
      break;
    }

    case WEBSOCKET_EVENT_DISCONNECTED:
      postClosedOnce(1006);
      break;

    case WEBSOCKET_EVENT_CLOSED:
      postClosedOnce(kWsCloseNoStatus);
      break;

    default:
      break;
    }
  }

  void onData(esp_websocket_event_data_t *data) {
    if (!data) {
      return;
    }
    uint8_t op = data->op_code;
    if (op == 0x08) {
      onCloseFrame(data);
      return;
    }
    if (!data->data_ptr || data->data_len <= 0) {
      return;
    }
    if (op == 0x01) {
      if (data->payload_offset == 0) {
        m_rxText.clear();
      }
      m_rxInText = true;
    } else if (op != 0x00 || !m_rxInText) {
      // 二进制、控制帧不转发
      return;
    }
    m_rxText.append(data->data_ptr, (size_t)data->data_len);

    const bool frameDone =
        data->payload_len <= 0 ||
        (data->payload_offset + data->data_len) >= data->payload_len;
    if (data->fin && frameDone) {
      post(UpstreamEvent::Text, 0, std::move(m_rxText));
      m_rxText.clear();
      m_rxInText = false;
    }
  }

  // 记下对端 close 帧里的关闭码和原因，随后的 CLOSED/DISCONNECTED 带上它
  void onCloseFrame(const esp_websocket_event_data_t *data) {
    int code = kWsCloseNoStatus;
    std::string reason;
    esp_err_t err = ParseWsClosePayload(
        reinterpret_cast<const uint8_t *>(data->data_ptr),
        data->data_ptr ? (size_t)data->data_len : 0, code, reason);
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "[fd %d] malformed close frame (%d bytes)", m_fd,
               data->data_len);
    }
    m_closeFrameSeen = true;
    m_closeCode = code;
    m_closeReason = std::move(reason);
    ESP_LOGI(TAG, "[fd %d] upstream close %d \"%s\"", m_fd, m_closeCode,
             m_closeReason.c_str());
  }

  void postClosedOnce(int fallbackCode) {
    if (m_closedPosted) {
      return;
    }
    m_closedPosted = true;
    if (m_closeFrameSeen) {
      post(UpstreamEvent::Closed, m_closeCode, std::move(m_closeReason));
    } else {
      post(UpstreamEvent::Closed, fallbackCode);
    }
  }

  void post(UpstreamEvent event, int status = 0,
            std::string &&text = std::string()) {
    m_server.postUpstream(m_fd, m_sessionId, event, status, std::move(text));
  }

  RelayServer &m_server;
  int m_fd;
  uint32_t m_sessionId;
  std::string m_headers;
  esp_websocket_client_handle_t m_client = nullptr;
  std::atomic<bool> m_terminated{false};
  bool m_connected = false;
  bool m_closedPosted = false;
  bool m_closeFrameSeen = false;
  int m_closeCode = kWsCloseNoStatus;
  std::string m_closeReason;
  bool m_rxInText = false;
  std::string m_rxText;
};

class RelayServer::EspUpstreamConnector : public UpstreamConnector {
public:
  EspUpstreamConnector(RelayServer &server, int fd, uint32_t sessionId)
      : m_server(server), m_fd(fd), m_sessionId(sessionId) {}

  std::unique_ptr<UpstreamChannel> connect(const std::string &url,
                                           const std::string &authorization,
                                           esp_err_t &err) override {
    std::unique_ptr<EspUpstreamChannel> channel(
        new EspUpstreamChannel(m_server, m_fd, m_sessionId));
    err = channel->connect(url, authorization);
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "[fd %d] upstream connect failed: %s", m_fd,
               esp_err_to_name(err));
      return nullptr;
    }
    return std::unique_ptr<UpstreamChannel>(std::move(channel));
  }

private:
  RelayServer &m_server;
  int m_fd;
  uint32_t m_sessionId;
};

/**
 * @brief 一个客户端 websocket 连接
 */
class RelayServer::Session : public ClientChannel {
public:
  Session(RelayServer &server, int fd, uint32_t id)
      : m_server(server), m_fd(fd), m_id(id),
        m_connector(server, fd, id),
        m_bridge(*this, m_connector, server.m_config.relay) {}

  esp_err_t sendText(const std::string &text) override {
    if (m_closing) {
      return ESP_ERR_INVALID_STATE;
    }
    httpd_ws_frame_t frame = {};
    frame.final = true;
    frame.type = HTTPD_WS_TYPE_TEXT;
    frame.payload = (uint8_t *)text.data();
    frame.len = text.size();
    esp_err_t err =
        httpd_ws_send_frame_async(m_server.m_server.load(), m_fd, &frame);
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "[fd %d] send failed: %s", m_fd, esp_err_to_name(err));
    }
    return err;
  }

  void close() override {
    if (m_closing) {
      return;
    }
    m_closing = true;
    esp_err_t err = httpd_sess_trigger_close(m_server.m_server.load(), m_fd);
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "[fd %d] close failed: %s", m_fd, esp_err_to_name(err));
    }
  }

  int fd() const { return m_fd; }
  uint32_t id() const { return m_id; }
  RelayBridge &bridge() { return m_bridge; }

private:
  RelayServer &m_server;
  int m_fd;
  uint32_t m_id;
  bool m_closing = false;
  EspUpstreamConnector m_connector;
  RelayBridge m_bridge; // 最后构造、最先析构
};

RelayServer &RelayServer::instance() {
  static RelayServer instance;
  return instance;
}

esp_err_t RelayServer::init(const RelayServerConfig &config) {
  if (m_initialized) {
    ESP_LOGW(TAG, "Already initialized");
    return ESP_OK;
  }
  if (config.relay.api_key.empty()) {
    // 仍然启动，客户端会在 session.update 时收到错误
    ESP_LOGW(TAG, "Upstream API key is empty");
  }
  m_config = config;
  m_initialized = true;
  return ESP_OK;
}

esp_err_t RelayServer::start() {
  if (!m_initialized) {
    return ESP_ERR_INVALID_STATE;
  }
  if (m_server.load() != nullptr) {
    return ESP_OK;
  }

  httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
  cfg.server_port = m_config.port;
  cfg.ctrl_port = m_config.port + 1;
  cfg.max_open_sockets = m_config.max_clients;
  cfg.max_uri_handlers = 4;
  cfg.stack_size = 8192;

  httpd_handle_t server = nullptr;
  esp_err_t err = httpd_start(&server, &cfg);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "httpd_start failed: %s", esp_err_to_name(err));
    return err;
  }

  httpd_uri_t health = {
      .uri = "/health",
      .method = HTTP_GET,
      .handler = &RelayServer::handleHealth,
      .user_ctx = this,
  };
  httpd_register_uri_handler(server, &health);

  httpd_uri_t realtime = {};
  realtime.uri = kRelayPath;
  realtime.method = HTTP_GET;
  realtime.handler = &RelayServer::handleRealtime;
  realtime.user_ctx = this;
  realtime.is_websocket = true;
  httpd_register_uri_handler(server, &realtime);

  httpd_register_err_handler(server, HTTPD_404_NOT_FOUND,
                             &RelayServer::handleNotFound);
  m_server.store(server);

  ESP_LOGI(TAG, "Relay listening on :%u%s (upstream %s)",
           (unsigned)m_config.port, kRelayPath,
           m_config.relay.upstream_base_url.c_str());
  return ESP_OK;
}

void RelayServer::stop() {
  httpd_handle_t server = m_server.exchange(nullptr);
  if (server == nullptr) {
    return;
  }
  httpd_stop(server);
}

esp_err_t RelayServer::handleHealth(httpd_req_t *req) {
  httpd_resp_set_type(req, "application/json");
  return httpd_resp_sendstr(req, "{\"ok\":true}");
}

esp_err_t RelayServer::handleNotFound(httpd_req_t *req, httpd_err_code_t err) {
  // 其他路径上的 websocket 升级：不回任何响应，直接断开
  char upgrade[16] = {};
  if (httpd_req_get_hdr_value_str(req, "Upgrade", upgrade, sizeof(upgrade)) ==
          ESP_OK &&
      IsWebSocketUpgrade(upgrade)) {
    ESP_LOGW(TAG, "Upgrade on %s rejected, closing socket", req->uri);
    return ESP_FAIL;
  }
  ESP_LOGW(TAG, "Rejected %s", req->uri);
  httpd_resp_send_err(req, HTTPD_404_NOT_FOUND, "Not Found");
  return ESP_FAIL; // 关闭连接
}

esp_err_t RelayServer::handleRealtime(httpd_req_t *req) {
  auto *self = static_cast<RelayServer *>(req->user_ctx);
  if (req->method == HTTP_GET) {
    // 握手
    return self->openSession(req);
  }

  auto *session = static_cast<Session *>(req->sess_ctx);
  if (!session) {
    ESP_LOGE(TAG, "Frame without session");
    return ESP_FAIL;
  }
  return self->receiveFrame(req, *session);
}

esp_err_t RelayServer::openSession(httpd_req_t *req) {
  const int fd = httpd_req_to_sockfd(req);
  const uint32_t id = m_nextSessionId.fetch_add(1);
  auto *session = new Session(*this, fd, id);
  req->sess_ctx = session;
  req->free_ctx = &RelayServer::freeSession;
  ESP_LOGI(TAG, "[fd %d] client connected (session %lu)", fd,
           (unsigned long)id);
  return ESP_OK;
}

esp_err_t RelayServer::receiveFrame(httpd_req_t *req, Session &session) {
  httpd_ws_frame_t frame = {};
  frame.type = HTTPD_WS_TYPE_TEXT;

  // 第一次只取长度
  esp_err_t err = httpd_ws_recv_frame(req, &frame, 0);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "[fd %d] recv header failed: %s", session.fd(),
             esp_err_to_name(err));
    return err;
  }
  if (frame.len == 0) {
    return ESP_OK;
  }

  uint8_t *buf = static_cast<uint8_t *>(malloc(frame.len + 1));
  if (!buf) {
    ESP_LOGE(TAG, "[fd %d] no memory for %u byte frame", session.fd(),
             (unsigned)frame.len);
    return ESP_ERR_NO_MEM;
  }
  frame.payload = buf;
  err = httpd_ws_recv_frame(req, &frame, frame.len);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "[fd %d] recv payload failed: %s", session.fd(),
             esp_err_to_name(err));
    free(buf);
    return err;
  }

  if (frame.type == HTTPD_WS_TYPE_TEXT) {
    std::string text(reinterpret_cast<const char *>(buf), frame.len);
    // 协议错误已回复给客户端，连接本身保持
    session.bridge().onClientText(text);
  } else {
    ESP_LOGW(TAG, "[fd %d] ignore ws frame type %d", session.fd(),
             (int)frame.type);
  }
  free(buf);
  return ESP_OK;
}

void RelayServer::freeSession(void *ctx) {
  auto *session = static_cast<Session *>(ctx);
  if (!session) {
    return;
  }
  ESP_LOGI(TAG, "[fd %d] client gone (session %lu)", session->fd(),
           (unsigned long)session->id());
  session->bridge().onClientClosed();
  delete session;
}

void RelayServer::postUpstream(int fd, uint32_t sessionId,
                               UpstreamEvent event, int status,
                               std::string &&text) {
  httpd_handle_t server = m_server.load();
  if (server == nullptr) {
    return;
  }
  auto *work = new UpstreamWork{this, fd, sessionId, event, status,
                                std::move(text)};
  if (httpd_queue_work(server, &RelayServer::runUpstreamWork, work) != ESP_OK) {
    ESP_LOGW(TAG, "[fd %d] dropped upstream event %d", fd, (int)event);
    delete work;
  }
}

void RelayServer::runUpstreamWork(void *arg) {
  std::unique_ptr<UpstreamWork> work(static_cast<UpstreamWork *>(arg));
  httpd_handle_t server = work->server->m_server.load();
  if (server == nullptr) {
    return;
  }

  auto *session = static_cast<Session *>(httpd_sess_get_ctx(server, work->fd));
  // fd 可能已被新连接复用
  if (!session || session->id() != work->session_id) {
    ESP_LOGD(TAG, "[fd %d] stale upstream event dropped", work->fd);
    return;
  }

  RelayBridge &bridge = session->bridge();
  switch (work->event) {
  case UpstreamEvent::Open:
    bridge.onUpstreamOpen();
    break;
  case UpstreamEvent::Text:
    bridge.onUpstreamText(work->text);
    break;
  case UpstreamEvent::HandshakeFailed:
    bridge.onUpstreamHandshakeFailed(work->status, work->text);
    break;
  case UpstreamEvent::Closed:
    bridge.onUpstreamClosed(work->status, work->text);
    break;
  case UpstreamEvent::Error:
    bridge.onUpstreamError(work->text);
    break;
  }
}
