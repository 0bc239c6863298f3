#include "relay_bridge.h"

#include "esp_log.h"
#include "seam_err.h"

static const char *TAG = "RelayBridge";

RelayBridge::RelayBridge(ClientChannel &client, UpstreamConnector &connector,
                         const RelayConfig &config)
    : m_client(client), m_connector(connector), m_config(config),
      m_session(config.session_defaults) {}

RelayBridge::~RelayBridge() { closeUpstream(); }

// ==================== 客户端 -> 上游 ====================

esp_err_t RelayBridge::onClientText(const std::string &text) {
  if (m_clientClosed) {
    return ESP_ERR_INVALID_STATE;
  }

  ClientMessage msg;
  esp_err_t err = ParseClientMessage(text, m_config.session_defaults, msg);
  if (err == ESP_ERR_INVALID_ARG) {
    ESP_LOGW(TAG, "Invalid JSON from client (%u bytes)", (unsigned)text.size());
    sendError("Invalid JSON from client");
    return SEAM_ERR_PROTOCOL_VIOLATION;
  }

  if (m_state == UpstreamState::None) {
    if (msg.type != ClientMessageType::SessionUpdate) {
      ESP_LOGW(TAG, "First message is %s, rejected",
               msg.type_name.empty() ? "(untyped)" : msg.type_name.c_str());
      sendError("First message must be session.update");
      return SEAM_ERR_PROTOCOL_VIOLATION;
    }
    if (err != ESP_OK) {
      sendError("Invalid session.update", "unknown session mode");
      return SEAM_ERR_PROTOCOL_VIOLATION;
    }
    return startUpstream(text, msg);
  }

  if (msg.type == ClientMessageType::SessionUpdate) {
    // 会话配置在一个连接内不可变
    ESP_LOGW(TAG, "Repeated session.update ignored");
    sendError("session.update already received");
    return SEAM_ERR_PROTOCOL_VIOLATION;
  }

  forward(text);
  return ESP_OK;
}

esp_err_t RelayBridge::startUpstream(const std::string &text,
                                     const ClientMessage &msg) {
  m_session = msg.session;
  if (m_session.model.empty()) {
    m_session.model = m_config.default_model;
  }

  if (m_config.api_key.empty()) {
    ESP_LOGE(TAG, "Upstream credential not configured");
    sendError("Missing upstream credential");
    m_state = UpstreamState::Closed;
    closeClient();
    return SEAM_ERR_MISSING_CREDENTIAL;
  }

  const char sep =
      m_config.upstream_base_url.find('?') == std::string::npos ? '?' : '&';
  m_url = m_config.upstream_base_url + sep + "model=" + m_session.model;

  ESP_LOGI(TAG, "Connecting upstream %s (mode=%s, A=%s, B=%s)", m_url.c_str(),
           GetSessionModeName(m_session.mode), m_session.side_a_lang.c_str(),
           m_session.side_b_lang.c_str());

  m_state = UpstreamState::Connecting;
  m_pending.clear();
  m_pending.push_back(text);

  esp_err_t err = ESP_OK;
  m_upstream = m_connector.connect(m_url, "Bearer " + m_config.api_key, err);
  if (!m_upstream || err != ESP_OK) {
    if (err == ESP_OK) {
      err = ESP_FAIL;
    }
    ESP_LOGE(TAG, "Upstream connect failed: %s", seam_err_to_name(err));
    m_upstream.reset();
    m_state = UpstreamState::Closed;
    m_pending.clear();
    sendError("Upstream error: connect failed", seam_err_to_name(err));
    closeClient();
    return SEAM_ERR_UPSTREAM_TRANSPORT;
  }
  return ESP_OK;
}

void RelayBridge::forward(const std::string &text) {
  switch (m_state) {
  case UpstreamState::Open:
    if (m_upstream->send(text) != ESP_OK) {
      ESP_LOGW(TAG, "Upstream send failed");
    }
    break;

  case UpstreamState::Connecting:
    if (!m_config.buffer_until_open) {
      break;
    }
    if (m_pending.size() >= m_config.max_pending_messages) {
      if (m_dropped++ == 0) {
        ESP_LOGW(TAG, "Pending queue full (%u), dropping",
                 (unsigned)m_pending.size());
      }
      break;
    }
    m_pending.push_back(text);
    break;

  default:
    // 上游已关闭：静默丢弃
    ESP_LOGD(TAG, "Upstream %s, message dropped",
             GetUpstreamStateName(m_state));
    break;
  }
}

void RelayBridge::onClientClosed() {
  if (m_clientClosed) {
    return;
  }
  ESP_LOGI(TAG, "Client closed");
  m_clientClosed = true;
  closeUpstream();
  m_pending.clear();
}

// ==================== 上游 -> 客户端 ====================

void RelayBridge::onUpstreamOpen() {
  if (m_state != UpstreamState::Connecting) {
    return;
  }
  ESP_LOGI(TAG, "Upstream open, flushing %u message(s)",
           (unsigned)m_pending.size());
  m_state = UpstreamState::Open;
  size_t failed = 0;
  while (!m_pending.empty()) {
    if (m_upstream->send(m_pending.front()) != ESP_OK) {
      failed++;
    }
    m_pending.pop_front();
  }
  if (failed > 0) {
    ESP_LOGW(TAG, "Upstream send failed for %u buffered message(s)",
             (unsigned)failed);
  }
}

void RelayBridge::onUpstreamText(const std::string &text) {
  if (m_clientClosed) {
    return;
  }

  std::string annotatedText;
  bool annotated = false;
  esp_err_t err = AnnotateUpstreamEvent(text, m_session, annotatedText, annotated);
  if (err != ESP_OK || !annotated) {
    // 非 JSON 或非 completed 事件原样转发
    m_client.sendText(text);
    return;
  }
  m_client.sendText(annotatedText);
}

void RelayBridge::onUpstreamHandshakeFailed(int status, const std::string &body) {
  ESP_LOGE(TAG, "Upstream handshake failed. Status: %d, Body: %s", status,
           body.c_str());
  if (!m_clientClosed) {
    sendError("Upstream Handshake failed: " + std::to_string(status), body);
  }
  closeUpstream();
  m_pending.clear();
  closeClient();
}

void RelayBridge::onUpstreamClosed(int code, const std::string &reason) {
  ESP_LOGI(TAG, "Upstream closed. code=%d, reason=%s", code, reason.c_str());
  m_state = UpstreamState::Closed;
  m_pending.clear();

  if (!m_clientClosed && !m_finishedSent) {
    m_finishedSent = true;
    m_client.sendText(BuildSessionFinished(reason));
  }
  closeClient();
}

void RelayBridge::onUpstreamError(const std::string &message) {
  ESP_LOGE(TAG, "Upstream error: %s", message.c_str());
  if (!m_clientClosed) {
    sendError("Upstream error: " + message);
  }
}

// ==================== 内部 ====================

void RelayBridge::sendError(const std::string &message,
                            const std::string &detail) {
  m_client.sendText(BuildErrorMessage(message, detail));
}

void RelayBridge::closeUpstream() {
  if (m_upstream && (m_state == UpstreamState::Connecting ||
                     m_state == UpstreamState::Open)) {
    m_upstream->terminate();
  }
  if (m_state != UpstreamState::None) {
    m_state = UpstreamState::Closed;
  }
}

void RelayBridge::closeClient() {
  if (m_clientClosed) {
    return;
  }
  m_clientClosed = true;
  m_client.close();
  closeUpstream();
}
