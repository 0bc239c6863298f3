#include "wifi_station.h"

#include "esp_log.h"
#include "esp_wifi.h"
#include "nvs_flash.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

static const char *TAG = "WifiStation";

WifiStation &WifiStation::instance() {
  static WifiStation instance;
  return instance;
}

// ==================== 事件 ====================

void WifiStation::onEvent(void *arg, esp_event_base_t base, int32_t id,
                          void *data) {
  auto *self = static_cast<WifiStation *>(arg);

  if (base == WIFI_EVENT && id == WIFI_EVENT_STA_START) {
    self->setState(LinkState::Joining);
    esp_wifi_connect();
  } else if (base == WIFI_EVENT && id == WIFI_EVENT_STA_DISCONNECTED) {
    auto *info = static_cast<wifi_event_sta_disconnected_t *>(data);
    self->onDisconnected(info ? info->reason : 0);
  } else if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP) {
    self->onGotIp(static_cast<ip_event_got_ip_t *>(data)->ip_info.ip);
  }
}

void WifiStation::onDisconnected(int reason) {
  m_lastReason = reason;

  if (!m_everUp) {
    if (++m_failures >= m_config.first_join_attempts) {
      ESP_LOGE(TAG, "Join %s failed %d times (reason %d), giving up",
               m_config.ssid.c_str(), m_failures, reason);
      setState(LinkState::GaveUp);
      xEventGroupSetBits(m_events, GAVE_UP_BIT);
      return;
    }
    ESP_LOGI(TAG, "Join attempt %d/%d failed (reason %d)", m_failures,
             m_config.first_join_attempts, reason);
    esp_wifi_connect();
    return;
  }

  // 入网成功过：退避重连，永不放弃
  xEventGroupClearBits(m_events, UP_BIT);
  setState(LinkState::Joining);
  m_backoffMs = m_backoffMs == 0
                    ? m_config.backoff_min_ms
                    : std::min(m_backoffMs * 2, m_config.backoff_max_ms);
  ESP_LOGW(TAG, "Link lost (reason %d), rejoin in %d ms", reason, m_backoffMs);
  esp_timer_stop(m_backoffTimer);
  esp_timer_start_once(m_backoffTimer, (uint64_t)m_backoffMs * 1000);
}

void WifiStation::onBackoffTimer(void *arg) {
  auto *self = static_cast<WifiStation *>(arg);
  if (self->m_state == LinkState::Joining) {
    esp_wifi_connect();
  }
}

void WifiStation::onGotIp(const esp_ip4_addr_t &ip) {
  m_ip = ip;
  m_everUp = true;
  m_failures = 0;
  m_backoffMs = 0;
  ESP_LOGI(TAG, "Link up, IP " IPSTR, IP2STR(&m_ip));
  setState(LinkState::Up);
  xEventGroupSetBits(m_events, UP_BIT);
}

void WifiStation::setState(LinkState state) {
  if (m_state == state) {
    return;
  }
  m_state = state;
  if (m_callback) {
    m_callback(state);
  }
}

// ==================== 初始化 ====================

esp_err_t WifiStation::prepareStack() {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_LOGW(TAG, "NVS partition stale, erasing");
    err = nvs_flash_erase();
    if (err == ESP_OK) {
      err = nvs_flash_init();
    }
  }
  if (err != ESP_OK) {
    return err;
  }

  // netif 和默认事件循环可能已被别的模块建好
  err = esp_netif_init();
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    return err;
  }
  err = esp_event_loop_create_default();
  if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
    return err;
  }

  m_netif = esp_netif_create_default_wifi_sta();
  if (m_netif == nullptr) {
    return ESP_FAIL;
  }

  wifi_init_config_t initCfg = WIFI_INIT_CONFIG_DEFAULT();
  return esp_wifi_init(&initCfg);
}

esp_err_t WifiStation::init(const WifiStationConfig &config) {
  if (m_initialized) {
    return ESP_OK;
  }
  if (config.ssid.empty() || config.first_join_attempts <= 0) {
    return ESP_ERR_INVALID_ARG;
  }
  m_config = config;

  m_events = xEventGroupCreate();
  if (m_events == nullptr) {
    return ESP_ERR_NO_MEM;
  }

  esp_err_t err = prepareStack();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "WiFi stack init failed: %s", esp_err_to_name(err));
    return err;
  }

  esp_timer_create_args_t timerArgs = {};
  timerArgs.callback = &WifiStation::onBackoffTimer;
  timerArgs.arg = this;
  timerArgs.name = "wifi_backoff";
  err = esp_timer_create(&timerArgs, &m_backoffTimer);
  if (err == ESP_OK) {
    err = esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID,
                                              &onEvent, this, nullptr);
  }
  if (err == ESP_OK) {
    err = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP,
                                              &onEvent, this, nullptr);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Event setup failed: %s", esp_err_to_name(err));
    return err;
  }

  wifi_config_t sta = {};
  strncpy(reinterpret_cast<char *>(sta.sta.ssid), m_config.ssid.c_str(),
          sizeof(sta.sta.ssid) - 1);
  strncpy(reinterpret_cast<char *>(sta.sta.password),
          m_config.password.c_str(), sizeof(sta.sta.password) - 1);
  sta.sta.threshold.authmode =
      m_config.password.empty() ? WIFI_AUTH_OPEN : WIFI_AUTH_WPA2_PSK;
  sta.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;

  err = esp_wifi_set_mode(WIFI_MODE_STA);
  if (err == ESP_OK) {
    err = esp_wifi_set_config(WIFI_IF_STA, &sta);
  }
  if (err == ESP_OK) {
    err = esp_wifi_set_ps(WIFI_PS_NONE);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "STA config failed: %s", esp_err_to_name(err));
    return err;
  }

  m_initialized = true;
  return ESP_OK;
}

esp_err_t WifiStation::join(int timeoutMs) {
  if (!m_initialized) {
    return ESP_ERR_INVALID_STATE;
  }
  if (m_state == LinkState::Up) {
    return ESP_OK;
  }

  m_failures = 0;
  xEventGroupClearBits(m_events, UP_BIT | GAVE_UP_BIT);
  esp_err_t err = m_state == LinkState::Down ? esp_wifi_start()
                                             : esp_wifi_connect();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "WiFi start failed: %s", esp_err_to_name(err));
    return err;
  }

  ESP_LOGI(TAG, "Joining %s ...", m_config.ssid.c_str());
  EventBits_t bits = xEventGroupWaitBits(m_events, UP_BIT | GAVE_UP_BIT,
                                         pdFALSE, pdFALSE,
                                         pdMS_TO_TICKS(timeoutMs));
  if (bits & UP_BIT) {
    return ESP_OK;
  }
  if (bits & GAVE_UP_BIT) {
    return ESP_FAIL;
  }
  ESP_LOGE(TAG, "Join %s timed out after %d ms", m_config.ssid.c_str(),
           timeoutMs);
  return ESP_ERR_TIMEOUT;
}

std::string WifiStation::getIpAddress() const {
  if (!isUp()) {
    return "";
  }
  char buf[16];
  snprintf(buf, sizeof(buf), IPSTR, IP2STR(&m_ip));
  return buf;
}
