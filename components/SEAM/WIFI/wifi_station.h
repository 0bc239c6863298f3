#pragma once

#include "esp_err.h"
#include "esp_event.h"
#include "esp_netif.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"

#include <functional>
#include <string>

enum class LinkState { Down = 0, Joining, Up, GaveUp };

inline const char *GetLinkStateName(LinkState state) {
  switch (state) {
  case LinkState::Down:
    return "Down";
  case LinkState::Joining:
    return "Joining";
  case LinkState::Up:
    return "Up";
  case LinkState::GaveUp:
    return "GaveUp";
  }
  return "Unknown";
}

struct WifiStationConfig {
  std::string ssid;
  std::string password;
  int first_join_attempts = 5;  ///< 首次入网失败几次后放弃
  int backoff_min_ms = 500;     ///< 断线重连退避，逐次翻倍
  int backoff_max_ms = 8000;
};

/**
 * @brief WiFi Station（单例）
 *
 * 首次入网有次数限制；入网成功后任何断线都按指数退避无限重连，
 * 语音流对延迟敏感，省电模式关闭。
 */
class WifiStation {
public:
  using LinkCallback = std::function<void(LinkState state)>;

  static WifiStation &instance();

  WifiStation(const WifiStation &) = delete;
  WifiStation &operator=(const WifiStation &) = delete;
  WifiStation(WifiStation &&) = delete;
  WifiStation &operator=(WifiStation &&) = delete;

  esp_err_t init(const WifiStationConfig &config);

  /**
   * @brief 启动并等到拿到 IP
   * @return ESP_OK；ESP_ERR_TIMEOUT 超时；ESP_FAIL 首次入网次数耗尽
   */
  esp_err_t join(int timeoutMs);

  LinkState getState() const { return m_state; }
  bool isUp() const { return m_state == LinkState::Up; }
  std::string getIpAddress() const;
  /// 最近一次断线原因（wifi_err_reason_t）
  int lastDisconnectReason() const { return m_lastReason; }

  void setLinkCallback(LinkCallback callback) { m_callback = callback; }

private:
  WifiStation() = default;
  ~WifiStation() = default;

  static void onEvent(void *arg, esp_event_base_t base, int32_t id,
                      void *data);
  static void onBackoffTimer(void *arg);

  esp_err_t prepareStack();
  void onDisconnected(int reason);
  void onGotIp(const esp_ip4_addr_t &ip);
  void setState(LinkState state);

  WifiStationConfig m_config;
  bool m_initialized = false;
  volatile LinkState m_state = LinkState::Down;
  bool m_everUp = false;
  int m_failures = 0;
  int m_backoffMs = 0;
  int m_lastReason = 0;
  LinkCallback m_callback;

  esp_netif_t *m_netif = nullptr;
  EventGroupHandle_t m_events = nullptr;
  esp_timer_handle_t m_backoffTimer = nullptr;
  esp_ip4_addr_t m_ip = {};

  static constexpr EventBits_t UP_BIT = BIT0;
  static constexpr EventBits_t GAVE_UP_BIT = BIT1;
};
