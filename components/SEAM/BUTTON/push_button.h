#pragma once

#include "driver/gpio.h"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "language_route.h"

#include <functional>

struct PushButtonConfig {
  gpio_num_t side_a_gpio = GPIO_NUM_4;
  gpio_num_t side_b_gpio = GPIO_NUM_NC; ///< 单按钮（自动识别）时不接
  bool active_high = true;              ///< 按键接 VCC，内部下拉
  uint32_t poll_interval_ms = 10;
  uint32_t debounce_ms = 30;
  uint32_t task_stack = 2048;
  UBaseType_t task_priority = 6;
};

/**
 * @brief 按住说话按钮（轮询 + 消抖）
 *
 * 两个按钮同时按住时只上报先按下的那个，松开它才算 release。
 */
class PushButtons {
public:
  using PressCallback = std::function<void(Side side)>;
  using ReleaseCallback = std::function<void(Side side)>;

  static PushButtons &instance();

  PushButtons(const PushButtons &) = delete;
  PushButtons &operator=(const PushButtons &) = delete;

  esp_err_t init(const PushButtonConfig &config);
  esp_err_t start();

  void setOnPress(PressCallback cb) { m_onPress = cb; }
  void setOnRelease(ReleaseCallback cb) { m_onRelease = cb; }

private:
  PushButtons() = default;
  ~PushButtons() = default;

  struct Key {
    gpio_num_t gpio = GPIO_NUM_NC;
    Side side = Side::A;
    bool stable = false; // 消抖后的状态
    bool raw = false;
    uint32_t changed_ms = 0;
  };

  static esp_err_t configurePin(gpio_num_t pin, bool activeHigh);
  bool readPressed(const Key &key) const;
  void poll(Key &key, uint32_t nowMs);
  static void pollTask(void *arg);

  PushButtonConfig m_config;
  Key m_keys[2];
  int m_keyCount = 0;
  int m_held = -1; // 当前上报为按下的 key 下标
  bool m_initialized = false;
  TaskHandle_t m_task = nullptr;

  PressCallback m_onPress;
  ReleaseCallback m_onRelease;
};
