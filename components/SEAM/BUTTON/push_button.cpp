#include "push_button.h"
#include "esp_log.h"
#include "esp_timer.h"

static const char *TAG = "PushButtons";

PushButtons &PushButtons::instance() {
  static PushButtons instance;
  return instance;
}

esp_err_t PushButtons::configurePin(gpio_num_t pin, bool activeHigh) {
  gpio_config_t conf = {
      .pin_bit_mask = (1ULL << pin),
      .mode = GPIO_MODE_INPUT,
      .pull_up_en = activeHigh ? GPIO_PULLUP_DISABLE : GPIO_PULLUP_ENABLE,
      .pull_down_en = activeHigh ? GPIO_PULLDOWN_ENABLE : GPIO_PULLDOWN_DISABLE,
      .intr_type = GPIO_INTR_DISABLE,
  };
  return gpio_config(&conf);
}

esp_err_t PushButtons::init(const PushButtonConfig &config) {
  if (m_initialized) {
    return ESP_OK;
  }
  if (config.side_a_gpio == GPIO_NUM_NC) {
    ESP_LOGE(TAG, "Side A button GPIO not set");
    return ESP_ERR_INVALID_ARG;
  }

  m_config = config;
  m_keyCount = 0;

  const gpio_num_t pins[2] = {config.side_a_gpio, config.side_b_gpio};
  const Side sides[2] = {Side::A, Side::B};
  for (int i = 0; i < 2; ++i) {
    if (pins[i] == GPIO_NUM_NC) {
      continue;
    }
    esp_err_t err = configurePin(pins[i], config.active_high);
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "gpio_config(%d) failed: %s", pins[i],
               esp_err_to_name(err));
      return err;
    }
    Key &key = m_keys[m_keyCount++];
    key.gpio = pins[i];
    key.side = sides[i];
    ESP_LOGI(TAG, "Button %s on GPIO %d", GetSideName(key.side), pins[i]);
  }

  m_initialized = true;
  return ESP_OK;
}

esp_err_t PushButtons::start() {
  if (!m_initialized) {
    return ESP_ERR_INVALID_STATE;
  }
  if (m_task) {
    return ESP_OK;
  }
  BaseType_t ok = xTaskCreate(pollTask, "ptt_buttons", m_config.task_stack,
                              this, m_config.task_priority, &m_task);
  return ok == pdPASS ? ESP_OK : ESP_ERR_NO_MEM;
}

bool PushButtons::readPressed(const Key &key) const {
  int level = gpio_get_level(key.gpio);
  return m_config.active_high ? level == 1 : level == 0;
}

void PushButtons::poll(Key &key, uint32_t nowMs) {
  bool raw = readPressed(key);
  if (raw != key.raw) {
    key.raw = raw;
    key.changed_ms = nowMs;
    return;
  }
  if (raw == key.stable || nowMs - key.changed_ms < m_config.debounce_ms) {
    return;
  }
  key.stable = raw;

  const int index = static_cast<int>(&key - m_keys);
  if (raw) {
    if (m_held >= 0) {
      ESP_LOGD(TAG, "Ignore %s, %s is held", GetSideName(key.side),
               GetSideName(m_keys[m_held].side));
      return;
    }
    m_held = index;
    if (m_onPress) {
      m_onPress(key.side);
    }
  } else if (m_held == index) {
    m_held = -1;
    if (m_onRelease) {
      m_onRelease(key.side);
    }
  }
}

void PushButtons::pollTask(void *arg) {
  auto *self = static_cast<PushButtons *>(arg);
  const TickType_t period = pdMS_TO_TICKS(self->m_config.poll_interval_ms);
  while (true) {
    const uint32_t nowMs = (uint32_t)(esp_timer_get_time() / 1000);
    for (int i = 0; i < self->m_keyCount; ++i) {
      self->poll(self->m_keys[i], nowMs);
    }
    vTaskDelay(period > 0 ? period : 1);
  }
}
