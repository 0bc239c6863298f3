#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "seam_config.h"
#include "seam_err.h"
#include "wifi_station.h"

#if CONFIG_SEAM_ROLE_RELAY
#include "relay_server.h"
#else
#include "audio_pipeline.h"
#include "cloud_translate.h"
#include "cloud_tts.h"
#include "push_button.h"
#include "relay_link.h"
#include "talk_controller.h"
#include "voice_player.h"
#endif

#include <string.h>

static const char *TAG = "main";

#if CONFIG_SEAM_ROLE_RELAY

static esp_err_t startRelay() {
  RelayConfig relay;
  relay.api_key = CONFIG_SEAM_UPSTREAM_API_KEY;
  if (strlen(CONFIG_SEAM_UPSTREAM_BASE_URL) > 0) {
    relay.upstream_base_url = CONFIG_SEAM_UPSTREAM_BASE_URL;
  }
  if (strlen(CONFIG_SEAM_UPSTREAM_MODEL) > 0) {
    relay.default_model = CONFIG_SEAM_UPSTREAM_MODEL;
  }

  auto &server = RelayServer::instance();
  esp_err_t ret = server.init({
      .port = CONFIG_SEAM_RELAY_PORT,
      .max_clients = 4,
      .relay = relay,
  });
  if (ret != ESP_OK) {
    return ret;
  }
  return server.start();
}

#else

static esp_err_t startClient() {
  const SessionMode mode = CONFIG_SEAM_SESSION_MODE_AUTO
                               ? SessionMode::AutoDetect
                               : SessionMode::FixedSides;

  // 译文播报（可选）
  esp_err_t ret = VoicePlayer::instance().init({
      .bck_io = (gpio_num_t)CONFIG_SEAM_SPK_BCK_GPIO,
      .ws_io = (gpio_num_t)CONFIG_SEAM_SPK_WS_GPIO,
      .dout_io = (gpio_num_t)CONFIG_SEAM_SPK_DOUT_GPIO,
      .port = 1,
  });
  if (ret != ESP_OK) {
    ESP_LOGW(TAG, "Voice player init failed: %s, playback disabled",
             esp_err_to_name(ret));
  } else {
    VoicePlayer::instance().setCallback([](VoicePlayerState state) {
      ESP_LOGD(TAG, "Playback %s",
               state == VoicePlayerState::Playing ? "started" : "idle");
    });
  }
  CloudTts::instance().init({
      .url = ret == ESP_OK ? CONFIG_SEAM_TTS_URL : "",
      .timeout_ms = 15000,
      .max_response_bytes = 1024 * 1024,
  });
  CloudTranslate::instance().init({
      .url = CONFIG_SEAM_TRANSLATE_URL,
      .timeout_ms = 30000,
  });

  ret = AudioPipeline::instance().init({
      .port = 0,
      .bck_io = CONFIG_SEAM_MIC_BCK_GPIO,
      .ws_io = CONFIG_SEAM_MIC_WS_GPIO,
      .din_io = CONFIG_SEAM_MIC_DIN_GPIO,
      .native_sample_rate_hz = CONFIG_SEAM_MIC_SAMPLE_RATE_HZ,
  });
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "Audio pipeline init failed: %s", seam_err_to_name(ret));
    return ret;
  }

  ret = RelayLink::instance().init({.url = CONFIG_SEAM_RELAY_URL});
  if (ret != ESP_OK) {
    return ret;
  }

  TalkControllerConfig ctlCfg;
  ctlCfg.session.mode = mode;
  ctlCfg.session.side_a_lang = CONFIG_SEAM_SIDE_A_LANG;
  ctlCfg.session.side_b_lang = CONFIG_SEAM_SIDE_B_LANG;
  ctlCfg.session.finalize_timeout_ms = CONFIG_SEAM_FINALIZE_TIMEOUT_MS;

  auto &ctl = TalkController::instance();
  ret = ctl.init(ctlCfg);
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "Talk controller init failed: %s", seam_err_to_name(ret));
    return ret;
  }
  ctl.setOnTurnUpdated([](const Turn &turn) {
    if (!turn.finalized) {
      ESP_LOGI(TAG, "[#%lu %s] ... %s", (unsigned long)turn.id,
               GetSideName(turn.side), turn.partial_text.c_str());
    } else if (turn.translation == TranslationStatus::Done) {
      ESP_LOGI(TAG, "[#%lu %s] %s (%s) -> %s (%s)", (unsigned long)turn.id,
               GetSideName(turn.side), turn.final_text.c_str(),
               turn.source_lang.c_str(), turn.translated_text.c_str(),
               turn.target_lang.c_str());
    } else {
      ESP_LOGI(TAG, "[#%lu %s] %s%s", (unsigned long)turn.id,
               GetSideName(turn.side), turn.final_text.c_str(),
               turn.translation == TranslationStatus::Failed
                   ? " (translation failed)"
                   : "");
    }
  });
  ret = ctl.start();
  if (ret != ESP_OK) {
    return ret;
  }

  // 自动识别模式只用一个按钮
  auto &buttons = PushButtons::instance();
  ret = buttons.init({
      .side_a_gpio = (gpio_num_t)CONFIG_SEAM_BUTTON_A_GPIO,
      .side_b_gpio = mode == SessionMode::AutoDetect
                         ? GPIO_NUM_NC
                         : (gpio_num_t)CONFIG_SEAM_BUTTON_B_GPIO,
  });
  if (ret != ESP_OK) {
    return ret;
  }
  // 按下说话时先停掉译文播报，免得喇叭声进麦克风
  buttons.setOnPress([](Side side) {
    VoicePlayer::instance().stopAll();
    TalkController::instance().pressDown(side);
  });
  buttons.setOnRelease([](Side) { TalkController::instance().pressUp(); });
  ret = buttons.start();
  if (ret != ESP_OK) {
    return ret;
  }

  ESP_LOGI(TAG, "  模式: %s", GetSessionModeName(mode));
  ESP_LOGI(TAG, "  A: %s  B: %s", CONFIG_SEAM_SIDE_A_LANG,
           CONFIG_SEAM_SIDE_B_LANG);
  ESP_LOGI(TAG, "  中继: %s", CONFIG_SEAM_RELAY_URL);
  return ESP_OK;
}

#endif

extern "C" void app_main(void) {
  ESP_LOGI(TAG, "========================================");
  ESP_LOGI(TAG, "    双语对讲翻译 (%s)",
           CONFIG_SEAM_ROLE_RELAY ? "relay" : "client");
  ESP_LOGI(TAG, "========================================");

  auto &wifi = WifiStation::instance();
  wifi.setLinkCallback([](LinkState state) {
    ESP_LOGI(TAG, "WiFi link %s", GetLinkStateName(state));
  });
  esp_err_t ret = wifi.init({
      .ssid = CONFIG_SEAM_WIFI_SSID,
      .password = CONFIG_SEAM_WIFI_PASSWORD,
      .first_join_attempts = 5,
  });
  if (ret == ESP_OK) {
    ret = wifi.join(CONFIG_SEAM_WIFI_CONNECT_TIMEOUT_MS);
  }
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "WiFi not available: %s", esp_err_to_name(ret));
    return;
  }
  ESP_LOGI(TAG, "IP: %s", wifi.getIpAddress().c_str());

#if CONFIG_SEAM_ROLE_RELAY
  ret = startRelay();
#else
  ret = startClient();
#endif
  if (ret != ESP_OK) {
    ESP_LOGE(TAG, "启动失败: %s", seam_err_to_name(ret));
    return;
  }

  ESP_LOGI(TAG, "  系统已就绪!");
  ESP_LOGI(TAG, "========================================");
}
