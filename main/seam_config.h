#pragma once

#include "sdkconfig.h"

// 未在 sdkconfig 中给出的项使用下面的默认值

#ifndef CONFIG_SEAM_ROLE_RELAY
#define CONFIG_SEAM_ROLE_RELAY 0
#endif

#ifndef CONFIG_SEAM_WIFI_SSID
#define CONFIG_SEAM_WIFI_SSID ""
#endif
#ifndef CONFIG_SEAM_WIFI_PASSWORD
#define CONFIG_SEAM_WIFI_PASSWORD ""
#endif
#ifndef CONFIG_SEAM_WIFI_CONNECT_TIMEOUT_MS
#define CONFIG_SEAM_WIFI_CONNECT_TIMEOUT_MS 20000
#endif

// ---- 客户端 ----
#ifndef CONFIG_SEAM_RELAY_URL
#define CONFIG_SEAM_RELAY_URL "ws://192.168.1.10:8080/api/v1/asr/realtime"
#endif
#ifndef CONFIG_SEAM_TRANSLATE_URL
#define CONFIG_SEAM_TRANSLATE_URL ""
#endif
#ifndef CONFIG_SEAM_TTS_URL
#define CONFIG_SEAM_TTS_URL ""
#endif
#ifndef CONFIG_SEAM_SESSION_MODE_AUTO
#define CONFIG_SEAM_SESSION_MODE_AUTO 0
#endif
#ifndef CONFIG_SEAM_SIDE_A_LANG
#define CONFIG_SEAM_SIDE_A_LANG "zh"
#endif
#ifndef CONFIG_SEAM_SIDE_B_LANG
#define CONFIG_SEAM_SIDE_B_LANG "en"
#endif
#ifndef CONFIG_SEAM_FINALIZE_TIMEOUT_MS
#define CONFIG_SEAM_FINALIZE_TIMEOUT_MS 3000
#endif
#ifndef CONFIG_SEAM_BUTTON_A_GPIO
#define CONFIG_SEAM_BUTTON_A_GPIO 4
#endif
#ifndef CONFIG_SEAM_BUTTON_B_GPIO
#define CONFIG_SEAM_BUTTON_B_GPIO 5
#endif
#ifndef CONFIG_SEAM_MIC_BCK_GPIO
#define CONFIG_SEAM_MIC_BCK_GPIO 41
#endif
#ifndef CONFIG_SEAM_MIC_WS_GPIO
#define CONFIG_SEAM_MIC_WS_GPIO 42
#endif
#ifndef CONFIG_SEAM_MIC_DIN_GPIO
#define CONFIG_SEAM_MIC_DIN_GPIO 2
#endif
#ifndef CONFIG_SEAM_MIC_SAMPLE_RATE_HZ
#define CONFIG_SEAM_MIC_SAMPLE_RATE_HZ 48000
#endif
#ifndef CONFIG_SEAM_SPK_BCK_GPIO
#define CONFIG_SEAM_SPK_BCK_GPIO 15
#endif
#ifndef CONFIG_SEAM_SPK_WS_GPIO
#define CONFIG_SEAM_SPK_WS_GPIO 16
#endif
#ifndef CONFIG_SEAM_SPK_DOUT_GPIO
#define CONFIG_SEAM_SPK_DOUT_GPIO 17
#endif

// ---- 中继 ----
#ifndef CONFIG_SEAM_RELAY_PORT
#define CONFIG_SEAM_RELAY_PORT 8080
#endif
#ifndef CONFIG_SEAM_UPSTREAM_API_KEY
#define CONFIG_SEAM_UPSTREAM_API_KEY ""
#endif
#ifndef CONFIG_SEAM_UPSTREAM_BASE_URL
#define CONFIG_SEAM_UPSTREAM_BASE_URL ""
#endif
#ifndef CONFIG_SEAM_UPSTREAM_MODEL
#define CONFIG_SEAM_UPSTREAM_MODEL ""
#endif
