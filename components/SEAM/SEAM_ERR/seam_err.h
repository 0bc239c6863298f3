#pragma once

#include "esp_err.h"

/**
 * @brief 项目错误码区间
 *
 * 与 ESP-IDF 各组件的做法一致：在 esp_err_t 上划出独立的错误码段，
 * 统一通过 esp_err_t 向上返回。
 */
#define SEAM_ERR_BASE 0x7A000

#define SEAM_ERR_DEVICE_UNAVAILABLE (SEAM_ERR_BASE + 0x01) /*!< 麦克风/采集设备无法打开 */
#define SEAM_ERR_PROTOCOL_VIOLATION (SEAM_ERR_BASE + 0x02) /*!< 消息顺序错误或格式错误 */
#define SEAM_ERR_UPSTREAM_HANDSHAKE (SEAM_ERR_BASE + 0x03) /*!< 上游握手失败 */
#define SEAM_ERR_UPSTREAM_TRANSPORT (SEAM_ERR_BASE + 0x04) /*!< 上游传输错误 */
#define SEAM_ERR_FINALIZE_TIMEOUT   (SEAM_ERR_BASE + 0x05) /*!< 等待最终识别结果超时 */
#define SEAM_ERR_TRANSLATION_FAILED (SEAM_ERR_BASE + 0x06) /*!< 翻译失败（仅影响单轮） */
#define SEAM_ERR_SYNTHESIS_FAILED   (SEAM_ERR_BASE + 0x07) /*!< 语音合成失败（仅影响单轮） */
#define SEAM_ERR_MISSING_CREDENTIAL (SEAM_ERR_BASE + 0x08) /*!< 缺少上游凭据 */

/**
 * @brief 错误码转字符串，非本项目错误码回退到 esp_err_to_name()
 */
const char *seam_err_to_name(esp_err_t err);
