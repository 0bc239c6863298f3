#pragma once

#include "esp_err.h"
#include "language_route.h"

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief 会话工作模式
 */
enum class SessionMode {
  FixedSides = 0, ///< 双按钮：按哪个键就是哪一方
  AutoDetect,     ///< 单按钮：由识别出的语言决定方向
};

/**
 * @brief 线上协议中的模式名称 ("fixed_sides" / "auto_detect")
 */
const char *GetSessionModeName(SessionMode mode);

/**
 * @brief 解析模式名称，兼容旧客户端的 "dual_button" / "single_button"
 */
bool ParseSessionMode(const std::string &name, SessionMode &out);

// ========== 消息类型 ==========

// client -> relay
constexpr const char *kMsgSessionUpdate = "session.update";
constexpr const char *kMsgAudioAppend = "input_audio_buffer.append";
constexpr const char *kMsgAudioCommit = "input_audio_buffer.commit";
constexpr const char *kMsgSessionFinish = "session.finish";

// relay -> client
constexpr const char *kMsgPartialTranscript =
    "conversation.item.input_audio_transcription.text";
constexpr const char *kMsgCompletedTranscript =
    "conversation.item.input_audio_transcription.completed";
constexpr const char *kMsgSessionFinished = "session.finished";
constexpr const char *kMsgError = "error";

constexpr int kWireSampleRateHz = 16000;

/**
 * @brief 会话配置，一个中继连接内只设置一次
 */
struct SessionConfig {
  SessionMode mode = SessionMode::FixedSides;
  std::string side_a_lang = "zh";
  std::string side_b_lang = "en";
  std::string model;         ///< 为空时由中继使用默认模型
  std::string language_hint; ///< 双按钮模式下按下一侧的语言，可为空
};

enum class ClientMessageType {
  SessionUpdate,
  AudioAppend,
  AudioCommit,
  SessionFinish,
  Other,
};

struct ClientMessage {
  ClientMessageType type = ClientMessageType::Other;
  std::string type_name;
  SessionConfig session; ///< 仅 SessionUpdate 有效
};

/**
 * @brief 解析客户端发来的 JSON 文本
 *
 * @param defaults session.update 中缺省字段使用的默认值
 * @return ESP_OK 成功；ESP_ERR_INVALID_ARG 不是 JSON 对象；
 *         SEAM_ERR_PROTOCOL_VIOLATION 缺少 type 或模式非法
 */
esp_err_t ParseClientMessage(const std::string &text,
                             const SessionConfig &defaults, ClientMessage &out);

std::string BuildSessionUpdate(const SessionConfig &cfg);
std::string BuildAudioAppend(const std::string &base64Pcm);
std::string BuildAudioCommit();
std::string BuildSessionFinish();
std::string BuildErrorMessage(const std::string &message,
                              const std::string &detail = std::string());
std::string BuildSessionFinished(const std::string &reason);

enum class RecognitionEventType {
  PartialTranscript,
  CompletedTranscript,
  SessionFinished,
  Error,
  Other,
};

/**
 * @brief 中继转发给客户端的识别事件
 */
struct RecognitionEvent {
  RecognitionEventType type = RecognitionEventType::Other;
  std::string type_name;

  std::string text;     ///< partial: text + stash；completed: transcript
  std::string language; ///< 识别出的语言

  // 中继附加的路由字段（completed）
  bool routed = false;
  Side side = Side::Undetermined;
  std::string source_lang;
  std::string target_lang;
  std::string mode;

  std::string reason; ///< session.finished
  std::string error_message;
  std::string error_detail;
};

/**
 * @brief 解析识别事件
 * @return ESP_OK 成功；ESP_ERR_INVALID_ARG 非 JSON 或没有 type
 */
esp_err_t ParseRecognitionEvent(const char *data, size_t len,
                                RecognitionEvent &out);

/**
 * @brief 中继侧：为 completed 事件追加路由字段
 *
 * @param annotated 输出：是否为 completed 事件并已改写 out
 * @return ESP_OK 是 JSON（annotated 表示是否改写）；ESP_ERR_INVALID_ARG 非 JSON
 */
esp_err_t AnnotateUpstreamEvent(const std::string &upstreamText,
                                const SessionConfig &cfg, std::string &out,
                                bool &annotated);

// ========== WebSocket 传输细节 ==========

/// 对端没有给出关闭码（RFC 6455 1005）
constexpr int kWsCloseNoStatus = 1005;

/**
 * @brief 解析 close 帧负载：2 字节大端关闭码 + UTF-8 原因
 * @return ESP_OK；ESP_ERR_INVALID_SIZE 负载只有 1 字节
 *
 * 空负载得到 kWsCloseNoStatus 和空原因。
 */
esp_err_t ParseWsClosePayload(const uint8_t *data, size_t len, int &code,
                              std::string &reason);

/// Upgrade 头是否请求 websocket（大小写不敏感）
bool IsWebSocketUpgrade(const char *upgradeHeader);
