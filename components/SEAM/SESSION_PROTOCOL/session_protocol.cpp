#include "session_protocol.h"

#include "cJSON.h"
#include "esp_log.h"
#include "seam_err.h"

#include <cctype>
#include <cstring>

static const char *TAG = "SessionProtocol";

namespace {
std::string printAndDelete(cJSON *root) {
  std::string out;
  char *str = cJSON_PrintUnformatted(root);
  if (str) {
    out = str;
    cJSON_free(str);
  }
  cJSON_Delete(root);
  return out;
}

const char *stringItem(const cJSON *obj, const char *key) {
  const cJSON *item = cJSON_GetObjectItem(obj, key);
  if (!cJSON_IsString(item) || item->valuestring == nullptr) {
    return nullptr;
  }
  return item->valuestring;
}

// 第一个非空字符串字段
const char *firstString(const cJSON *obj, const char *key, const char *alt) {
  const char *v = stringItem(obj, key);
  if (v && v[0] != '\0') {
    return v;
  }
  v = alt ? stringItem(obj, alt) : nullptr;
  if (v && v[0] != '\0') {
    return v;
  }
  return nullptr;
}

cJSON *newTypedMessage(const char *type) {
  cJSON *root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "type", type);
  return root;
}

ClientMessageType classify(const char *type) {
  if (strcmp(type, kMsgSessionUpdate) == 0) {
    return ClientMessageType::SessionUpdate;
  }
  if (strcmp(type, kMsgAudioAppend) == 0) {
    return ClientMessageType::AudioAppend;
  }
  if (strcmp(type, kMsgAudioCommit) == 0) {
    return ClientMessageType::AudioCommit;
  }
  if (strcmp(type, kMsgSessionFinish) == 0) {
    return ClientMessageType::SessionFinish;
  }
  return ClientMessageType::Other;
}

esp_err_t parseSession(const cJSON *session, const SessionConfig &defaults,
                       SessionConfig &out) {
  out = defaults;
  if (!cJSON_IsObject(session)) {
    return ESP_OK;
  }

  const char *mode = firstString(session, "mode", nullptr);
  if (mode && !ParseSessionMode(mode, out.mode)) {
    ESP_LOGW(TAG, "Unknown session mode: %s", mode);
    return SEAM_ERR_PROTOCOL_VIOLATION;
  }

  const char *left = firstString(session, "left_lang", "leftLang");
  if (left) {
    out.side_a_lang = left;
  }
  const char *right = firstString(session, "right_lang", "rightLang");
  if (right) {
    out.side_b_lang = right;
  }
  const char *model = firstString(session, "model", nullptr);
  if (model) {
    out.model = model;
  }

  const cJSON *transcription =
      cJSON_GetObjectItem(session, "input_audio_transcription");
  if (cJSON_IsObject(transcription)) {
    const char *lang = firstString(transcription, "language", nullptr);
    if (lang) {
      out.language_hint = lang;
    }
  }
  return ESP_OK;
}
} // namespace

const char *GetSessionModeName(SessionMode mode) {
  switch (mode) {
  case SessionMode::FixedSides:
    return "fixed_sides";
  case SessionMode::AutoDetect:
    return "auto_detect";
  default:
    return "invalid";
  }
}

bool ParseSessionMode(const std::string &name, SessionMode &out) {
  if (name == "fixed_sides" || name == "dual_button") {
    out = SessionMode::FixedSides;
    return true;
  }
  if (name == "auto_detect" || name == "single_button") {
    out = SessionMode::AutoDetect;
    return true;
  }
  return false;
}

esp_err_t ParseClientMessage(const std::string &text,
                             const SessionConfig &defaults,
                             ClientMessage &out) {
  cJSON *root = cJSON_ParseWithLength(text.data(), text.size());
  if (!root) {
    return ESP_ERR_INVALID_ARG;
  }
  if (!cJSON_IsObject(root)) {
    cJSON_Delete(root);
    return ESP_ERR_INVALID_ARG;
  }

  const char *type = stringItem(root, "type");
  if (!type) {
    cJSON_Delete(root);
    return SEAM_ERR_PROTOCOL_VIOLATION;
  }

  out = ClientMessage{};
  out.type_name = type;
  out.type = classify(type);

  esp_err_t err = ESP_OK;
  if (out.type == ClientMessageType::SessionUpdate) {
    err = parseSession(cJSON_GetObjectItem(root, "session"), defaults,
                       out.session);
  }
  cJSON_Delete(root);
  return err;
}

std::string BuildSessionUpdate(const SessionConfig &cfg) {
  cJSON *root = newTypedMessage(kMsgSessionUpdate);

  cJSON *session = cJSON_CreateObject();
  cJSON_AddStringToObject(session, "mode", GetSessionModeName(cfg.mode));
  cJSON_AddStringToObject(session, "left_lang", cfg.side_a_lang.c_str());
  cJSON_AddStringToObject(session, "right_lang", cfg.side_b_lang.c_str());
  if (!cfg.model.empty()) {
    cJSON_AddStringToObject(session, "model", cfg.model.c_str());
  }
  cJSON_AddStringToObject(session, "input_audio_format", "pcm");
  cJSON_AddNumberToObject(session, "sample_rate", kWireSampleRateHz);

  // 自动识别模式不给语言提示，交给上游判断
  if (cfg.mode == SessionMode::FixedSides && !cfg.language_hint.empty()) {
    cJSON *transcription = cJSON_CreateObject();
    cJSON_AddStringToObject(transcription, "language",
                            cfg.language_hint.c_str());
    cJSON_AddItemToObject(session, "input_audio_transcription", transcription);
  }

  cJSON_AddItemToObject(root, "session", session);
  return printAndDelete(root);
}

std::string BuildAudioAppend(const std::string &base64Pcm) {
  cJSON *root = newTypedMessage(kMsgAudioAppend);
  cJSON_AddStringToObject(root, "audio", base64Pcm.c_str());
  return printAndDelete(root);
}

std::string BuildAudioCommit() {
  return printAndDelete(newTypedMessage(kMsgAudioCommit));
}

std::string BuildSessionFinish() {
  return printAndDelete(newTypedMessage(kMsgSessionFinish));
}

std::string BuildErrorMessage(const std::string &message,
                              const std::string &detail) {
  cJSON *root = newTypedMessage(kMsgError);
  cJSON *error = cJSON_CreateObject();
  cJSON_AddStringToObject(error, "message", message.c_str());
  if (!detail.empty()) {
    cJSON_AddStringToObject(error, "detail", detail.c_str());
  }
  cJSON_AddItemToObject(root, "error", error);
  return printAndDelete(root);
}

std::string BuildSessionFinished(const std::string &reason) {
  cJSON *root = newTypedMessage(kMsgSessionFinished);
  cJSON_AddStringToObject(root, "reason", reason.c_str());
  return printAndDelete(root);
}

esp_err_t ParseRecognitionEvent(const char *data, size_t len,
                                RecognitionEvent &out) {
  if (data == nullptr || len == 0) {
    return ESP_ERR_INVALID_ARG;
  }

  cJSON *root = cJSON_ParseWithLength(data, len);
  if (!root) {
    return ESP_ERR_INVALID_ARG;
  }
  const char *type = cJSON_IsObject(root) ? stringItem(root, "type") : nullptr;
  if (!type) {
    cJSON_Delete(root);
    return ESP_ERR_INVALID_ARG;
  }

  out = RecognitionEvent{};
  out.type_name = type;

  if (strcmp(type, kMsgPartialTranscript) == 0) {
    out.type = RecognitionEventType::PartialTranscript;
    const char *text = stringItem(root, "text");
    const char *stash = stringItem(root, "stash");
    out.text = std::string(text ? text : "") + (stash ? stash : "");
  } else if (strcmp(type, kMsgCompletedTranscript) == 0) {
    out.type = RecognitionEventType::CompletedTranscript;
    const char *transcript = stringItem(root, "transcript");
    const char *language = stringItem(root, "language");
    out.text = transcript ? transcript : "";
    out.language = language ? language : "";

    const char *side = stringItem(root, "ui_side");
    if (side && ParseSideName(side, out.side)) {
      const char *src = stringItem(root, "ui_source_lang");
      const char *dst = stringItem(root, "ui_target_lang");
      const char *mode = stringItem(root, "ui_mode");
      out.routed = true;
      out.source_lang = src ? src : "";
      out.target_lang = dst ? dst : "";
      out.mode = mode ? mode : "";
    }
  } else if (strcmp(type, kMsgSessionFinished) == 0) {
    out.type = RecognitionEventType::SessionFinished;
    const char *reason = stringItem(root, "reason");
    out.reason = reason ? reason : "";
  } else if (strcmp(type, kMsgError) == 0) {
    out.type = RecognitionEventType::Error;
    const cJSON *error = cJSON_GetObjectItem(root, "error");
    if (cJSON_IsObject(error)) {
      const char *message = stringItem(error, "message");
      const char *detail = stringItem(error, "detail");
      out.error_message = message ? message : "";
      out.error_detail = detail ? detail : "";
    } else if (cJSON_IsString(error)) {
      out.error_message = error->valuestring;
    } else {
      const char *message = stringItem(root, "message");
      out.error_message = message ? message : "";
    }
  } else {
    out.type = RecognitionEventType::Other;
  }

  cJSON_Delete(root);
  return ESP_OK;
}

esp_err_t AnnotateUpstreamEvent(const std::string &upstreamText,
                                const SessionConfig &cfg, std::string &out,
                                bool &annotated) {
  annotated = false;
  cJSON *root = cJSON_ParseWithLength(upstreamText.data(), upstreamText.size());
  if (!root) {
    return ESP_ERR_INVALID_ARG;
  }

  const char *type = cJSON_IsObject(root) ? stringItem(root, "type") : nullptr;
  if (!type || strcmp(type, kMsgCompletedTranscript) != 0) {
    cJSON_Delete(root);
    return ESP_OK;
  }

  const char *language = stringItem(root, "language");
  Direction d = DecideDirection(cfg.side_a_lang, cfg.side_b_lang,
                                language ? language : "");

  static const char *kUiFields[] = {"ui_side", "ui_source_lang",
                                    "ui_target_lang", "ui_mode"};
  for (const char *field : kUiFields) {
    cJSON_DeleteItemFromObject(root, field);
  }
  cJSON_AddStringToObject(root, "ui_side", GetSideName(d.side));
  cJSON_AddStringToObject(root, "ui_source_lang", d.source_lang.c_str());
  cJSON_AddStringToObject(root, "ui_target_lang", d.target_lang.c_str());
  cJSON_AddStringToObject(root, "ui_mode", GetSessionModeName(cfg.mode));

  ESP_LOGD(TAG, "completed: detected=%s -> side=%s %s->%s",
           language ? language : "", GetSideName(d.side),
           d.source_lang.c_str(), d.target_lang.c_str());

  out = printAndDelete(root);
  annotated = true;
  return ESP_OK;
}

esp_err_t ParseWsClosePayload(const uint8_t *data, size_t len, int &code,
                              std::string &reason) {
  reason.clear();
  if (data == nullptr || len == 0) {
    code = kWsCloseNoStatus;
    return ESP_OK;
  }
  if (len < 2) {
    code = kWsCloseNoStatus;
    return ESP_ERR_INVALID_SIZE;
  }
  code = (data[0] << 8) | data[1];
  reason.assign(reinterpret_cast<const char *>(data + 2), len - 2);
  return ESP_OK;
}

bool IsWebSocketUpgrade(const char *upgradeHeader) {
  if (upgradeHeader == nullptr) {
    return false;
  }
  static const char kWebSocket[] = "websocket";
  size_t i = 0;
  for (; kWebSocket[i] != '\0'; i++) {
    if (std::tolower((unsigned char)upgradeHeader[i]) != kWebSocket[i]) {
      return false;
    }
  }
  return upgradeHeader[i] == '\0';
}
