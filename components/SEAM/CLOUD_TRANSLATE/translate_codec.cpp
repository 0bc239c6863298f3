#include "translate_codec.h"

#include "cJSON.h"
#include "esp_log.h"
#include "seam_err.h"

static const char *TAG = "TranslateCodec";

std::string BuildTranslateRequest(const std::string &text,
                                  const std::string &sourceLang,
                                  const std::string &targetLang) {
  cJSON *root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "text", text.c_str());
  cJSON_AddStringToObject(root, "source_lang", sourceLang.c_str());
  cJSON_AddStringToObject(root, "target_lang", targetLang.c_str());

  std::string out;
  char *str = cJSON_PrintUnformatted(root);
  if (str) {
    out = str;
    cJSON_free(str);
  }
  cJSON_Delete(root);
  return out;
}

esp_err_t ParseTranslateReply(const char *body, size_t len,
                              std::string &translation) {
  cJSON *root = cJSON_ParseWithLength(body, len);
  if (!root) {
    ESP_LOGW(TAG, "Reply is not JSON");
    return SEAM_ERR_TRANSLATION_FAILED;
  }

  esp_err_t err = ESP_OK;
  const cJSON *item = cJSON_GetObjectItem(root, "translation");
  if (cJSON_IsString(item) && item->valuestring != nullptr) {
    translation = item->valuestring;
  } else {
    const cJSON *error = cJSON_GetObjectItem(root, "error");
    ESP_LOGW(TAG, "No translation in reply: %s",
             cJSON_IsString(error) ? error->valuestring : "(missing)");
    err = SEAM_ERR_TRANSLATION_FAILED;
  }
  cJSON_Delete(root);
  return err;
}
