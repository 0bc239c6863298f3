#include "tts_voice.h"

#include "cJSON.h"

#include <cctype>
#include <cstring>

namespace {
struct LanguageTypeEntry {
  const char *tag;
  const char *language_type;
};

const LanguageTypeEntry kLanguageTypes[] = {
    {"zh", "Chinese"}, {"en", "English"}, {"ja", "Japanese"},
    {"ko", "Korean"},  {"es", "Spanish"}, {"fr", "French"},
    {"de", "German"},
};

std::string primarySubtag(const std::string &lang) {
  std::string out;
  for (char c : lang) {
    if (c == '-' || c == '_') {
      break;
    }
    out.push_back((char)std::tolower((unsigned char)c));
  }
  return out;
}
} // namespace

TtsVoice SelectTtsVoice(const std::string &lang) {
  TtsVoice v;
  const std::string primary = primarySubtag(lang);
  for (const auto &entry : kLanguageTypes) {
    if (primary == entry.tag) {
      v.language_type = entry.language_type;
      break;
    }
  }
  return v;
}

std::string BuildTtsRequest(const std::string &text, const std::string &lang) {
  TtsVoice v = SelectTtsVoice(lang);

  cJSON *root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "text", text.c_str());
  cJSON_AddStringToObject(root, "lang", lang.c_str());
  cJSON_AddStringToObject(root, "voice", v.voice.c_str());
  cJSON_AddStringToObject(root, "language_type", v.language_type.c_str());

  std::string out;
  char *str = cJSON_PrintUnformatted(root);
  if (str) {
    out = str;
    cJSON_free(str);
  }
  cJSON_Delete(root);
  return out;
}
