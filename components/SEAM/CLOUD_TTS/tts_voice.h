#pragma once

#include <string>

constexpr const char *kDefaultTtsVoice = "Cherry";
constexpr const char *kFallbackTtsLanguageType = "English";

/**
 * @brief 合成参数：音色和语言类型
 */
struct TtsVoice {
  std::string voice = kDefaultTtsVoice;
  std::string language_type = kFallbackTtsLanguageType;
};

/**
 * @brief 按语言标签选择合成参数
 *
 * 只看主标签（"en-US" -> "en"），不区分大小写；未知语言回退到 English。
 */
TtsVoice SelectTtsVoice(const std::string &lang);

/**
 * @brief 合成请求体 {"text","lang","voice","language_type"}
 */
std::string BuildTtsRequest(const std::string &text, const std::string &lang);
