#ifndef _LANGUAGE_ROUTE_H_
#define _LANGUAGE_ROUTE_H_

#include <string>

/**
 * @brief 会话双方
 *
 * A 对应线上协议里的 "left"，B 对应 "right"。
 * 自动识别模式下按下按钮时方向未知，为 Undetermined。
 */
enum class Side {
    A = 0,
    B,
    Undetermined
};

/**
 * @brief 获取线上协议使用的方向名称 ("left" / "right" / "auto")
 */
inline const char* GetSideName(Side side) {
    switch (side) {
        case Side::A:            return "left";
        case Side::B:            return "right";
        case Side::Undetermined: return "auto";
        default:                 return "invalid";
    }
}

/**
 * @brief 解析方向名称，接受 "left"/"right" 以及 "a"/"b"
 * @return true 解析成功
 */
bool ParseSideName(const std::string& name, Side& out);

/**
 * @brief 一次发言的翻译方向
 */
struct Direction {
    Side side = Side::A;
    std::string source_lang;
    std::string target_lang;
};

/**
 * @brief 根据识别语言决定发言方与翻译方向
 *
 * 判定顺序不可调整：
 * 1. 与 A 方语言完全一致 -> A
 * 2. 与 B 方语言完全一致 -> B
 * 3. 前缀匹配（如 "en-US" 匹配 "en"），先 A 后 B
 * 4. 都不匹配：归为 A 方，源语言保留识别出的语言，目标为 B 方语言
 *
 * 识别语言为空时按 A 方处理。
 */
Direction DecideDirection(const std::string& side_a_lang,
                          const std::string& side_b_lang,
                          const std::string& detected_lang);

#endif // _LANGUAGE_ROUTE_H_
