#include "language_route.h"

namespace {
bool startsWith(const std::string& value, const std::string& prefix) {
    // an empty configured tag would match everything
    if (prefix.empty() || value.size() < prefix.size()) {
        return false;
    }
    return value.compare(0, prefix.size(), prefix) == 0;
}

Direction fromSide(Side side, const std::string& side_a_lang,
                   const std::string& side_b_lang) {
    Direction d;
    d.side = side;
    if (side == Side::B) {
        d.source_lang = side_b_lang;
        d.target_lang = side_a_lang;
    } else {
        d.source_lang = side_a_lang;
        d.target_lang = side_b_lang;
    }
    return d;
}
} // namespace

bool ParseSideName(const std::string& name, Side& out) {
    if (name == "left" || name == "a" || name == "A") {
        out = Side::A;
        return true;
    }
    if (name == "right" || name == "b" || name == "B") {
        out = Side::B;
        return true;
    }
    return false;
}

Direction DecideDirection(const std::string& side_a_lang,
                          const std::string& side_b_lang,
                          const std::string& detected_lang) {
    if (detected_lang.empty()) {
        return fromSide(Side::A, side_a_lang, side_b_lang);
    }

    if (detected_lang == side_a_lang) {
        return fromSide(Side::A, side_a_lang, side_b_lang);
    }
    if (detected_lang == side_b_lang) {
        return fromSide(Side::B, side_a_lang, side_b_lang);
    }

    if (startsWith(detected_lang, side_a_lang)) {
        return fromSide(Side::A, side_a_lang, side_b_lang);
    }
    if (startsWith(detected_lang, side_b_lang)) {
        return fromSide(Side::B, side_a_lang, side_b_lang);
    }

    // 不认识的语言：保留识别结果作为源语言，不丢信息
    Direction d;
    d.side = Side::A;
    d.source_lang = detected_lang;
    d.target_lang = side_b_lang;
    return d;
}
