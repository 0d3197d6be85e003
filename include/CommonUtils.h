#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// Splits on `sep`, trimming each token and dropping empty ones.
inline std::vector<std::string> splitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(std::move(t));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(std::move(t));
    return out;
}

inline bool isMissingToken(std::string_view raw) {
    const std::string v = toLower(trim(raw));
    return v.empty() || v == "na" || v == "n/a" || v == "nan" || v == "null" || v == "none" || v == "?";
}

/**
 * @brief Parses a boolean cell or flag value.
 * @post Returns false and leaves `out` untouched when the token is not recognised.
 */
inline bool parseBoolToken(std::string_view raw, bool& out) {
    const std::string v = toLower(trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on" || v == "y") {
        out = true;
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off" || v == "n") {
        out = false;
        return true;
    }
    return false;
}

} // namespace CommonUtils
