#pragma once
#include <string_view>
#include <string>
#include <vector>
#include <cctype>

namespace csvdx {

inline std::string_view trim_view(std::string_view s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

inline bool ieq(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

// Case-insensitive membership; callers pass an already trimmed field.
inline bool matches_token(std::string_view s, const std::vector<std::string>& tokens) {
    for (const auto& t : tokens) {
        if (ieq(s, t)) return true;
    }
    return false;
}

}
