#pragma once
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <cctype>

#include "config/diag_config.hpp"
#include "util/nulls.hpp"

namespace csvdx {

enum class value_tag { missing, integer, floating, boolean, text };

// One classified field. `text` views the trimmed raw field and is only valid
// while the row it came from is alive.
struct field_value {
    value_tag        tag = value_tag::missing;
    std::int64_t     i   = 0;
    double           f   = 0.0;
    bool             b   = false;
    std::string_view text;

    bool is_numeric() const noexcept { return tag == value_tag::integer || tag == value_tag::floating; }
    double as_double() const noexcept { return tag == value_tag::integer ? static_cast<double>(i) : f; }
};

inline bool is_int64(std::string_view s) {
    if (s.empty()) return false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}
inline bool is_float64(std::string_view s) {
    if (s.empty()) return false;
    bool dot = false, exp = false, digit = false, exp_digit = false;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (exp) exp_digit = true; else digit = true;
            continue;
        }
        if (c == '.' && !dot && !exp) { dot = true; continue; }
        if ((c == 'e' || c == 'E') && !exp && digit) {
            exp = true;
            if (i + 1 < s.size() && (s[i + 1] == '+' || s[i + 1] == '-')) ++i;
            continue;
        }
        return false;
    }
    return digit && (!exp || exp_digit);
}

inline bool parse_int64(std::string_view s, std::int64_t& out) {
    if (!is_int64(s)) return false;
    const char* first = s.data() + (s[0] == '+' ? 1 : 0);
    const char* last  = s.data() + s.size();
    auto [p, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && p == last;   // out-of-range falls through to float
}

inline bool parse_float64(std::string_view s, double& out) {
    if (!is_float64(s)) return false;
    const std::string tmp(s);
    char* end = nullptr;
    out = std::strtod(tmp.c_str(), &end);
    return end == tmp.c_str() + tmp.size() && std::isfinite(out);
}

// Ordered cascade, first match wins: missing, integer, float, boolean, text.
inline field_value classify_field(std::string_view raw, const diag_config& cfg) {
    field_value v;
    const std::string_view t = trim_view(raw);
    v.text = t;
    if (t.empty() || matches_token(t, cfg.missing_tokens)) { v.tag = value_tag::missing; return v; }
    if (parse_int64(t, v.i))   { v.tag = value_tag::integer;  return v; }
    if (parse_float64(t, v.f)) { v.tag = value_tag::floating; return v; }
    if (matches_token(t, cfg.true_tokens))  { v.tag = value_tag::boolean; v.b = true;  return v; }
    if (matches_token(t, cfg.false_tokens)) { v.tag = value_tag::boolean; v.b = false; return v; }
    v.tag = value_tag::text;
    return v;
}

inline const char* to_string(value_tag t) {
    switch (t) {
        case value_tag::missing:  return "missing";
        case value_tag::integer:  return "integer";
        case value_tag::floating: return "float";
        case value_tag::boolean:  return "boolean";
        default:                  return "text";
    }
}

}
