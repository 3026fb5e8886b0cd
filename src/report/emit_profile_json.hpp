#pragma once
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "engine/engine.hpp"

namespace csvdx {

// JSON string escaper: backslash, quote, control chars (< 0x20).
inline std::string json_escape(std::string_view in) {
    std::string out;
    out.reserve(in.size() + 8);
    for (unsigned char c : in) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (c < 0x20) out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                else out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

// Shortest round-trip form; non-finite values become null.
inline std::string json_number(double v) {
    return std::isfinite(v) ? fmt::format("{}", v) : std::string("null");
}

inline std::string column_json(const column_report& c) {
    std::string s = fmt::format(
        R"({{"name":"{}","index":{},"inferred_type":"{}","row_count":{},"missing_count":{},"non_missing_count":{},"nonconforming_count":{})",
        json_escape(c.name), c.index, to_string(c.inferred_type), c.row_count, c.missing_count,
        c.non_missing_count, c.nonconforming_count);

    if (const numeric_summary* n = c.numeric()) {
        s += fmt::format(
            R"(,"numeric":{{"count":{},"min":{},"max":{},"mean":{},"stddev":{},"median":{},"mad":{},"outlier_count":{},"outliers_estimated":{})",
            n->count,
            n->count ? json_number(n->min) : "null",
            n->count ? json_number(n->max) : "null",
            n->count ? json_number(n->mean) : "null",
            n->has_stddev ? json_number(n->stddev) : "null",
            n->count ? json_number(n->median) : "null",
            n->count ? json_number(n->mad) : "null",
            n->outlier_count,
            n->sampled ? "true" : "false");
        if (n->integral)
            s += fmt::format(R"(,"distinct_count":{},"distinct_ratio":{})", n->distinct_count, json_number(n->distinct_ratio));
        s += "}";
    } else if (const categorical_summary* k = c.categorical()) {
        s += fmt::format(
            R"(,"categorical":{{"non_missing_count":{},"distinct_count":{},"distinct_ratio":{},"modal_value":{},"modal_frequency":{},"modal_fraction":{}}})",
            k->non_missing_count, k->distinct_count, json_number(k->distinct_ratio),
            k->non_missing_count ? "\"" + json_escape(k->modal_value) + "\"" : std::string("null"),
            k->modal_frequency, json_number(k->modal_fraction));
    }
    s += "}";
    return s;
}

inline std::string finding_json(const finding& f) {
    return fmt::format(
        R"({{"column":"{}","column_index":{},"severity":"{}","kind":"{}","message":"{}","fraction":{},"count":{}}})",
        json_escape(f.column), f.column_index, to_string(f.level), to_string(f.kind),
        json_escape(f.message), json_number(f.fraction), f.count);
}

// profile.json (schema v1): dataset header, per-column stats, findings.
inline std::string profile_json(const dataset_report& r, const std::string& source_path) {
    std::string out = fmt::format(
R"({{
  "version":"1",
  "dataset":{{"rows":{},"columns":{},"malformed_rows":{},"source_path":"{}"}},
  "columns":[)",
        r.rows, r.columns.size(), r.malformed_rows, json_escape(source_path));

    for (std::size_t i = 0; i < r.columns.size(); ++i) {
        out += "\n    " + column_json(r.columns[i]);
        if (i + 1 < r.columns.size()) out += ",";
    }
    out += "\n  ],\n  \"findings\":[";
    for (std::size_t i = 0; i < r.findings.size(); ++i) {
        out += "\n    " + finding_json(r.findings[i]);
        if (i + 1 < r.findings.size()) out += ",";
    }
    out += "\n  ]\n}\n";
    return out;
}

inline void emit_profile_json(const std::string& out_path,
                              const dataset_report& r,
                              const std::string& source_path)
{
    std::ofstream f(out_path, std::ios::binary);
    if (!f) throw std::runtime_error("Failed to open for write: " + out_path);
    f << profile_json(r, source_path);
    if (!f) throw std::runtime_error("Failed to write: " + out_path);
}

}
