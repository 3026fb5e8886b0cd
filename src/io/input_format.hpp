#pragma once
#include <filesystem>
#include <string>

#include "util/errors.hpp"

namespace csvdx {

enum class input_format { csv, json };

inline const char* to_string(input_format f) {
    return f == input_format::json ? "json" : "csv";
}

// Chosen by file extension; anything other than .csv or .json is rejected.
inline input_format detect_format(const std::filesystem::path& p) {
    const std::string ext = p.extension().string();
    if (ext == ".csv") return input_format::csv;
    if (ext == ".json") return input_format::json;
    throw input_error("unsupported file type: '" + (ext.empty() ? std::string("(none)") : ext) + "'");
}

}
