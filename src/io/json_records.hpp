#pragma once
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "csv/record_view.hpp"
#include "util/errors.hpp"

namespace csvdx {

// A JSON document flattened into the same header + rows shape the CSV
// reader produces.
struct json_table {
    std::vector<std::string> header;
    std::vector<record>      rows;
};

namespace detail {

// Scalars become the text the classifier would see in a CSV cell; null and
// absent keys become the empty (missing) field; nested values stay as JSON text.
inline std::string json_field(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:    return {};
        case nlohmann::json::value_t::string:  return v.get<std::string>();
        case nlohmann::json::value_t::boolean: return v.get<bool>() ? "true" : "false";
        default:                               return v.dump();
    }
}

}

// Array of objects: one row per object (non-object elements are ignored; an
// array with no objects is one empty record). Single object: one row. The
// header is the first record's keys in key order.
inline json_table json_to_table(const nlohmann::json& doc) {
    std::vector<const nlohmann::json*> objects;
    if (doc.is_array()) {
        for (const auto& el : doc) {
            if (el.is_object()) objects.push_back(&el);
        }
    } else if (doc.is_object()) {
        objects.push_back(&doc);
    } else {
        throw input_error("unsupported JSON structure: expected an object or an array of objects");
    }

    json_table t;
    if (objects.empty()) {
        t.rows.emplace_back();
        return t;
    }
    for (auto it = objects.front()->begin(); it != objects.front()->end(); ++it) t.header.push_back(it.key());

    t.rows.reserve(objects.size());
    for (const nlohmann::json* obj : objects) {
        record r;
        r.fields.reserve(t.header.size());
        for (const auto& key : t.header) {
            auto it = obj->find(key);
            r.fields.push_back(it == obj->end() ? std::string() : detail::json_field(*it));
        }
        t.rows.push_back(std::move(r));
    }
    return t;
}

inline json_table load_json_table(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw std::runtime_error("Failed to open file: " + p.string());
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw input_error(std::string("invalid JSON: ") + e.what());
    }
    return json_to_table(doc);
}

}
