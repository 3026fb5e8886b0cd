#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace csvdx {

// Non-owning view over one tokenized row; what the engine consumes.
struct record_view {
    std::vector<std::string_view> fields;

    std::size_t size() const noexcept { return fields.size(); }
    std::string_view operator[](std::size_t i) const noexcept { return fields[i]; }
    void clear() noexcept { fields.clear(); }
    void push(std::string_view sv) { fields.push_back(sv); }
};

inline record_view make_view(const std::vector<std::string>& fields) {
    record_view v;
    v.fields.reserve(fields.size());
    for (const auto& f : fields) v.push(f);
    return v;
}

// Owning row as produced by the reader.
struct record {
    std::vector<std::string> fields;

    std::size_t size() const noexcept { return fields.size(); }
    void clear() noexcept { fields.clear(); }

    record_view view() const { return make_view(fields); }
};

} // namespace csvdx
