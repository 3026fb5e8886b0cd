#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace csvdx {

// Upstream read failure. Fatal: no partial report is produced.
class stream_error : public std::runtime_error {
public:
    stream_error(const std::string& message, std::uint64_t row_index)
        : std::runtime_error(message), row_index_(row_index) {}

    // 0-based data row (header excluded) being read when the failure happened.
    std::uint64_t row_index() const noexcept { return row_index_; }

private:
    std::uint64_t row_index_;
};

// Input that cannot be profiled: unsupported file type or unparseable document.
class input_error : public std::runtime_error {
public:
    explicit input_error(const std::string& message)
        : std::runtime_error("input error: " + message) {}
};

// Engine misuse (update after finalize, finalize twice, ...). Programming error.
class usage_error : public std::logic_error {
public:
    explicit usage_error(const std::string& message)
        : std::logic_error("usage error: " + message) {}
};

}
