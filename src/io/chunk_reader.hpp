#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace csvdx {

// Fixed-size block reads from a file it owns or from a borrowed stream.
class chunk_reader {
public:
    chunk_reader(const std::filesystem::path& p, std::size_t chunk_bytes)
        : buf_(chunk_bytes), in_(&file_)
    {
        if (chunk_bytes == 0) throw std::invalid_argument("chunk_bytes == 0");
        file_.open(p, std::ios::binary);
        if (!file_) throw std::runtime_error("Failed to open file: " + p.string());
    }

    chunk_reader(std::istream& in, std::size_t chunk_bytes)
        : buf_(chunk_bytes), in_(&in)
    {
        if (chunk_bytes == 0) throw std::invalid_argument("chunk_bytes == 0");
    }

    chunk_reader(const chunk_reader&) = delete;
    chunk_reader& operator=(const chunk_reader&) = delete;

    // Returns number of bytes read; 0 = EOF or failure (see failed()).
    std::size_t next(std::string& out) {
        out.clear();
        if (!*in_) return 0;
        in_->read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        auto got = static_cast<std::size_t>(in_->gcount());
        out.assign(buf_.data(), got);
        bytes_ += got;
        return got;
    }

    // An I/O fault, as opposed to a clean end of input.
    bool failed() const { return in_->bad(); }

    std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
    std::vector<char> buf_;
    std::ifstream file_;
    std::istream* in_;
    std::uint64_t bytes_ = 0;
};

}
