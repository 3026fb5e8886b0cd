#pragma once
#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "csv/record_view.hpp"
#include "io/chunk_reader.hpp"
#include "util/errors.hpp"

namespace csvdx {

struct csv_options {
    char        delimiter   = ',';
    char        quote       = '"';
    bool        has_header  = true;
    std::size_t chunk_bytes = 262144;
};

// Streaming RFC4180 reader over chunked input.
// - Delimiters and newlines only count outside quotes; quoted fields may span lines.
// - "" inside quotes is a literal quote.
// - CRLF, CR and LF all end a row; blank lines are skipped.
// - A UTF-8 BOM at the start of input is dropped.
class csv_reader {
public:
    csv_reader(const std::filesystem::path& p, csv_options opt)
        : opt_(opt), src_(p, opt.chunk_bytes) {}

    csv_reader(std::istream& in, csv_options opt)
        : opt_(opt), src_(in, opt.chunk_bytes) {}

    // Column names. Without a header row, names are col1..colN from the first
    // row's width and that row is returned by the next call to next().
    std::vector<std::string> read_header() {
        record first;
        if (!parse_record(first)) return {};
        if (opt_.has_header) return std::move(first.fields);

        std::vector<std::string> names(first.size());
        for (std::size_t i = 0; i < names.size(); ++i) names[i] = "col" + std::to_string(i + 1);
        pending_ = std::move(first);
        has_pending_ = true;
        return names;
    }

    // False at end of input. Throws stream_error on an I/O fault.
    bool next(record& out) {
        if (has_pending_) {
            out = std::move(pending_);
            has_pending_ = false;
            ++rows_;
            return true;
        }
        if (!parse_record(out)) return false;
        ++rows_;
        return true;
    }

    std::uint64_t rows_read() const noexcept { return rows_; }
    std::uint64_t bytes_read() const noexcept { return src_.bytes_read(); }

private:
    static constexpr int end_of_input = -1;

    bool fill() {
        src_.next(buf_);
        pos_ = 0;
        if (src_.failed())
            throw stream_error("I/O error on input stream", rows_);
        if (first_chunk_) {
            first_chunk_ = false;
            std::string more;
            while (buf_.size() < 3 && src_.next(more) > 0) buf_ += more;
            if (src_.failed())
                throw stream_error("I/O error on input stream", rows_);
            if (buf_.size() >= 3 && buf_.compare(0, 3, "\xEF\xBB\xBF") == 0) pos_ = 3;
            if (pos_ == buf_.size()) return fill();  // input began with a bare BOM chunk
        }
        return pos_ < buf_.size();
    }

    int get() {
        if (pos_ >= buf_.size() && (eof_ || !fill())) { eof_ = true; return end_of_input; }
        return static_cast<unsigned char>(buf_[pos_++]);
    }

    int peek() {
        if (pos_ >= buf_.size() && (eof_ || !fill())) { eof_ = true; return end_of_input; }
        return static_cast<unsigned char>(buf_[pos_]);
    }

    bool parse_record(record& out) {
        out.clear();
        std::string cur;
        bool in_quotes = false;
        bool touched = false;   // row has any content, even an empty quoted field

        for (;;) {
            const int ch = get();
            if (ch == end_of_input) {
                // Unterminated quote at EOF: deliver what we have.
                if (!touched && cur.empty() && out.fields.empty()) return false;
                out.fields.push_back(std::move(cur));
                return true;
            }
            const char c = static_cast<char>(ch);

            if (in_quotes) {
                if (c == opt_.quote) {
                    if (peek() == static_cast<unsigned char>(opt_.quote)) { cur.push_back(opt_.quote); ++pos_; }
                    else in_quotes = false;
                } else {
                    cur.push_back(c);
                }
                continue;
            }

            if (c == opt_.quote) {
                in_quotes = true;
                touched = true;
            } else if (c == opt_.delimiter) {
                out.fields.push_back(std::move(cur));
                cur.clear();
                touched = true;
            } else if (c == '\n' || c == '\r') {
                if (c == '\r' && peek() == '\n') ++pos_;
                if (!touched && cur.empty() && out.fields.empty()) continue; // blank line
                out.fields.push_back(std::move(cur));
                return true;
            } else {
                cur.push_back(c);
                touched = true;
            }
        }
    }

    csv_options opt_;
    chunk_reader src_;
    std::string buf_;
    std::size_t pos_ = 0;
    bool eof_ = false;
    bool first_chunk_ = true;

    record pending_;
    bool has_pending_ = false;
    std::uint64_t rows_ = 0;
};

}
