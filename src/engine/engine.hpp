#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "config/diag_config.hpp"
#include "csv/record_view.hpp"
#include "diagnose/diagnostics.hpp"
#include "engine/column_state.hpp"
#include "profile/profile.hpp"
#include "util/errors.hpp"

namespace csvdx {

enum class engine_state { empty, streaming, finalized, reported };

inline const char* to_string(engine_state s) {
    switch (s) {
        case engine_state::empty:     return "empty";
        case engine_state::streaming: return "streaming";
        case engine_state::finalized: return "finalized";
        default:                      return "reported";
    }
}

struct malformed_row {
    std::uint64_t row_index = 0;   // 0-based data row, header excluded
    std::size_t   expected  = 0;
    std::size_t   actual    = 0;
};

struct dataset_report {
    std::vector<column_report> columns;    // header order
    std::vector<finding>       findings;   // column order, then rule order
    std::uint64_t              rows = 0;   // accepted data rows
    std::uint64_t              malformed_rows = 0;
    std::vector<malformed_row> malformed_samples;
};

// Single-use driver of one pass: empty -> streaming -> finalized -> reported.
// Data problems are counted, never thrown; misuse throws usage_error.
class engine {
public:
    static constexpr std::size_t max_malformed_samples = 10;

    explicit engine(diag_config cfg = {}) : cfg_(std::move(cfg)) {}

    // Fixes the column set. `first_row` is the global index of the first row
    // this engine will see and `stream_id` separates the sampling streams of
    // engines that later merge.
    void begin(const std::vector<std::string>& header, std::uint64_t first_row = 0,
               std::uint64_t stream_id = 0) {
        if (state_ != engine_state::empty) throw usage_error("begin() called twice");
        columns_.reserve(header.size());
        for (std::size_t i = 0; i < header.size(); ++i) {
            columns_.emplace_back(header[i], i, cfg_, stream_id);
        }
        first_row_ = first_row;
        state_ = engine_state::streaming;
    }

    // Returns false when the row was skipped for a field count mismatch.
    bool consume(const record_view& row) {
        if (state_ != engine_state::streaming)
            throw usage_error(std::string("row consumed in state ") + to_string(state_));
        const std::uint64_t row_index = first_row_ + rows_ + malformed_;
        if (row.size() != columns_.size()) {
            ++malformed_;
            if (samples_.size() < max_malformed_samples)
                samples_.push_back(malformed_row{row_index, columns_.size(), row.size()});
            return false;
        }
        for (std::size_t c = 0; c < columns_.size(); ++c) {
            columns_[c].update(row[c], row_index, cfg_);
        }
        ++rows_;
        return true;
    }

    // Folds in a partial engine that covered the rows directly after ours.
    void merge(const engine& o) {
        if (state_ != engine_state::streaming || o.state_ != engine_state::streaming)
            throw usage_error("only streaming engines can be merged");
        if (o.columns_.size() != columns_.size())
            throw usage_error("cannot merge engines with different column counts");
        for (std::size_t c = 0; c < columns_.size(); ++c) columns_[c].merge(o.columns_[c]);
        rows_ += o.rows_;
        malformed_ += o.malformed_;
        for (const auto& s : o.samples_) {
            if (samples_.size() >= max_malformed_samples) break;
            samples_.push_back(s);
        }
    }

    void finalize() {
        if (state_ == engine_state::empty) state_ = engine_state::streaming;  // no header: zero columns
        if (state_ != engine_state::streaming)
            throw usage_error(std::string("finalize() called in state ") + to_string(state_));
        for (auto& c : columns_) c.finalize(cfg_);
        state_ = engine_state::finalized;
    }

    dataset_report report() {
        if (state_ != engine_state::finalized)
            throw usage_error(std::string("report() called in state ") + to_string(state_));
        dataset_report r;
        r.rows = rows_;
        r.malformed_rows = malformed_;
        r.malformed_samples = samples_;
        r.columns.reserve(columns_.size());
        for (const auto& c : columns_) r.columns.push_back(c.report(rows_));
        r.findings = diagnose(r.columns, cfg_);
        state_ = engine_state::reported;
        return r;
    }

    engine_state state() const noexcept { return state_; }
    std::uint64_t rows() const noexcept { return rows_; }
    std::uint64_t malformed_rows() const noexcept { return malformed_; }
    const std::vector<column_state>& columns() const noexcept { return columns_; }
    const diag_config& config() const noexcept { return cfg_; }

private:
    diag_config cfg_;
    engine_state state_ = engine_state::empty;
    std::vector<column_state> columns_;
    std::uint64_t first_row_ = 0;
    std::uint64_t rows_ = 0;
    std::uint64_t malformed_ = 0;
    std::vector<malformed_row> samples_;
};

}
