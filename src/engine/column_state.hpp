#pragma once
#include <fmt/format.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "config/diag_config.hpp"
#include "profile/profile.hpp"
#include "profile/profiler.hpp"
#include "types/infer.hpp"
#include "types/type_resolver.hpp"

namespace csvdx {

// Everything the pass keeps for one column. Every field is classified on its
// own and fed to the accumulator matching its tag; which state is reported is
// decided once, at finalize, from the resolved type.
class column_state {
public:
    column_state(std::string name, std::size_t index, const diag_config& cfg, std::uint64_t stream_id)
        : name_(std::move(name)), index_(index),
          numeric_(cfg.reservoir_capacity, mix_seed(cfg.seed, index, stream_id)) {}

    void update(std::string_view raw, std::uint64_t row_index, const diag_config& cfg) {
        const field_value v = classify_field(raw, cfg);
        resolver_.observe(v.tag);
        switch (v.tag) {
            case value_tag::missing:
                numeric_.add_null();
                categorical_.add_null();
                break;
            case value_tag::integer: {
                numeric_.update(v.as_double());
                if (track_keys_) {
                    const fmt::format_int key(v.i);
                    integer_keys_.update(std::string_view(key.data(), key.size()), row_index);
                }
                break;
            }
            case value_tag::floating:
                numeric_.update(v.f);
                drop_keys();
                break;
            case value_tag::boolean:
                categorical_.update(v.b ? "true" : "false", row_index);
                drop_keys();
                break;
            case value_tag::text:
                categorical_.update(v.text, row_index);
                drop_keys();
                break;
        }
    }

    // `o` covers rows after the ones this state has seen.
    void merge(const column_state& o) {
        resolver_.merge(o.resolver_);
        numeric_.merge(o.numeric_);
        categorical_.merge(o.categorical_);
        if (!o.track_keys_) drop_keys();
        if (track_keys_) integer_keys_.merge(o.integer_keys_);
    }

    void finalize(const diag_config& cfg) {
        resolver_.finalize();
        numeric_.finalize(cfg);
        categorical_.finalize();
        integer_keys_.finalize();
    }

    column_report report(std::uint64_t rows) const {
        column_report r;
        r.name                = name_;
        r.index               = index_;
        r.inferred_type       = resolver_.type();
        r.row_count           = rows;
        r.missing_count       = resolver_.missing_count();
        r.non_missing_count   = resolver_.non_missing_count();
        r.nonconforming_count = resolver_.nonconforming_count();

        if (resolver_.kind() == accumulation_kind::numeric) {
            numeric_summary n;
            n.count         = numeric_.count();
            n.min           = numeric_.min();
            n.max           = numeric_.max();
            n.mean          = n.count > 0 ? numeric_.mean() : 0.0;
            n.has_stddev    = n.count > 1;
            n.stddev        = n.has_stddev ? numeric_.stddev() : 0.0;
            n.median        = numeric_.median();
            n.mad           = numeric_.mad();
            n.outlier_count = numeric_.outlier_count();
            n.sampled       = numeric_.sampled();
            n.integral      = resolver_.integral();
            if (n.integral) {
                n.distinct_count = integer_keys_.distinct_count();
                n.distinct_ratio = integer_keys_.distinct_ratio();
            }
            r.stats = n;
        } else {
            categorical_summary c;
            c.non_missing_count = categorical_.non_null_count();
            c.distinct_count    = categorical_.distinct_count();
            c.distinct_ratio    = categorical_.distinct_ratio();
            c.modal_value       = categorical_.modal_value();
            c.modal_frequency   = categorical_.modal_frequency();
            c.modal_fraction    = categorical_.modal_fraction();
            r.stats = c;
        }
        return r;
    }

    const std::string& name() const noexcept { return name_; }
    std::size_t index() const noexcept { return index_; }
    const column_type_resolver& resolver() const noexcept { return resolver_; }
    const numeric_accumulator& numeric() const noexcept { return numeric_; }
    const categorical_accumulator& categorical() const noexcept { return categorical_; }

private:
    static std::uint64_t mix_seed(std::uint64_t seed, std::size_t index, std::uint64_t stream_id) {
        std::uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (static_cast<std::uint64_t>(index) + 1);
        z ^= stream_id * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 30)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }

    // Integer keys only matter while every value is an integer.
    void drop_keys() {
        if (!track_keys_) return;
        track_keys_ = false;
        integer_keys_ = categorical_accumulator{};
    }

    std::string name_;
    std::size_t index_;
    column_type_resolver resolver_;
    numeric_accumulator numeric_;
    categorical_accumulator categorical_;
    categorical_accumulator integer_keys_;
    bool track_keys_ = true;
};

}
