// src/profile/profile.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "types/type_resolver.hpp"

namespace csvdx {

// ---------- data model ----------
struct numeric_summary {
    std::uint64_t count          = 0;
    double        min            = 0.0;
    double        max            = 0.0;
    double        mean           = 0.0;
    double        stddev         = 0.0;   // 0 when count < 2
    bool          has_stddev     = false;
    double        median         = 0.0;
    double        mad            = 0.0;   // unscaled
    std::uint64_t outlier_count  = 0;
    bool          sampled        = false; // outlier_count is a sample-rate estimate
    bool          integral       = false; // every value was an integer
    std::uint64_t distinct_count = 0;     // tracked for integral columns only
    double        distinct_ratio = 0.0;
};

struct categorical_summary {
    std::uint64_t non_missing_count = 0;
    std::uint64_t distinct_count    = 0;
    double        distinct_ratio    = 0.0;
    std::string   modal_value;
    std::uint64_t modal_frequency   = 0;
    double        modal_fraction    = 0.0;
};

struct column_report {
    std::string   name;
    std::size_t   index              = 0;
    column_type   inferred_type      = column_type::categorical;
    std::uint64_t row_count          = 0;
    std::uint64_t missing_count      = 0;
    std::uint64_t non_missing_count  = 0;
    std::uint64_t nonconforming_count = 0;
    std::variant<numeric_summary, categorical_summary> stats;

    const numeric_summary* numeric() const { return std::get_if<numeric_summary>(&stats); }
    const categorical_summary* categorical() const { return std::get_if<categorical_summary>(&stats); }

    double missing_fraction() const {
        return row_count > 0 ? static_cast<double>(missing_count) / static_cast<double>(row_count) : 0.0;
    }
};

}
