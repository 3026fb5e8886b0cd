#pragma once
#include <fmt/format.h>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "config/diag_config.hpp"
#include "profile/profile.hpp"

namespace csvdx {

enum class severity { info, warning, critical };

enum class finding_kind { missing_values, identifier_like, near_constant, mixed_type, extreme_outliers };

inline const char* to_string(severity s) {
    switch (s) {
        case severity::info:    return "info";
        case severity::warning: return "warning";
        default:                return "critical";
    }
}

inline const char* to_string(finding_kind k) {
    switch (k) {
        case finding_kind::missing_values:   return "missing_values";
        case finding_kind::identifier_like:  return "identifier_like";
        case finding_kind::near_constant:    return "near_constant";
        case finding_kind::mixed_type:       return "mixed_type";
        default:                             return "extreme_outliers";
    }
}

struct finding {
    std::size_t   column_index = 0;
    std::string   column;
    severity      level = severity::info;
    finding_kind  kind  = finding_kind::missing_values;
    std::string   message;
    double        fraction = 0.0;   // evidence, rule-specific denominator
    std::uint64_t count    = 0;
};

namespace detail {

inline finding make_finding(const column_report& c, severity s, finding_kind k,
                            std::string msg, double fraction, std::uint64_t count) {
    return finding{c.index, c.name, s, k, std::move(msg), fraction, count};
}

inline double ratio(std::uint64_t num, std::uint64_t den) {
    return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
}

// Integer keys fill their range almost without gaps; integer measurements
// (amounts, salaries) spread over a range far wider than their count.
inline bool integer_keys_dense(const numeric_summary& n, const diag_config& cfg) {
    if (n.count == 0) return false;
    const double span = n.max - n.min + 1.0;
    return span * cfg.identifier_distinct_ratio <= static_cast<double>(n.count);
}

}

// Evaluates the fixed rule table against one finalized column. Rules fire in
// table order: missing, identifier-like, near-constant, mixed type, outliers.
inline std::vector<finding> diagnose_column(const column_report& c, const diag_config& cfg) {
    using detail::integer_keys_dense;
    using detail::make_finding;
    using detail::ratio;
    std::vector<finding> out;
    const numeric_summary*     num = c.numeric();
    const categorical_summary* cat = c.categorical();

    // missing values
    const double mf = c.missing_fraction();
    if (c.missing_count > 0) {
        const severity s = mf >= cfg.missing_critical_fraction ? severity::critical
                         : mf >= cfg.missing_warning_fraction  ? severity::warning
                         : severity::info;
        out.push_back(make_finding(c, s, finding_kind::missing_values,
            fmt::format("{:.1f}% of values missing ({} of {} rows)", mf * 100.0, c.missing_count, c.row_count),
            mf, c.missing_count));
    }

    // identifier-like
    if (cat && cat->non_missing_count >= cfg.identifier_min_count &&
        cat->distinct_ratio >= cfg.identifier_distinct_ratio) {
        out.push_back(make_finding(c, severity::warning, finding_kind::identifier_like,
            fmt::format("{} distinct values in {} non-missing rows (ratio {:.3f}); looks like an identifier",
                        cat->distinct_count, cat->non_missing_count, cat->distinct_ratio),
            cat->distinct_ratio, cat->distinct_count));
    } else if (num && num->integral && num->count >= cfg.identifier_min_count &&
               num->distinct_ratio >= cfg.identifier_distinct_ratio &&
               integer_keys_dense(*num, cfg)) {
        out.push_back(make_finding(c, severity::warning, finding_kind::identifier_like,
            fmt::format("{} distinct integers in {} non-missing rows (ratio {:.3f}) covering [{:.0f}, {:.0f}]; looks like an identifier",
                        num->distinct_count, num->count, num->distinct_ratio, num->min, num->max),
            num->distinct_ratio, num->distinct_count));
    }

    // near-constant
    if (cat && cat->non_missing_count > 0 && cat->modal_fraction >= cfg.near_constant_modal_fraction) {
        out.push_back(make_finding(c, severity::warning, finding_kind::near_constant,
            fmt::format("value '{}' accounts for {:.1f}% of non-missing values",
                        cat->modal_value, cat->modal_fraction * 100.0),
            cat->modal_fraction, cat->modal_frequency));
    } else if (num && num->count > 1 && num->has_stddev) {
        const bool flat = num->stddev == 0.0 ||
            (num->mean != 0.0 && num->stddev / std::fabs(num->mean) < cfg.near_constant_cv);
        if (flat) {
            const double cv = num->mean != 0.0 ? num->stddev / std::fabs(num->mean) : 0.0;
            out.push_back(make_finding(c, severity::warning, finding_kind::near_constant,
                fmt::format("coefficient of variation {:.3g} over {} values; column is effectively constant",
                            cv, num->count),
                cv, num->count));
        }
    }

    // mixed type
    if (c.nonconforming_count > 0) {
        const double xf = ratio(c.nonconforming_count, c.non_missing_count);
        const severity s = xf >= cfg.mixed_critical_fraction ? severity::critical : severity::warning;
        out.push_back(make_finding(c, s, finding_kind::mixed_type,
            fmt::format("{} of {} non-missing values ({:.1f}%) do not match the column type",
                        c.nonconforming_count, c.non_missing_count, xf * 100.0),
            xf, c.nonconforming_count));
    }

    // extreme outliers
    if (num && num->outlier_count > 0) {
        out.push_back(make_finding(c, severity::critical, finding_kind::extreme_outliers,
            fmt::format("{}{} value(s) at robust z >= {:g} (median {:.6g}, MAD {:.6g})",
                        num->sampled ? "~" : "", num->outlier_count, cfg.outlier_robust_z,
                        num->median, num->mad),
            ratio(num->outlier_count, num->count), num->outlier_count));
    }
    return out;
}

// Whole-dataset findings, in column order then rule order.
inline std::vector<finding> diagnose(const std::vector<column_report>& columns, const diag_config& cfg) {
    std::vector<finding> all;
    for (const auto& c : columns) {
        auto f = diagnose_column(c, cfg);
        all.insert(all.end(), std::make_move_iterator(f.begin()), std::make_move_iterator(f.end()));
    }
    return all;
}

}
