#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace csvdx {

// Policy knobs for classification, robust statistics and the rule table.
// Defaults are the documented production values; the CLI may override them.
struct diag_config {
    // ---------- field classification ----------
    std::vector<std::string> missing_tokens{"", "NA", "N/A", "null", "NaN", "None", "-"};
    std::vector<std::string> true_tokens{"true", "yes"};
    std::vector<std::string> false_tokens{"false", "no"};

    // ---------- robust statistics ----------
    std::size_t   reservoir_capacity = 100000;
    double        mad_consistency    = 1.4826;   // MAD -> sigma under normality
    double        meanad_consistency = 1.2533;   // mean abs deviation -> sigma
    std::uint64_t seed               = 42;

    // ---------- rule thresholds ----------
    double        missing_warning_fraction     = 0.10;
    double        missing_critical_fraction    = 0.50;
    std::uint64_t identifier_min_count         = 20;
    double        identifier_distinct_ratio    = 0.95;
    double        near_constant_modal_fraction = 0.99;
    double        near_constant_cv             = 1e-6;
    double        mixed_critical_fraction      = 0.20;
    double        outlier_robust_z             = 5.0;
};

}
