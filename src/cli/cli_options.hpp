#pragma once
#include <CLI/CLI.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "config/diag_config.hpp"
#include "csv/tokenizer.hpp"

namespace csvdx {

struct AppOptions {
    // Paths
    std::string input;
    std::string json_out;
    std::string template_path;

    // Report sections; none selected means summary + diagnose
    bool summary  = false;
    bool diagnose = false;
    bool types    = false;
    bool verbose  = false;
    bool fail_on_critical = false;

    // Perf
    std::int64_t chunk_bytes = 262144;   // 256 KiB default
    std::size_t  threads     = 1;

    // CSV parsing
    std::string delimiter  = ",";
    std::string quote      = "\"";
    bool        has_header = true;

    // Policy overrides
    std::size_t              reservoir_cap = diag_config{}.reservoir_capacity;
    double                   outlier_z     = diag_config{}.outlier_robust_z;
    std::uint64_t            seed          = diag_config{}.seed;
    std::vector<std::string> extra_missing_tokens;
};

inline void build_cli(CLI::App& app, AppOptions& opt) {
    app.set_version_flag("--version", "0.1.0");

    app.add_option("input", opt.input, "Path to input file (.csv or .json)")->required();
    app.add_option("--json", opt.json_out, "Also write the report as JSON to this path");
    app.add_option("--template", opt.template_path, "Mustache template for the text report");

    app.add_flag("--summary", opt.summary, "Print per-column summary statistics");
    app.add_flag("--diagnose", opt.diagnose, "Print data-quality findings");
    app.add_flag("--types", opt.types, "Print inferred column types");
    app.add_flag("-v,--verbose", opt.verbose, "Print timing and row-level detail to stderr");
    app.add_flag("--fail-on-critical", opt.fail_on_critical, "Exit with 1 when any critical finding exists");

    app.add_option("--chunk-bytes", opt.chunk_bytes, "Read chunk size (bytes)");
    app.add_option("-j,--threads", opt.threads, "Worker threads for sharded ingest");

    app.add_option("-d,--delimiter", opt.delimiter,
                   "CSV delimiter (single character, default ',')")->default_val(",");
    app.add_option("-q,--quote", opt.quote,
                   "CSV quote (single character, default '\"')")->default_val("\"");
    app.add_option("--has-header", opt.has_header,
                   "CSV has a header row (true/false)")->default_val(true);

    app.add_option("--reservoir-cap", opt.reservoir_cap, "Values kept per column for median/MAD");
    app.add_option("--outlier-z", opt.outlier_z, "Robust z-score at which a value is an outlier");
    app.add_option("--seed", opt.seed, "Seed for reservoir sampling");
    app.add_option("--missing-token", opt.extra_missing_tokens,
                   "Extra token treated as missing (repeatable)");
}

// Throws CLI::ValidationError; main hands it to app.exit().
inline void validate_options(const AppOptions& opt) {
    auto one_char = [](const std::string& s, const char* name){
        if (s.size() != 1)
            throw CLI::ValidationError{name, "must be a single character"};
    };
    one_char(opt.delimiter, "delimiter");
    one_char(opt.quote,     "quote");

    if (opt.delimiter == opt.quote)
        throw CLI::ValidationError{"delimiter", "must differ from quote"};
    if (opt.chunk_bytes <= 0)
        throw CLI::ValidationError{"chunk-bytes", "must be > 0"};
    if (opt.threads < 1)
        throw CLI::ValidationError{"threads", "must be >= 1"};
    if (opt.reservoir_cap < 1)
        throw CLI::ValidationError{"reservoir-cap", "must be >= 1"};
    if (!(opt.outlier_z > 0.0))
        throw CLI::ValidationError{"outlier-z", "must be > 0"};
}

inline diag_config to_diag_config(const AppOptions& opt) {
    diag_config cfg;
    cfg.reservoir_capacity = opt.reservoir_cap;
    cfg.outlier_robust_z   = opt.outlier_z;
    cfg.seed               = opt.seed;
    cfg.missing_tokens.insert(cfg.missing_tokens.end(),
                              opt.extra_missing_tokens.begin(), opt.extra_missing_tokens.end());
    return cfg;
}

inline csv_options to_csv_options(const AppOptions& opt) {
    csv_options c;
    c.delimiter   = opt.delimiter[0];
    c.quote       = opt.quote[0];
    c.has_header  = opt.has_header;
    c.chunk_bytes = static_cast<std::size_t>(opt.chunk_bytes);
    return c;
}

}
