#include <fmt/format.h>
#include <filesystem>
#include <string>
#include <algorithm>
#include <vector>
#include <cstdint>

#include "cli/cli_options.hpp"
#include "csv/tokenizer.hpp"
#include "engine/pipeline.hpp"
#include "io/input_format.hpp"
#include "io/json_records.hpp"
#include "metrics/timers.hpp"
#include "report/emit_profile_json.hpp"
#include "report/render_report.hpp"
#include "util/errors.hpp"

namespace fs = std::filesystem;
using namespace csvdx;

// ---------- exit codes ----------
enum exit_code : int {
    exit_ok             = 0,
    exit_critical_found = 1,   // only with --fail-on-critical
    exit_io             = 2,   // missing or unsupported input
    exit_stream         = 3,
    exit_internal       = 4,
};

static void log_malformed(const dataset_report& r, bool verbose) {
    if (r.malformed_rows == 0) return;
    fmt::print(stderr, "WARN: skipped {} malformed row(s) with a wrong field count\n", r.malformed_rows);
    if (!verbose) return;
    for (const auto& m : r.malformed_samples) {
        fmt::print(stderr, "INFO:   row {}: expected {} fields, got {}\n", m.row_index, m.expected, m.actual);
    }
}

static void log_sampling(const dataset_report& r, const diag_config& cfg) {
    for (const auto& c : r.columns) {
        const numeric_summary* n = c.numeric();
        if (n && n->sampled) {
            fmt::print(stderr, "INFO: column '{}': {} values exceed reservoir of {}; outlier count is an estimate\n",
                       c.name, n->count, cfg.reservoir_capacity);
        }
    }
}

static int run(const AppOptions& opt) {
    const fs::path input_path = opt.input;
    if (!fs::exists(input_path)) {
        fmt::print(stderr, "ERROR: input not found: {}\n", input_path.string());
        return exit_io;
    }

    const diag_config cfg = to_diag_config(opt);
    const csv_options csv = to_csv_options(opt);

    std::string tmpl = default_report_template();
    if (!opt.template_path.empty()) tmpl = load_template(opt.template_path);

    const input_format format = detect_format(input_path);

    StageTimer st_pass("profile");
    st_pass.start();
    dataset_report report;
    std::uint64_t bytes = 0;
    if (format == input_format::json) {
        const json_table table = load_json_table(input_path);
        report = profile_records(table.header, table.rows, cfg, opt.threads);
        bytes = static_cast<std::uint64_t>(fs::file_size(input_path));
    } else {
        csv_reader reader(input_path, csv);
        report = run_pass(reader, cfg, opt.threads);
        bytes = reader.bytes_read();
    }
    st_pass.stop();

    if (opt.verbose) {
        const double secs = st_pass.total_ms / 1000.0;
        const double mb   = static_cast<double>(bytes) / (1024.0 * 1024.0);
        fmt::print(stderr, "INFO: {} ({}): {} rows x {} columns in {:.1f} ms over {} call(s) ({:.2f} MB/s, {} thread(s))\n",
                   st_pass.name, to_string(format), report.rows, report.columns.size(), st_pass.total_ms,
                   st_pass.calls, secs > 0.0 ? mb / secs : 0.0, opt.threads);
        log_sampling(report, cfg);
    }
    log_malformed(report, opt.verbose);

    render_options ropt;
    ropt.source   = input_path.string();
    ropt.types    = opt.types;
    ropt.summary  = opt.summary;
    ropt.diagnose = opt.diagnose;
    if (!opt.types && !opt.summary && !opt.diagnose) ropt.summary = ropt.diagnose = true;

    fmt::print("{}", render_text_report(report, ropt, tmpl));

    if (!opt.json_out.empty()) {
        emit_profile_json(opt.json_out, report, input_path.string());
        if (opt.verbose) fmt::print(stderr, "INFO: wrote {}\n", opt.json_out);
    }

    const bool critical = std::any_of(report.findings.begin(), report.findings.end(),
                                      [](const finding& f) { return f.level == severity::critical; });
    return (opt.fail_on_critical && critical) ? exit_critical_found : exit_ok;
}

int main(int argc, char** argv) {
    CLI::App app{"datainspect: streaming CSV/JSON statistics and data-quality diagnostics"};
    AppOptions opt;
    build_cli(app, opt);

    try {
        app.parse(argc, argv);
        validate_options(opt);
        return run(opt);
    }
    catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    catch (const input_error& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_io;
    }
    catch (const stream_error& e) {
        fmt::print(stderr, "ERROR: read failed at row {}: {}\n", e.row_index(), e.what());
        return exit_stream;
    }
    catch (const std::exception& e) {
        fmt::print(stderr, "ERROR: {}\n", e.what());
        return exit_internal;
    }
}
