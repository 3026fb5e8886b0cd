#include "metrics/timers.hpp"
#include "csv/tokenizer.hpp"
#include "engine/pipeline.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// usage: csvdx_bench_pipeline <input.csv> [--threads N] [--chunk-bytes N] [--repeat N]
// Prints one csv-style line with the best and mean pass time.
int main(int argc, char** argv){
  std::string input;
  std::size_t chunk_bytes = 1u << 20;
  std::size_t threads = 1;
  std::size_t repeat = 3;

  for (int i = 1; i < argc; ++i){
    const std::string_view a(argv[i]);
    std::size_t* target = a == "--threads" ? &threads
                        : a == "--chunk-bytes" ? &chunk_bytes
                        : a == "--repeat" ? &repeat : nullptr;
    if (target){
      if (i + 1 >= argc){ fmt::print(stderr, "missing value for {}\n", a); return 2; }
      *target = static_cast<std::size_t>(std::stoull(argv[++i]));
    } else if (input.empty() && !a.empty() && a[0] != '-'){
      input = std::string(a);
    } else {
      fmt::print(stderr, "unknown argument: {}\n", a);
      return 2;
    }
  }

  if (input.empty() || threads == 0 || chunk_bytes == 0 || repeat == 0){
    fmt::print(stderr, "usage: csvdx_bench_pipeline <input.csv> [--threads N] [--chunk-bytes N] [--repeat N]\n");
    return 2;
  }
  if (!fs::exists(input)){
    fmt::print(stderr, "file missing: {}\n", input);
    return 2;
  }

  try {
    csvdx::csv_options opt;
    opt.chunk_bytes = chunk_bytes;

    csvdx::StageTimer st("pass");
    double best_ms = 0.0;
    std::uint64_t bytes = 0;
    csvdx::dataset_report report;
    for (std::size_t r = 0; r < repeat; ++r){
      csvdx::csv_reader reader(input, opt);
      st.start();
      report = csvdx::run_pass(reader, csvdx::diag_config{}, threads);
      st.stop();
      best_ms = r == 0 ? st.wt.ms() : std::min(best_ms, st.wt.ms());
      bytes = reader.bytes_read();
    }

    const double mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
    fmt::print("bench_pipeline,file={},rows={},cols={},findings={},threads={},best_ms={:.2f},mean_ms={:.2f},MB/s={:.2f}\n",
               input, report.rows, report.columns.size(), report.findings.size(), threads,
               best_ms, st.total_ms / static_cast<double>(st.calls),
               best_ms > 0.0 ? mb / (best_ms / 1000.0) : 0.0);
  } catch (const std::exception& e) {
    fmt::print(stderr, "bench failed: {}\n", e.what());
    return 4;
  }
  return 0;
}
