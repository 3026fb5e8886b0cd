/**
 * @file integration_test.cpp
 * @brief Whole passes from a file on disk through the reader, engine and
 *        report writers.
 */

#include "engine/pipeline.hpp"
#include "report/emit_profile_json.hpp"
#include "report/render_report.hpp"
#include "test_util.hpp"

#include <cmath>
#include <fmt/format.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace csvdx;
using test_util::has_kind;
using test_util::findings_for;

namespace {

// id, amount (one spike), region (12% empty), flag, version (constant), score (5% junk)
std::string synthetic_csv(std::size_t rows) {
  const auto amounts = test_util::normal_sample(rows, 120.0, 15.0, 5);
  const char* regions[] = {"north", "south", "east", "west"};
  std::string out = "id,amount,region,flag,version,score\n";
  for (std::size_t i = 0; i < rows; ++i) {
    const double amount = i == rows / 2 ? 50000.0 : amounts[i];
    const std::string region = i % 25 < 3 ? "" : regions[i % 4];
    const std::string score = i % 20 == 7 ? "n/a?" : fmt::format("{:.3f}", (i % 97) / 97.0);
    out += fmt::format("{},{:.2f},\"{}\",{},v1,{}\n", i + 1, amount, region, i % 2 ? "yes" : "no", score);
  }
  return out;
}

dataset_report run_file(const std::string& path, const diag_config& cfg = {},
                        std::size_t threads = 1, csv_options opt = {},
                        std::size_t rows_per_shard = default_rows_per_shard) {
  csv_reader reader(path, opt);
  return run_pass(reader, cfg, threads, rows_per_shard);
}

} // namespace

TEST(IntegrationTest, SyntheticFileFindings) {
  test_util::TempCsvFile f(synthetic_csv(1000));
  const auto r = run_file(f.path());

  ASSERT_EQ(r.columns.size(), 6u);
  EXPECT_EQ(r.rows, 1000u);
  EXPECT_EQ(r.malformed_rows, 0u);

  // id: unique integers
  EXPECT_EQ(r.columns[0].inferred_type, column_type::numeric);
  EXPECT_TRUE(has_kind(r.findings, 0, finding_kind::identifier_like));

  // amount: the spike
  EXPECT_EQ(r.columns[1].numeric()->outlier_count, 1u);
  EXPECT_TRUE(has_kind(r.findings, 1, finding_kind::extreme_outliers));

  // region: 120 empty strings, a warning
  EXPECT_EQ(r.columns[2].missing_count, 120u);
  ASSERT_TRUE(has_kind(r.findings, 2, finding_kind::missing_values));

  // flag: yes/no
  EXPECT_EQ(r.columns[3].inferred_type, column_type::boolean);
  EXPECT_EQ(findings_for(r.findings, 3), 0u);

  // version: one value everywhere
  EXPECT_TRUE(has_kind(r.findings, 4, finding_kind::near_constant));

  // score: numeric with 50 junk tokens
  EXPECT_EQ(r.columns[5].inferred_type, column_type::numeric);
  EXPECT_EQ(r.columns[5].nonconforming_count, 50u);
  EXPECT_TRUE(has_kind(r.findings, 5, finding_kind::mixed_type));
}

TEST(IntegrationTest, RepeatedRunsAreByteIdentical) {
  test_util::TempCsvFile f(synthetic_csv(500));
  render_options opt;
  opt.types = true;
  const std::string a = render_text_report(run_file(f.path()), opt);
  const std::string b = render_text_report(run_file(f.path()), opt);
  EXPECT_EQ(a, b);
  EXPECT_EQ(profile_json(run_file(f.path()), "in.csv"), profile_json(run_file(f.path()), "in.csv"));
}

TEST(IntegrationTest, ThreadedPassAgreesWithSequential) {
  test_util::TempCsvFile f(synthetic_csv(2000));
  const auto seq = run_file(f.path());
  const auto par = run_file(f.path(), diag_config{}, 4);

  EXPECT_EQ(par.rows, seq.rows);
  ASSERT_EQ(par.findings.size(), seq.findings.size());
  for (std::size_t i = 0; i < seq.findings.size(); ++i) {
    EXPECT_EQ(par.findings[i].column_index, seq.findings[i].column_index);
    EXPECT_EQ(par.findings[i].kind, seq.findings[i].kind);
    EXPECT_EQ(par.findings[i].level, seq.findings[i].level);
    EXPECT_EQ(par.findings[i].count, seq.findings[i].count);
  }
}

TEST(IntegrationTest, BlockwiseThreadedPassMatchesSequential) {
  test_util::TempCsvFile f(synthetic_csv(500));
  const auto seq = run_file(f.path());

  // 3 threads x 7 rows per shard: 24 blocks, the last one partial.
  for (std::size_t rows_per_shard : {1u, 7u, 64u}) {
    const auto par = run_file(f.path(), diag_config{}, 3, csv_options{}, rows_per_shard);
    EXPECT_EQ(par.rows, seq.rows);
    ASSERT_EQ(par.columns.size(), seq.columns.size());
    for (std::size_t c = 0; c < seq.columns.size(); ++c) {
      EXPECT_EQ(par.columns[c].inferred_type, seq.columns[c].inferred_type);
      EXPECT_EQ(par.columns[c].missing_count, seq.columns[c].missing_count);
      EXPECT_EQ(par.columns[c].nonconforming_count, seq.columns[c].nonconforming_count);
    }
    const auto* ps = par.columns[1].numeric();
    const auto* ss = seq.columns[1].numeric();
    EXPECT_NEAR(ps->mean, ss->mean, std::fabs(ss->mean) * 1e-9);
    EXPECT_NEAR(ps->stddev, ss->stddev, ss->stddev * 1e-9);
    EXPECT_DOUBLE_EQ(ps->median, ss->median);
    EXPECT_DOUBLE_EQ(ps->mad, ss->mad);
    EXPECT_EQ(par.columns[0].numeric()->distinct_count, 500u);
    EXPECT_EQ(par.columns[2].categorical()->modal_value, seq.columns[2].categorical()->modal_value);

    ASSERT_EQ(par.findings.size(), seq.findings.size());
    for (std::size_t i = 0; i < seq.findings.size(); ++i) {
      EXPECT_EQ(par.findings[i].kind, seq.findings[i].kind);
      EXPECT_EQ(par.findings[i].count, seq.findings[i].count);
    }
  }
}

TEST(IntegrationTest, BlockwisePassKeepsGlobalMalformedRowIndices) {
  std::string text = "a,b\n";
  for (int i = 0; i < 60; ++i) text += i == 41 ? "broken\n" : fmt::format("{},x\n", i);
  test_util::TempCsvFile f(text);
  const auto r = run_file(f.path(), diag_config{}, 2, csv_options{}, 4);
  EXPECT_EQ(r.rows, 59u);
  ASSERT_EQ(r.malformed_samples.size(), 1u);
  EXPECT_EQ(r.malformed_samples[0].row_index, 41u);
}

TEST(IntegrationTest, ZeroRowsPerShardIsRejected) {
  test_util::TempCsvFile f("a\n1\n");
  EXPECT_THROW(run_file(f.path(), diag_config{}, 2, csv_options{}, 0), std::invalid_argument);
}

TEST(IntegrationTest, MalformedRowsInFileAreSkipped) {
  test_util::TempCsvFile f("a,b\n1,x\n2\n3,y\n4,z,extra\n5,w\n");
  const auto r = run_file(f.path());
  EXPECT_EQ(r.rows, 3u);
  EXPECT_EQ(r.malformed_rows, 2u);
  ASSERT_EQ(r.malformed_samples.size(), 2u);
  EXPECT_EQ(r.malformed_samples[0].row_index, 1u);
  EXPECT_EQ(r.malformed_samples[1].row_index, 3u);
  EXPECT_DOUBLE_EQ(r.columns[0].numeric()->mean, 3.0);
}

TEST(IntegrationTest, HeaderlessSemicolonFile) {
  test_util::TempCsvFile f("1;a\n2;b\n3;a\n");
  csv_options opt;
  opt.delimiter = ';';
  opt.has_header = false;
  const auto r = run_file(f.path(), diag_config{}, 1, opt);
  ASSERT_EQ(r.columns.size(), 2u);
  EXPECT_EQ(r.columns[0].name, "col1");
  EXPECT_EQ(r.columns[1].name, "col2");
  EXPECT_EQ(r.rows, 3u);
  EXPECT_EQ(r.columns[1].categorical()->modal_value, "a");
}

TEST(IntegrationTest, ExtraMissingTokens) {
  test_util::TempCsvFile f("v\n1\n?\n3\n?\n");
  diag_config cfg;
  cfg.missing_tokens.push_back("?");
  const auto r = run_file(f.path(), cfg);
  EXPECT_EQ(r.columns[0].missing_count, 2u);
  EXPECT_EQ(r.columns[0].nonconforming_count, 0u);
  EXPECT_TRUE(has_kind(r.findings, 0, finding_kind::missing_values));
}

TEST(IntegrationTest, SmallReservoirMarksOutliersAsEstimated) {
  test_util::TempCsvFile f(synthetic_csv(3000));
  diag_config cfg;
  cfg.reservoir_capacity = 200;
  const auto r = run_file(f.path(), cfg);
  const auto* amount = r.columns[1].numeric();
  ASSERT_NE(amount, nullptr);
  EXPECT_TRUE(amount->sampled);
  EXPECT_EQ(amount->count, 3000u);
  EXPECT_TRUE(profile_json(r, "x").find(R"("outliers_estimated":true)") != std::string::npos);
}

TEST(IntegrationTest, HeaderOnlyFile) {
  test_util::TempCsvFile f("a,b\n");
  const auto r = run_file(f.path());
  EXPECT_EQ(r.rows, 0u);
  ASSERT_EQ(r.columns.size(), 2u);
  EXPECT_TRUE(r.findings.empty());
}
