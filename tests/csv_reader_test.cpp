/**
 * @file csv_reader_test.cpp
 * @brief Tests for the chunked RFC 4180 reader.
 */

#include "csv/tokenizer.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

using namespace csvdx;

namespace {

struct parsed {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows;
};

parsed read_all(const std::string& text, csv_options opt = {}) {
  std::istringstream in(text);
  csv_reader reader(in, opt);
  parsed p;
  p.header = reader.read_header();
  record rec;
  while (reader.next(rec)) p.rows.push_back(rec.fields);
  return p;
}

using row = std::vector<std::string>;

// Serves its buffer once, then fails the next refill.
class failing_buf : public std::streambuf {
public:
  explicit failing_buf(std::string data) : data_(std::move(data)) {
    setg(&data_[0], &data_[0], &data_[0] + data_.size());
  }

protected:
  int_type underflow() override { throw std::runtime_error("device went away"); }

private:
  std::string data_;
};

} // namespace

TEST(CsvReaderTest, HeaderAndRows) {
  auto p = read_all("a,b,c\n1,2,3\n4,5,6\n");
  EXPECT_EQ(p.header, (row{"a", "b", "c"}));
  ASSERT_EQ(p.rows.size(), 2u);
  EXPECT_EQ(p.rows[1], (row{"4", "5", "6"}));
}

TEST(CsvReaderTest, QuotedDelimiterAndEscapedQuote) {
  auto p = read_all("name,note\n\"Smith, J\",\"said \"\"hi\"\"\"\n");
  ASSERT_EQ(p.rows.size(), 1u);
  EXPECT_EQ(p.rows[0], (row{"Smith, J", "said \"hi\""}));
}

TEST(CsvReaderTest, QuotedFieldSpansLines) {
  auto p = read_all("a,b\n\"line1\nline2\",x\n3,y\n");
  ASSERT_EQ(p.rows.size(), 2u);
  EXPECT_EQ(p.rows[0], (row{"line1\nline2", "x"}));
  EXPECT_EQ(p.rows[1], (row{"3", "y"}));
}

TEST(CsvReaderTest, CrLfAndBareCrEndRows) {
  auto crlf = read_all("a,b\r\n1,2\r\n3,4\r\n");
  EXPECT_EQ(crlf.header, (row{"a", "b"}));
  ASSERT_EQ(crlf.rows.size(), 2u);
  EXPECT_EQ(crlf.rows[1], (row{"3", "4"}));

  auto cr = read_all("a,b\r1,2\r");
  ASSERT_EQ(cr.rows.size(), 1u);
  EXPECT_EQ(cr.rows[0], (row{"1", "2"}));
}

TEST(CsvReaderTest, BlankLinesAreSkipped) {
  auto p = read_all("a,b\n\n1,2\n\n\r\n3,4\n\n");
  ASSERT_EQ(p.rows.size(), 2u);
  EXPECT_EQ(p.rows[0], (row{"1", "2"}));
  EXPECT_EQ(p.rows[1], (row{"3", "4"}));
}

TEST(CsvReaderTest, EmptyFieldsAreKept) {
  auto p = read_all("a,b,c\n1,,\n\"\",x,\n");
  ASSERT_EQ(p.rows.size(), 2u);
  EXPECT_EQ(p.rows[0], (row{"1", "", ""}));
  EXPECT_EQ(p.rows[1], (row{"", "x", ""}));
}

TEST(CsvReaderTest, Utf8BomIsDropped) {
  auto p = read_all("\xEF\xBB\xBFid,v\n1,2\n");
  EXPECT_EQ(p.header, (row{"id", "v"}));
}

TEST(CsvReaderTest, LastRowWithoutNewline) {
  auto p = read_all("a,b\n1,2\n3,4");
  ASSERT_EQ(p.rows.size(), 2u);
  EXPECT_EQ(p.rows[1], (row{"3", "4"}));
}

TEST(CsvReaderTest, UnterminatedQuoteRunsToEndOfInput) {
  auto p = read_all("a,b\n1,\"open\n2,3\n");
  ASSERT_EQ(p.rows.size(), 1u);
  EXPECT_EQ(p.rows[0], (row{"1", "open\n2,3\n"}));
}

TEST(CsvReaderTest, NoHeaderSynthesizesNames) {
  csv_options opt;
  opt.has_header = false;
  auto p = read_all("1,2,3\n4,5,6\n", opt);
  EXPECT_EQ(p.header, (row{"col1", "col2", "col3"}));
  ASSERT_EQ(p.rows.size(), 2u);
  EXPECT_EQ(p.rows[0], (row{"1", "2", "3"}));
}

TEST(CsvReaderTest, CustomDelimiterAndQuote) {
  csv_options opt;
  opt.delimiter = ';';
  opt.quote = '\'';
  auto p = read_all("a;b\n'x;y';2,5\n", opt);
  ASSERT_EQ(p.rows.size(), 1u);
  EXPECT_EQ(p.rows[0], (row{"x;y", "2,5"}));
}

TEST(CsvReaderTest, EmptyInput) {
  auto p = read_all("");
  EXPECT_TRUE(p.header.empty());
  EXPECT_TRUE(p.rows.empty());
}

TEST(CsvReaderTest, ChunkBoundariesDoNotChangeRows) {
  const std::string text =
      "\xEF\xBB\xBFid,\"note\",v\r\n"
      "1,\"a \"\"quoted\"\", value\",2.5\r\n"
      "2,\"multi\r\nline\",\r\n"
      "\r\n"
      "3,plain,-1e3";
  const auto expected = read_all(text);
  ASSERT_EQ(expected.rows.size(), 3u);
  EXPECT_EQ(expected.rows[0][1], "a \"quoted\", value");
  EXPECT_EQ(expected.rows[1][1], "multi\r\nline");

  for (std::size_t chunk = 1; chunk <= 9; ++chunk) {
    csv_options opt;
    opt.chunk_bytes = chunk;
    const auto got = read_all(text, opt);
    EXPECT_EQ(got.header, expected.header) << "chunk " << chunk;
    EXPECT_EQ(got.rows, expected.rows) << "chunk " << chunk;
  }
}

TEST(CsvReaderTest, CountsRowsAndBytes) {
  const std::string text = "a,b\n1,2\n3,4\n";
  std::istringstream in(text);
  csv_reader reader(in, csv_options{});
  reader.read_header();
  record rec;
  while (reader.next(rec)) {}
  EXPECT_EQ(reader.rows_read(), 2u);
  EXPECT_EQ(reader.bytes_read(), text.size());
}

TEST(CsvReaderTest, ReadsFromFile) {
  test_util::TempCsvFile f("x,y\n1,2\n");
  csv_reader reader(f.path(), csv_options{});
  EXPECT_EQ(reader.read_header(), (row{"x", "y"}));
  record rec;
  ASSERT_TRUE(reader.next(rec));
  EXPECT_EQ(rec.fields, (row{"1", "2"}));
  EXPECT_FALSE(reader.next(rec));
}

TEST(CsvReaderTest, MissingFileThrows) {
  EXPECT_THROW(csv_reader("/nonexistent/csvdx/none.csv", csv_options{}), std::runtime_error);
}

TEST(CsvReaderTest, ZeroChunkSizeIsRejected) {
  std::istringstream in("a\n");
  csv_options opt;
  opt.chunk_bytes = 0;
  EXPECT_THROW(csv_reader(in, opt), std::invalid_argument);
}

TEST(CsvReaderTest, ReadFaultIsAStreamError) {
  failing_buf buf("a,b\n1,2\n3,4\n");
  std::istream in(&buf);
  csv_options opt;
  opt.chunk_bytes = 4;
  csv_reader reader(in, opt);
  reader.read_header();

  record rec;
  ASSERT_TRUE(reader.next(rec));
  ASSERT_TRUE(reader.next(rec));
  try {
    reader.next(rec);
    FAIL() << "expected stream_error";
  } catch (const stream_error& e) {
    EXPECT_EQ(e.row_index(), 2u);
  }
}
