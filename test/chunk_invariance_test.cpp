/**
 * @file chunk_invariance_test.cpp
 * @brief Splitting the input at any offset must not change the parse.
 *
 * Every input is parsed once in a single call and then again under several
 * chunking schemes: every two-way split, one byte at a time, and seeded
 * random chunk sizes. Rows, metadata and recorded errors must match exactly.
 */

#include "datapilot/streaming.h"

#include "test_util.h"

#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

using namespace datapilot;

namespace {

struct ParseOutcome {
  std::vector<Row> rows;
  std::vector<ParseError> errors;
  ParserState final_state = ParserState::FIELD_START;
};

ParseOutcome parseChunks(const std::string& input, const std::vector<size_t>& cuts,
                         const DialectConfig& config) {
  RowStateMachine machine(config);
  ParseOutcome outcome;
  size_t begin = 0;
  for (size_t cut : cuts) {
    auto rows = machine.process_chunk(input.data() + begin, cut - begin);
    outcome.rows.insert(outcome.rows.end(), rows.begin(), rows.end());
    begin = cut;
  }
  auto rows = machine.process_chunk(input.data() + begin, input.size() - begin);
  outcome.rows.insert(outcome.rows.end(), rows.begin(), rows.end());
  if (auto last = machine.finalize()) {
    outcome.rows.push_back(std::move(*last));
  }
  outcome.errors = machine.stats().errors;
  outcome.final_state = machine.state();
  return outcome;
}

void expectSameOutcome(const ParseOutcome& expected, const ParseOutcome& actual,
                       const std::string& label) {
  ASSERT_EQ(expected.rows.size(), actual.rows.size()) << label;
  for (size_t i = 0; i < expected.rows.size(); ++i) {
    const Row& a = expected.rows[i];
    const Row& b = actual.rows[i];
    EXPECT_EQ(a.index, b.index) << label << " row " << i;
    EXPECT_EQ(a.fields, b.fields) << label << " row " << i;
    EXPECT_EQ(a.raw_line, b.raw_line) << label << " row " << i;
    EXPECT_EQ(a.metadata.byte_offset, b.metadata.byte_offset) << label << " row " << i;
    EXPECT_EQ(a.metadata.line_number, b.metadata.line_number) << label << " row " << i;
    EXPECT_EQ(a.metadata.has_quoted_field, b.metadata.has_quoted_field) << label << " row " << i;
  }
  ASSERT_EQ(expected.errors.size(), actual.errors.size()) << label;
  for (size_t i = 0; i < expected.errors.size(); ++i) {
    EXPECT_EQ(expected.errors[i].code, actual.errors[i].code) << label << " error " << i;
    EXPECT_EQ(expected.errors[i].row, actual.errors[i].row) << label << " error " << i;
    EXPECT_EQ(expected.errors[i].column, actual.errors[i].column) << label << " error " << i;
    EXPECT_EQ(expected.errors[i].byte_offset, actual.errors[i].byte_offset)
        << label << " error " << i;
  }
}

void checkAllChunkings(const std::string& input, const DialectConfig& config) {
  const ParseOutcome whole = parseChunks(input, {}, config);

  for (size_t cut = 0; cut <= input.size(); ++cut) {
    expectSameOutcome(whole, parseChunks(input, {cut}, config), "split at " + std::to_string(cut));
  }

  std::vector<size_t> every_byte;
  for (size_t i = 1; i < input.size(); ++i) {
    every_byte.push_back(i);
  }
  expectSameOutcome(whole, parseChunks(input, every_byte, config), "byte by byte");

  std::mt19937 rng(20240611);
  for (int trial = 0; trial < 25; ++trial) {
    std::uniform_int_distribution<size_t> step(1, 7);
    std::vector<size_t> cuts;
    for (size_t pos = step(rng); pos < input.size(); pos += step(rng)) {
      cuts.push_back(pos);
    }
    expectSameOutcome(whole, parseChunks(input, cuts, config),
                      "random trial " + std::to_string(trial));
  }
}

const std::vector<std::string>& corpus() {
  static const std::vector<std::string> inputs = {
      "name,age\nJohn,25\nJane,30",
      "a,\"b,c\"\r\nd,\"e\"\"f\"\r\n",
      "\"multi\nline\",x\r\n\"cr\rinside\",y\r",
      "a\r\rb\r\n\r\nc\n",
      "\"\",\"\"\"\",,\n",
      "\"ab\"c,d\n\"open,field\n",
      "  pad , \" keep \" ,\t\n",
      "x,y,\n,,\n",
      "\"a\\\"b\",c\n\"d\\\\e\",\"f\\\n\"\n",
      "abcdef,gh\n\"123456\",ij\nk,lmnopq",
      "caf\xC3\xA9,\xE2\x82\xAC\n\"\xF0\x9F\x98\x80\",z\n",
  };
  return inputs;
}

} // namespace

// ============================================================================
// CHUNK INVARIANCE
// ============================================================================

TEST(ChunkInvarianceTest, DefaultDialect) {
  for (const auto& input : corpus()) {
    SCOPED_TRACE(input);
    checkAllChunkings(input, DialectConfig::csv());
  }
}

TEST(ChunkInvarianceTest, BackslashEscape) {
  DialectConfig config;
  config.escape = '\\';
  for (const auto& input : corpus()) {
    SCOPED_TRACE(input);
    checkAllChunkings(input, config);
  }
}

TEST(ChunkInvarianceTest, TrimmedFields) {
  DialectConfig config;
  config.trim_fields = true;
  for (const auto& input : corpus()) {
    SCOPED_TRACE(input);
    checkAllChunkings(input, config);
  }
}

TEST(ChunkInvarianceTest, SmallFieldLimit) {
  DialectConfig config;
  config.max_field_size = 3;
  for (const auto& input : corpus()) {
    SCOPED_TRACE(input);
    checkAllChunkings(input, config);
  }
}

TEST(ChunkInvarianceTest, SemicolonSingleQuote) {
  DialectConfig config = DialectConfig::semicolon();
  config.quote = '\'';
  config.escape = '\'';
  checkAllChunkings("'a;b';'it''s'\r\nc;'d\ne'\n;\n'x'y;z", config);
}

TEST(ChunkInvarianceTest, SplitBetweenCRAndLF) {
  const std::string input = "a,b\r\nc,d\r\n";
  RowStateMachine machine;
  auto first = machine.process_chunk(input.data(), 4);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(machine.state(), ParserState::AFTER_CR);
  auto second = machine.process_chunk(input.data() + 4, input.size() - 4);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].fields, (std::vector<std::string>{"c", "d"}));
  EXPECT_EQ(second[0].metadata.byte_offset, 5u);
  EXPECT_EQ(second[0].metadata.line_number, 2u);
}

TEST(ChunkInvarianceTest, SplitBetweenDoubledQuotes) {
  RowStateMachine machine;
  EXPECT_TRUE(machine.process_chunk("\"a\"").empty());
  EXPECT_EQ(machine.state(), ParserState::QUOTE_IN_QUOTED_FIELD);
  auto rows = machine.process_chunk("\"b\"\n");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].fields, (std::vector<std::string>{"a\"b"}));
}
