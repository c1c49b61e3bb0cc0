/**
 * @file row_state_machine_test.cpp
 * @brief Tests for the chunk-resumable row state machine.
 */

#include "datapilot/streaming.h"

#include "test_util.h"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

using namespace datapilot;
using test_util::Fields;
using test_util::fieldsOf;
using test_util::parseAll;

//-----------------------------------------------------------------------------
// Basic parsing
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, SimpleRowsWithoutTrailingNewline) {
  RowStateMachine machine;
  auto rows = machine.process_chunk("name,age\nJohn,25\nJane,30");
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_TRUE(machine.has_pending_data());

  auto last = machine.finalize();
  ASSERT_TRUE(last.has_value());
  rows.push_back(*last);

  EXPECT_EQ(fieldsOf(rows), (Fields{{"name", "age"}, {"John", "25"}, {"Jane", "30"}}));
  EXPECT_EQ(rows[0].index, 0u);
  EXPECT_EQ(rows[1].index, 1u);
  EXPECT_EQ(rows[2].index, 2u);
}

TEST(RowStateMachineTest, QuotedFieldWithDelimiter) {
  auto rows = parseAll("a,\"b,c\"\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b,c"}}));
  EXPECT_TRUE(rows[0].metadata.has_quoted_field);
}

TEST(RowStateMachineTest, DoubledQuoteIsLiteralQuote) {
  auto rows = parseAll("a,\"b\"\"c\"\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b\"c"}}));
}

TEST(RowStateMachineTest, QuotedFieldWithEmbeddedNewlines) {
  auto rows = parseAll("\"line1\nline2\",x\n\"a\r\nb\",y\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"line1\nline2", "x"}, {"a\r\nb", "y"}}));
}

TEST(RowStateMachineTest, EmptyQuotedField) {
  auto rows = parseAll("\"\",b\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"", "b"}}));
}

TEST(RowStateMachineTest, QuoteInsideUnquotedFieldIsData) {
  auto rows = parseAll("ab\"c,d\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"ab\"c", "d"}}));
  EXPECT_FALSE(rows[0].metadata.has_quoted_field);
}

TEST(RowStateMachineTest, EmptyFields) {
  auto rows = parseAll(",,\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"", "", ""}}));
}

TEST(RowStateMachineTest, TrailingDelimiterAtEndOfStream) {
  auto rows = parseAll("a,b,");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b", ""}}));
}

TEST(RowStateMachineTest, BlankLineIsSingleEmptyField) {
  auto rows = parseAll("a\n\nb\n");
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_TRUE(rows[1].is_blank());
  EXPECT_EQ(rows[1].raw_line, "");
}

TEST(RowStateMachineTest, EmptyInput) {
  RowStateMachine machine;
  EXPECT_TRUE(machine.process_chunk("").empty());
  EXPECT_FALSE(machine.finalize().has_value());
}

TEST(RowStateMachineTest, FinalizeWithNothingPending) {
  RowStateMachine machine;
  auto rows = machine.process_chunk("a,b\n");
  EXPECT_EQ(rows.size(), 1u);
  EXPECT_FALSE(machine.has_pending_data());
  EXPECT_FALSE(machine.finalize().has_value());
}

//-----------------------------------------------------------------------------
// Line endings
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, CRLFIsSingleTerminator) {
  auto rows = parseAll("a,b\r\nc,d\r\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b"}, {"c", "d"}}));
  EXPECT_EQ(rows[0].raw_line, "a,b");
  EXPECT_EQ(rows[1].metadata.line_number, 2u);
}

TEST(RowStateMachineTest, BareCRTerminatesRow) {
  auto rows = parseAll("a,b\rc,d\r");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b"}, {"c", "d"}}));
}

TEST(RowStateMachineTest, CRAtEndOfStreamHasNoPendingRow) {
  RowStateMachine machine;
  auto rows = machine.process_chunk("a\r");
  EXPECT_EQ(rows.size(), 1u);
  EXPECT_EQ(machine.state(), ParserState::AFTER_CR);
  EXPECT_FALSE(machine.finalize().has_value());
}

TEST(RowStateMachineTest, MixedLineEndings) {
  auto rows = parseAll("a\nb\r\nc\rd");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a"}, {"b"}, {"c"}, {"d"}}));
}

TEST(RowStateMachineTest, CRThenCRIsBlankRow) {
  auto rows = parseAll("a\r\rb\r");
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_TRUE(rows[1].is_blank());
}

//-----------------------------------------------------------------------------
// Trim policy
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, TrimAppliesToUnquotedFieldsOnly) {
  DialectConfig config;
  config.trim_fields = true;
  auto rows = parseAll("  a ,\" b \",\tc\t\n", config);
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", " b ", "c"}}));
}

TEST(RowStateMachineTest, NoTrimByDefault) {
  auto rows = parseAll("  a , b\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"  a ", " b"}}));
}

TEST(RowStateMachineTest, TrimWhitespaceOnlyField) {
  DialectConfig config;
  config.trim_fields = true;
  auto rows = parseAll("a,   ,b\n", config);
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "", "b"}}));
}

//-----------------------------------------------------------------------------
// Escapes and malformed quotes
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, BackslashEscapeInsideQuotes) {
  DialectConfig config;
  config.escape = '\\';
  auto rows = parseAll("\"a\\\"b\",c\n\"d\\\\e\",f\n", config);
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a\"b", "c"}, {"d\\e", "f"}}));
}

TEST(RowStateMachineTest, BackslashOutsideQuotesIsData) {
  DialectConfig config;
  config.escape = '\\';
  auto rows = parseAll("a\\b,c\n", config);
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a\\b", "c"}}));
}

TEST(RowStateMachineTest, CharacterAfterClosingQuoteStartsNewField) {
  RowStateMachine machine;
  auto rows = parseAll(machine, "\"ab\"c,d\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"ab", "c", "d"}}));
  EXPECT_EQ(rows[0].raw_line, "\"ab\"c,d");

  const auto& errors = machine.error_collector();
  EXPECT_EQ(errors.count(ErrorCode::INVALID_QUOTE_ESCAPE), 1u);
  EXPECT_EQ(errors.errors()[0].severity, ErrorSeverity::RECOVERABLE);
  EXPECT_EQ(errors.errors()[0].row, 0u);
  EXPECT_EQ(errors.errors()[0].byte_offset, 4u);
}

TEST(RowStateMachineTest, UnclosedQuoteReturnsBufferedContent) {
  RowStateMachine machine;
  auto rows = machine.process_chunk("x,y\na,\"bc\nd");
  EXPECT_EQ(rows.size(), 1u);
  EXPECT_EQ(machine.state(), ParserState::IN_QUOTED_FIELD);

  auto last = machine.finalize();
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->fields, (std::vector<std::string>{"a", "bc\nd"}));

  auto stats = machine.stats();
  ASSERT_EQ(stats.errors.size(), 1u);
  EXPECT_EQ(stats.errors[0].code, ErrorCode::UNCLOSED_QUOTE);
  EXPECT_EQ(stats.errors[0].row, 1u);
  EXPECT_EQ(stats.errors[0].byte_offset, 6u);
}

TEST(RowStateMachineTest, ClosedQuoteAtEndOfStream) {
  RowStateMachine machine;
  auto rows = parseAll(machine, "a,\"b\"");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b"}}));
  EXPECT_FALSE(machine.error_collector().has_errors());
}

//-----------------------------------------------------------------------------
// Field size limit
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, OversizedFieldIsTruncatedAndRecorded) {
  DialectConfig config;
  config.max_field_size = 4;
  RowStateMachine machine(config);
  auto rows = parseAll(machine, "abcdefgh,x\nok,\"123456\"\n");

  EXPECT_EQ(fieldsOf(rows), (Fields{{"abcd", "x"}, {"ok", "1234"}}));
  EXPECT_EQ(rows[0].raw_line, "abcd,x");

  const auto& errors = machine.error_collector();
  EXPECT_EQ(errors.count(ErrorCode::FIELD_TOO_LARGE), 2u);
  EXPECT_EQ(errors.errors()[0].row, 0u);
  EXPECT_EQ(errors.errors()[0].column, 1u);
  EXPECT_EQ(errors.errors()[1].row, 1u);
  EXPECT_EQ(errors.errors()[1].column, 2u);
}

TEST(RowStateMachineTest, FieldAtExactLimitIsNotAnError) {
  DialectConfig config;
  config.max_field_size = 3;
  RowStateMachine machine(config);
  auto rows = parseAll(machine, "abc,de\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"abc", "de"}}));
  EXPECT_FALSE(machine.error_collector().has_errors());
}

//-----------------------------------------------------------------------------
// Row metadata
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, RowMetadataTracksOffsetsAndLines) {
  auto rows = parseAll("a\n\"x\ny\"\nb\n");
  ASSERT_EQ(rows.size(), 3u);
  EXPECT_EQ(rows[0].metadata.byte_offset, 0u);
  EXPECT_EQ(rows[0].metadata.line_number, 1u);
  EXPECT_EQ(rows[1].metadata.byte_offset, 2u);
  EXPECT_EQ(rows[1].metadata.line_number, 2u);
  EXPECT_EQ(rows[1].raw_line, "\"x\ny\"");
  EXPECT_EQ(rows[2].metadata.byte_offset, 8u);
  EXPECT_EQ(rows[2].metadata.line_number, 4u);
}

TEST(RowStateMachineTest, RawLinePreservesQuotes) {
  auto rows = parseAll("1,\"he said \"\"hi\"\"\",3\n");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0][1], "he said \"hi\"");
  EXPECT_EQ(rows[0].raw_line, "1,\"he said \"\"hi\"\"\",3");
}

//-----------------------------------------------------------------------------
// Dialects
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, TabDelimited) {
  auto rows = parseAll("a\tb,c\t\"d\te\"\n", DialectConfig::tsv());
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "b,c", "d\te"}}));
}

TEST(RowStateMachineTest, SingleQuoteCharacter) {
  DialectConfig config = DialectConfig::semicolon();
  config.quote = '\'';
  config.escape = '\'';
  auto rows = parseAll("'a;b';'it''s'\n", config);
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a;b", "it's"}}));
}

TEST(RowStateMachineTest, InvalidConfigRejectedAtConstruction) {
  DialectConfig config;
  config.delimiter = '"';
  EXPECT_THROW(RowStateMachine machine(config), std::invalid_argument);
}

//-----------------------------------------------------------------------------
// Stats, reset and abort
//-----------------------------------------------------------------------------

TEST(RowStateMachineTest, StatsAccumulateAcrossChunks) {
  RowStateMachine machine;
  machine.process_chunk("a,b\n");
  machine.process_chunk("c,d\ne");
  machine.finalize();

  auto stats = machine.stats();
  EXPECT_EQ(stats.bytes_processed, 9u);
  EXPECT_EQ(stats.rows_processed, 3u);
  EXPECT_TRUE(stats.errors.empty());
  ASSERT_TRUE(stats.end_time.has_value());
  EXPECT_GE(stats.elapsed_seconds(), 0.0);
}

TEST(RowStateMachineTest, ResetKeepsConfigAndRestartsIndices) {
  DialectConfig config = DialectConfig::semicolon();
  RowStateMachine machine(config);
  machine.process_chunk("a;b\n\"unterminated");
  machine.reset();

  EXPECT_EQ(machine.config(), config);
  EXPECT_EQ(machine.state(), ParserState::FIELD_START);
  EXPECT_FALSE(machine.has_pending_data());
  EXPECT_EQ(machine.stats().rows_processed, 0u);

  auto rows = parseAll(machine, "x;y\n");
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].index, 0u);
  EXPECT_EQ(rows[0].fields, (std::vector<std::string>{"x", "y"}));
}

TEST(RowStateMachineTest, AbortStopsProcessing) {
  RowStateMachine machine;
  auto rows = machine.process_chunk("a,b\nc,");
  EXPECT_EQ(rows.size(), 1u);

  machine.abort();
  EXPECT_TRUE(machine.is_aborted());
  EXPECT_TRUE(machine.process_chunk("d\ne,f\n").empty());
  EXPECT_FALSE(machine.has_pending_data());
  EXPECT_FALSE(machine.finalize().has_value());
}

TEST(RowStateMachineTest, ResetClearsAbort) {
  RowStateMachine machine;
  machine.abort();
  machine.reset();
  EXPECT_FALSE(machine.is_aborted());
  EXPECT_EQ(machine.process_chunk("a\n").size(), 1u);
}

TEST(RowStateMachineTest, MoveConstructedMachineContinues) {
  RowStateMachine machine;
  machine.process_chunk("a,\"b");
  RowStateMachine moved(std::move(machine));
  auto rows = moved.process_chunk("c\"\n");
  EXPECT_EQ(fieldsOf(rows), (Fields{{"a", "bc"}}));
}

TEST(RowStateMachineTest, StateNames) {
  EXPECT_STREQ(parser_state_to_string(ParserState::FIELD_START), "FIELD_START");
  EXPECT_STREQ(parser_state_to_string(ParserState::IN_FIELD), "IN_FIELD");
  EXPECT_STREQ(parser_state_to_string(ParserState::IN_QUOTED_FIELD), "IN_QUOTED_FIELD");
  EXPECT_STREQ(parser_state_to_string(ParserState::QUOTE_IN_QUOTED_FIELD),
               "QUOTE_IN_QUOTED_FIELD");
  EXPECT_STREQ(parser_state_to_string(ParserState::ESCAPE_IN_QUOTED_FIELD),
               "ESCAPE_IN_QUOTED_FIELD");
  EXPECT_STREQ(parser_state_to_string(ParserState::AFTER_CR), "AFTER_CR");
}
