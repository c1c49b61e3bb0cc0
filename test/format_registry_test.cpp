/**
 * @file format_registry_test.cpp
 * @brief Tests for format registration and parser selection.
 */

#include "datapilot/delimited_parser.h"
#include "datapilot/error.h"
#include "datapilot/format_registry.h"

#include "test_util.h"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace datapilot;
using test_util::TempCsvFile;

namespace {

class FixedDetector : public FormatDetector {
public:
  explicit FixedDetector(double confidence) : confidence_(confidence) {}

  FormatDetectionResult detect(const DetectionSample&) const override {
    FormatDetectionResult result;
    result.confidence = confidence_;
    return result;
  }

private:
  double confidence_;
};

class ThrowingDetector : public FormatDetector {
public:
  FormatDetectionResult detect(const DetectionSample&) const override {
    throw std::runtime_error("detector exploded");
  }
};

class NonStandardThrowingDetector : public FormatDetector {
public:
  FormatDetectionResult detect(const DetectionSample&) const override { throw 42; }
};

ParserFactory delimitedFactory() {
  return [](const ParseOptions& options) {
    return std::unique_ptr<FormatParser>(std::make_unique<DelimitedParser>(options));
  };
}

FormatRegistration fixedRegistration(const std::string& name, double confidence, int priority,
                                     std::vector<std::string> extensions = {}) {
  FormatRegistration registration;
  registration.format = name;
  registration.detector = std::make_shared<FixedDetector>(confidence);
  registration.parser_factory = delimitedFactory();
  registration.extensions = std::move(extensions);
  registration.priority = priority;
  return registration;
}

ParserSelection selectFor(const FormatRegistry& registry, const std::string& text,
                          const ParseOptions& options = ParseOptions()) {
  return registry.get_parser(reinterpret_cast<const uint8_t*>(text.data()), text.size(), options);
}

} // namespace

class FormatRegistryTest : public ::testing::Test {
protected:
  void SetUp() override { register_builtin_formats(registry); }

  FormatRegistry registry;
};

// ============================================================================
// REGISTRATION
// ============================================================================

TEST_F(FormatRegistryTest, BuiltinFormats) {
  EXPECT_EQ(registry.registration_count(), 2u);
  EXPECT_EQ(registry.supported_formats(), (std::vector<std::string>{"csv", "tsv"}));
  EXPECT_EQ(registry.supported_extensions(),
            (std::vector<std::string>{".csv", ".tab", ".tsv"}));
  EXPECT_TRUE(registry.is_format_supported("csv"));
  EXPECT_FALSE(registry.is_format_supported("json"));

  auto csv = registry.format_info("csv");
  ASSERT_TRUE(csv.has_value());
  EXPECT_EQ(csv->priority, 100);
  EXPECT_EQ(csv->extensions, (std::vector<std::string>{".csv"}));

  auto tsv = registry.format_info("tsv");
  ASSERT_TRUE(tsv.has_value());
  EXPECT_EQ(tsv->priority, 90);

  EXPECT_FALSE(registry.format_info("parquet").has_value());
}

TEST(FormatRegistrationTest, ExtensionsAreNormalized) {
  FormatRegistry registry;
  registry.register_format(fixedRegistration("custom", 0.9, 1, {"DAT", ".Txt"}));
  EXPECT_EQ(registry.supported_extensions(), (std::vector<std::string>{".dat", ".txt"}));
}

TEST(FormatRegistrationTest, InvalidRegistrationsRejected) {
  FormatRegistry registry;

  auto unnamed = fixedRegistration("", 0.9, 1);
  EXPECT_THROW(registry.register_format(unnamed), std::invalid_argument);

  auto no_detector = fixedRegistration("x", 0.9, 1);
  no_detector.detector.reset();
  EXPECT_THROW(registry.register_format(no_detector), std::invalid_argument);

  auto no_factory = fixedRegistration("x", 0.9, 1);
  no_factory.parser_factory = nullptr;
  EXPECT_THROW(registry.register_format(no_factory), std::invalid_argument);

  EXPECT_EQ(registry.registration_count(), 0u);
}

TEST_F(FormatRegistryTest, ReRegistrationReplaces) {
  registry.register_format(fixedRegistration("csv", 0.7, 5, {".txt"}));

  EXPECT_EQ(registry.registration_count(), 2u);
  auto info = registry.format_info("csv");
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->priority, 5);
  EXPECT_EQ(info->extensions, (std::vector<std::string>{".txt"}));
  EXPECT_EQ(registry.supported_extensions(),
            (std::vector<std::string>{".tab", ".tsv", ".txt"}));
}

// ============================================================================
// SELECTION
// ============================================================================

TEST_F(FormatRegistryTest, CsvFileByExtension) {
  TempCsvFile file("name,age\nJohn,25\nJane,30\n");
  auto selection = registry.get_parser(file.path());
  EXPECT_EQ(selection.format, "csv");
  EXPECT_EQ(selection.detection.format, "csv");
  EXPECT_NEAR(selection.detection.confidence, 0.925, 1e-9);
  ASSERT_NE(selection.parser, nullptr);
  EXPECT_EQ(selection.parser->format_name(), "csv");

  size_t count = 0;
  for (const auto& row : selection.parser->parse_file(file.path())) {
    EXPECT_EQ(row.field_count(), 2u);
    ++count;
  }
  EXPECT_EQ(count, 2u);
}

TEST_F(FormatRegistryTest, TsvFileByExtension) {
  TempCsvFile file("a\tb\tc\n1\t2\t3\n", ".tsv");
  auto selection = registry.get_parser(file.path());
  EXPECT_EQ(selection.format, "tsv");
  EXPECT_NEAR(selection.detection.confidence, 0.95, 1e-9);
  EXPECT_EQ(selection.parser->format_name(), "tsv");
}

TEST_F(FormatRegistryTest, ExtensionMismatchIsRejected) {
  TempCsvFile file("a,b\n1,2\n", ".tsv");
  try {
    registry.get_parser(file.path());
    FAIL() << "expected FormatException";
  } catch (const FormatException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_FORMAT);
    std::string message = e.what();
    EXPECT_NE(message.find("Unsupported file format: .tsv"), std::string::npos);
    EXPECT_NE(message.find("Supported formats: csv, tsv"), std::string::npos);
    EXPECT_NE(message.find("tsv: 40.0% confidence"), std::string::npos);
    EXPECT_EQ(e.suggested_fixes().size(), 4u);
  }
}

TEST_F(FormatRegistryTest, UnknownExtensionTriesAllFormats) {
  TempCsvFile file("id,name\n1,a\n2,b\n", ".dat");
  auto selection = registry.get_parser(file.path());
  EXPECT_EQ(selection.format, "csv");
}

TEST_F(FormatRegistryTest, InMemoryTieGoesToHigherPriority) {
  // Without a path both detectors see the same tab evidence
  auto selection = selectFor(registry, "a\tb\n1\t2\n");
  EXPECT_EQ(selection.format, "csv");

  selection.parser->open(std::make_unique<MemorySource>(std::string_view("a\tb\n1\t2\n")));
  auto* delimited = dynamic_cast<DelimitedParser*>(selection.parser.get());
  ASSERT_NE(delimited, nullptr);
  EXPECT_EQ(delimited->dialect().delimiter, '\t');
}

TEST(FormatSelectionTest, ConfidenceBeatsPriority) {
  FormatRegistry registry;
  registry.register_format(fixedRegistration("likely", 0.9, 1));
  registry.register_format(fixedRegistration("favoured", 0.6, 100));
  EXPECT_EQ(selectFor(registry, "x").format, "likely");
}

TEST(FormatSelectionTest, PriorityBreaksTies) {
  FormatRegistry registry;
  registry.register_format(fixedRegistration("low", 0.7, 10));
  registry.register_format(fixedRegistration("high", 0.7, 20));
  EXPECT_EQ(selectFor(registry, "x").format, "high");
}

TEST_F(FormatRegistryTest, ForcedFormatBypassesSelection) {
  ParseOptions options;
  options.format = "tsv";
  auto selection = selectFor(registry, "a,b\n1,2\n", options);
  EXPECT_EQ(selection.format, "tsv");
  EXPECT_EQ(selection.detection.format, "tsv");
  EXPECT_DOUBLE_EQ(selection.detection.confidence, 0.0);
  EXPECT_EQ(selection.parser->format_name(), "tsv");
}

TEST_F(FormatRegistryTest, ForcedUnknownFormat) {
  ParseOptions options;
  options.format = "xml";
  try {
    selectFor(registry, "a,b\n", options);
    FAIL() << "expected FormatException";
  } catch (const FormatException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_FORMAT);
    EXPECT_STREQ(e.what(), "Unsupported format: xml. Available formats: csv, tsv");
  }
}

TEST_F(FormatRegistryTest, LowConfidenceIsRejected) {
  try {
    selectFor(registry, "\xFF\xC0\xFF\xC1\xFF\xF8");
    FAIL() << "expected FormatException";
  } catch (const FormatException& e) {
    EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_FORMAT);
    EXPECT_NE(std::string(e.what()).find("Detection results:"), std::string::npos);
  }
}

TEST_F(FormatRegistryTest, OptionsReachTheParser) {
  ParseOptions options;
  options.delimiter = '|';
  options.has_header = false;
  auto selection = selectFor(registry, "a,b\n1,2\n", options);
  auto* delimited = dynamic_cast<DelimitedParser*>(selection.parser.get());
  ASSERT_NE(delimited, nullptr);
  ASSERT_TRUE(delimited->options().delimiter.has_value());
  EXPECT_EQ(*delimited->options().delimiter, '|');
}

// ============================================================================
// FAILURES
// ============================================================================

TEST_F(FormatRegistryTest, ThrowingDetectorOnlyDisqualifiesItself) {
  FormatRegistration broken = fixedRegistration("broken", 0.0, 1, {".brk"});
  broken.detector = std::make_shared<ThrowingDetector>();
  registry.register_format(broken);

  auto selection = selectFor(registry, "a,b\n1,2\n");
  EXPECT_EQ(selection.format, "csv");

  TempCsvFile file("a,b\n1,2\n", ".brk");
  EXPECT_THROW(registry.get_parser(file.path()), FormatException);

  auto all = registry.detect_all(file.path());
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].format, "csv");
  EXPECT_EQ(all.back().format, "broken");
  EXPECT_DOUBLE_EQ(all.back().confidence, 0.0);
  EXPECT_EQ(all.back().metadata.at("error"), "detector exploded");
}

TEST(FormatSelectionTest, NonStandardExceptionOnlyDisqualifiesItself) {
  FormatRegistry registry;
  FormatRegistration bad = fixedRegistration("bad", 0.0, 200);
  bad.detector = std::make_shared<NonStandardThrowingDetector>();
  registry.register_format(bad);
  registry.register_format(fixedRegistration("good", 0.9, 1));

  ParserSelection selection;
  ASSERT_NO_THROW(selection = selectFor(registry, "a,b\n1,2\n"));
  EXPECT_EQ(selection.format, "good");

  TempCsvFile file("a,b\n1,2\n", ".dat");
  auto all = registry.detect_all(file.path());
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].format, "good");
  EXPECT_EQ(all[1].format, "bad");
  EXPECT_DOUBLE_EQ(all[1].confidence, 0.0);
  EXPECT_EQ(all[1].metadata.at("error"), "unknown exception");
}

TEST_F(FormatRegistryTest, EmptyInputs) {
  try {
    selectFor(registry, "");
    FAIL() << "expected FormatException";
  } catch (const FormatException& e) {
    EXPECT_EQ(e.code(), ErrorCode::EMPTY_FILE);
  }

  TempCsvFile empty("");
  try {
    registry.get_parser(empty.path());
    FAIL() << "expected FormatException";
  } catch (const FormatException& e) {
    EXPECT_EQ(e.code(), ErrorCode::EMPTY_FILE);
  }
}

TEST_F(FormatRegistryTest, MissingFile) {
  try {
    registry.get_parser("/nonexistent/data.csv");
    FAIL() << "expected FormatException";
  } catch (const FormatException& e) {
    EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
  }
}

TEST_F(FormatRegistryTest, DetectAllRanksEveryFormat) {
  TempCsvFile file("a\tb\n1\t2\n", ".tsv");
  auto all = registry.detect_all(file.path());
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].format, "tsv");
  EXPECT_NEAR(all[0].confidence, 0.95, 1e-9);
  EXPECT_EQ(all[1].format, "csv");
  EXPECT_NEAR(all[1].confidence, 0.925, 1e-9);
}
