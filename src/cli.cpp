/**
 * datapilot - Command-line utility for inspecting delimited data files
 */

#include "datapilot.h"

#include <spdlog/cfg/env.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std;

constexpr size_t DEFAULT_NUM_ROWS = 10;
constexpr const char* VERSION = "0.1.0";

void printVersion() {
  cout << "datapilot version " << VERSION << "\n";
}

void printUsage(const char* prog) {
  cerr << "datapilot - Format, dialect and encoding detection for tabular files\n\n";
  cerr << "Usage: " << prog << " <command> [options] <file>\n\n";
  cerr << "Commands:\n";
  cerr << "  detect        Detect format, encoding and dialect\n";
  cerr << "  validate      Check whether the file can be parsed\n";
  cerr << "  head          Display the first N rows (default: " << DEFAULT_NUM_ROWS << ")\n";
  cerr << "  count         Count the data rows and report parse errors\n";
  cerr << "\nArguments:\n";
  cerr << "  file          Path to the input file, or '-' to read from stdin\n";
  cerr << "                (validate requires a path).\n";
  cerr << "\nOptions:\n";
  cerr << "  -n <num>      Number of rows (for head)\n";
  cerr << "  -H            No header row in input\n";
  cerr << "  -d <delim>    Field delimiter (disables delimiter detection)\n";
  cerr << "                Values: comma, tab, semicolon, pipe, or single character\n";
  cerr << "  -q <char>     Quote character (default: detected)\n";
  cerr << "  -e <char>     Escape character inside quotes (default: the quote)\n";
  cerr << "  -E <enc>      Override encoding detection\n";
  cerr << "                Values: utf-8, utf-16le, utf-16be, latin1\n";
  cerr << "  -f <format>   Force a format (csv, tsv) instead of detecting it\n";
  cerr << "  -V            Verbose logging (same as SPDLOG_LEVEL=debug)\n";
  cerr << "  -h            Show this help message\n";
  cerr << "  -v            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " detect data.csv\n";
  cerr << "  " << prog << " validate export.txt\n";
  cerr << "  " << prog << " head -n 5 data.csv\n";
  cerr << "  " << prog << " count -d semicolon european.csv\n";
  cerr << "  " << prog << " head -E latin1 -f csv legacy.txt\n";
}

static bool parseDelimiter(const string& value, char& delimiter) {
  if (value == "comma") {
    delimiter = ',';
  } else if (value == "tab") {
    delimiter = '\t';
  } else if (value == "semicolon") {
    delimiter = ';';
  } else if (value == "pipe") {
    delimiter = '|';
  } else if (value.size() == 1) {
    delimiter = value[0];
  } else {
    return false;
  }
  return true;
}

static string formatPercent(double confidence) {
  ostringstream ss;
  ss << fixed << setprecision(1) << confidence * 100.0 << "%";
  return ss.str();
}

static bool isStdinInput(const char* filename) {
  return filename == nullptr || strcmp(filename, "-") == 0;
}

static vector<uint8_t> readStdin() {
  return vector<uint8_t>(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
}

static void printFormatError(const datapilot::FormatException& e) {
  cerr << "Error: " << e.what() << "\n";
  for (const auto& fix : e.suggested_fixes()) {
    cerr << "Hint: " << fix << "\n";
  }
}

// Input resolved to a parser, ready for parse()
struct OpenedInput {
  datapilot::ParserSelection selection;
  unique_ptr<datapilot::ByteSource> source;
};

static OpenedInput openInput(const datapilot::FormatRegistry& registry, const char* filename,
                             const datapilot::ParseOptions& options) {
  OpenedInput input;
  if (isStdinInput(filename)) {
    vector<uint8_t> bytes = readStdin();
    input.selection = registry.get_parser(bytes.data(), bytes.size(), options);
    input.source = make_unique<datapilot::MemorySource>(std::move(bytes), "<stdin>");
  } else {
    input.selection = registry.get_parser(filename, options);
    input.source = make_unique<datapilot::FileSource>(filename);
  }
  return input;
}

// Write one field, quoting it when it contains the delimiter, a quote or a line break
static void writeField(const string& field, char delimiter) {
  bool needs_quotes = field.find_first_of(string{delimiter, '"', '\n', '\r'}) != string::npos;
  if (!needs_quotes) {
    cout << field;
    return;
  }
  cout << '"';
  for (char c : field) {
    if (c == '"') {
      cout << '"';
    }
    cout << c;
  }
  cout << '"';
}

static void writeRow(const vector<string>& fields, char delimiter) {
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      cout << delimiter;
    }
    writeField(fields[i], delimiter);
  }
  cout << '\n';
}

static void printErrors(const datapilot::ParseStats& stats) {
  if (stats.errors.empty()) {
    return;
  }
  datapilot::ErrorCollector collector;
  for (const auto& error : stats.errors) {
    collector.add_error(error);
  }
  cerr << collector.summary() << "\n";
  if (stats.suppressed_errors > 0) {
    cerr << "(" << stats.suppressed_errors << " more errors suppressed)\n";
  }
}

int cmdDetect(const datapilot::FormatRegistry& registry, const char* filename,
              const datapilot::ParseOptions& options) {
  OpenedInput input = openInput(registry, filename, options);
  const auto& detection = input.selection.detection;
  const auto& meta = detection.metadata;

  auto value = [&meta](const char* key) {
    auto it = meta.find(key);
    return it == meta.end() ? string("-") : it->second;
  };

  cout << "Detected format:\n";
  cout << "  Format:       " << input.selection.format << "\n";
  cout << "  Confidence:   " << formatPercent(detection.confidence) << "\n";
  cout << "  Encoding:     " << detection.encoding << " (" << value("encoding_confidence")
       << ", BOM: " << value("has_bom") << ")\n";
  cout << "  Delimiter:    " << value("delimiter") << " (" << value("delimiter_confidence")
       << ")\n";
  cout << "  Quote:        " << value("quote") << " (" << value("quote_confidence") << ")\n";
  cout << "  Has header:   " << value("has_header") << " (" << value("header_confidence")
       << ")\n";
  cout << "  Line ending:  " << value("line_ending") << " (" << value("line_ending_confidence")
       << ")\n";
  cout << "  Columns:      " << detection.estimated_columns << "\n";
  cout << "  Rows (est.):  " << detection.estimated_rows << "\n";
  cout << "  Candidates:   " << value("candidates") << "\n";

  datapilot::ValidationResult verdict = datapilot::validate_detection(detection);
  for (const auto& warning : verdict.warnings) {
    cerr << "Warning: " << warning << "\n";
  }
  return 0;
}

int cmdValidate(const datapilot::FormatRegistry& registry, const char* filename,
                const datapilot::ParseOptions& options) {
  if (isStdinInput(filename)) {
    cerr << "Error: validate requires a file path\n";
    return 1;
  }

  datapilot::ValidationResult result;
  try {
    auto selection = registry.get_parser(filename, options);
    result = selection.parser->validate(filename);
    cout << "Format: " << selection.format << " (" << formatPercent(selection.detection.confidence)
         << ")\n";
  } catch (const datapilot::FormatException& e) {
    result.valid = false;
    result.can_proceed = false;
    result.errors.push_back(e.what());
    result.suggested_fixes = e.suggested_fixes();
  }

  cout << (result.valid ? "Valid" : "Invalid") << "\n";
  for (const auto& error : result.errors) {
    cout << "  Error: " << error << "\n";
  }
  for (const auto& warning : result.warnings) {
    cout << "  Warning: " << warning << "\n";
  }
  for (const auto& fix : result.suggested_fixes) {
    cout << "  Suggestion: " << fix << "\n";
  }
  return result.valid ? 0 : 1;
}

int cmdHead(const datapilot::FormatRegistry& registry, const char* filename, size_t num_rows,
            datapilot::ParseOptions options) {
  if (num_rows == 0) {
    return 0;
  }
  options.max_rows = num_rows;
  OpenedInput input = openInput(registry, filename, options);
  auto& parser = *input.selection.parser;

  auto rows = parser.parse(std::move(input.source));
  char delimiter = ',';
  if (auto* delimited = dynamic_cast<datapilot::DelimitedParser*>(&parser)) {
    delimiter = delimited->dialect().delimiter;
  }
  if (!parser.header().empty()) {
    writeRow(parser.header(), delimiter);
  }
  for (const auto& row : rows) {
    writeRow(row.fields, delimiter);
  }
  printErrors(parser.stats());
  return 0;
}

int cmdCount(const datapilot::FormatRegistry& registry, const char* filename,
             const datapilot::ParseOptions& options) {
  OpenedInput input = openInput(registry, filename, options);
  auto& parser = *input.selection.parser;

  size_t count = 0;
  for (const auto& row : parser.parse(std::move(input.source))) {
    (void)row;
    ++count;
  }
  cout << count << "\n";

  auto stats = parser.stats();
  printErrors(stats);
  datapilot::logger()->info("Counted {} rows in {:.3f}s ({} bytes)", count,
                            stats.elapsed_seconds(), stats.bytes_processed);
  return 0;
}

int main(int argc, char* argv[]) {
  setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  if (strcmp(argv[1], "-h") == 0 || strcmp(argv[1], "--help") == 0) {
    printUsage(argv[0]);
    return 0;
  }
  if (strcmp(argv[1], "-v") == 0 || strcmp(argv[1], "--version") == 0) {
    printVersion();
    return 0;
  }

  // Create the library logger first so SPDLOG_LEVEL applies to it
  datapilot::logger();
  spdlog::cfg::load_env_levels();

  string command = argv[1];
  optind = 2;

  datapilot::ParseOptions options;
  size_t num_rows = DEFAULT_NUM_ROWS;

  int c;
  while ((c = getopt(argc, argv, "n:d:q:e:E:f:HVhv")) != -1) {
    switch (c) {
    case 'n': {
      char* endptr;
      long val = strtol(optarg, &endptr, 10);
      if (*endptr != '\0' || val < 0) {
        cerr << "Error: Invalid row count '" << optarg << "'\n";
        return 1;
      }
      num_rows = static_cast<size_t>(val);
      break;
    }
    case 'd': {
      char delimiter;
      if (!parseDelimiter(optarg, delimiter)) {
        cerr << "Error: Invalid delimiter '" << optarg << "'\n";
        return 1;
      }
      options.delimiter = delimiter;
      break;
    }
    case 'q':
      if (strlen(optarg) != 1) {
        cerr << "Error: Quote character must be a single character\n";
        return 1;
      }
      options.quote = optarg[0];
      break;
    case 'e':
      if (strlen(optarg) != 1) {
        cerr << "Error: Escape character must be a single character\n";
        return 1;
      }
      options.escape = optarg[0];
      break;
    case 'E':
      if (datapilot::parse_encoding_name(optarg) == datapilot::CharEncoding::UNKNOWN) {
        cerr << "Error: Unknown encoding '" << optarg << "'\n";
        cerr << "Supported encodings: utf-8, utf-16le, utf-16be, latin1\n";
        return 1;
      }
      options.encoding = optarg;
      break;
    case 'f':
      options.format = optarg;
      break;
    case 'H':
      options.has_header = false;
      break;
    case 'V':
      datapilot::set_log_level(spdlog::level::debug);
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  const char* filename = nullptr;
  if (optind < argc) {
    filename = argv[optind];
  }

  datapilot::FormatRegistry registry;
  datapilot::register_builtin_formats(registry);

  try {
    if (command == "detect") {
      return cmdDetect(registry, filename, options);
    } else if (command == "validate") {
      return cmdValidate(registry, filename, options);
    } else if (command == "head") {
      return cmdHead(registry, filename, num_rows, options);
    } else if (command == "count") {
      return cmdCount(registry, filename, options);
    }
  } catch (const datapilot::FormatException& e) {
    printFormatError(e);
    return 1;
  } catch (const std::invalid_argument& e) {
    cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  cerr << "Error: Unknown command '" << command << "'\n\n";
  printUsage(argv[0]);
  return 1;
}
