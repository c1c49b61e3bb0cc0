/**
 * @file format_registry.h
 * @brief Selection of a format handler for an input of unknown format.
 *
 * Each registered format contributes a detector and a parser factory. For an
 * input the registry runs the detectors of the formats claiming the file's
 * extension (or all of them when no format claims it), ranks the results by
 * confidence and then priority, and instantiates the winner's parser.
 *
 * @example
 * @code
 * datapilot::FormatRegistry registry;
 * datapilot::register_builtin_formats(registry);
 *
 * auto selection = registry.get_parser("orders.tsv");
 * for (const auto& row : selection.parser->parse_file("orders.tsv")) {
 *     ...
 * }
 * @endcode
 */

#ifndef DATAPILOT_FORMAT_REGISTRY_H
#define DATAPILOT_FORMAT_REGISTRY_H

#include "datapilot/format_parser.h"
#include "datapilot/options.h"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datapilot {

/// Creates a parser configured with the caller's options
using ParserFactory = std::function<std::unique_ptr<FormatParser>(const ParseOptions&)>;

/**
 * @brief Everything the registry knows about one format.
 */
struct FormatRegistration {
  std::string format;
  std::shared_ptr<const FormatDetector> detector;
  ParserFactory parser_factory;
  std::vector<std::string> extensions; ///< Normalized to lowercase with a leading dot
  int priority = 0;                    ///< Higher wins when confidences tie
};

/**
 * @brief Public summary of a registration.
 */
struct FormatInfo {
  std::string format;
  std::vector<std::string> extensions;
  int priority = 0;
};

/**
 * @brief Result of FormatRegistry::get_parser().
 */
struct ParserSelection {
  std::string format;
  std::unique_ptr<FormatParser> parser;
  FormatDetectionResult detection;
};

/**
 * @brief Registry of format handlers.
 *
 * Re-registering a format name replaces the previous registration (last
 * write wins, logged as a warning).
 *
 * @note Registration is not thread-safe. Once populated, the lookup methods
 *       only read shared state and may be called concurrently.
 */
class FormatRegistry {
public:
  FormatRegistry() = default;

  /**
   * @brief Add or replace a format.
   * @throws std::invalid_argument for an empty name, detector or factory
   */
  void register_format(FormatRegistration registration);

  /**
   * @brief Pick and instantiate the parser for a file.
   *
   * With options.format set, detection is bypassed for selection; that exact
   * format must be registered. Its detector still runs to fill in the
   * detection result.
   *
   * @throws FormatException with UNSUPPORTED_FORMAT if the forced format is
   *         unknown or no detector reaches ACCEPTANCE_FLOOR, EMPTY_FILE for an
   *         empty file, or a source error if the file cannot be read
   */
  ParserSelection get_parser(const std::string& path,
                             const ParseOptions& options = ParseOptions()) const;

  /// get_parser() for an in-memory buffer; only the extension lookup is skipped
  ParserSelection get_parser(const uint8_t* data, size_t size,
                             const ParseOptions& options = ParseOptions()) const;

  /// Detection results of every registered format for a file, best first
  std::vector<FormatDetectionResult> detect_all(const std::string& path,
                                                const ParseOptions& options = ParseOptions()) const;

  /// Registered format names, sorted
  std::vector<std::string> supported_formats() const;

  /// Registered extensions, sorted
  std::vector<std::string> supported_extensions() const;

  std::optional<FormatInfo> format_info(const std::string& format) const;

  bool is_format_supported(const std::string& format) const;

  size_t registration_count() const { return registrations_.size(); }

private:
  std::map<std::string, FormatRegistration> registrations_;
  std::map<std::string, std::vector<std::string>> extension_map_; // extension -> formats

  struct Candidate {
    const FormatRegistration* registration;
    FormatDetectionResult detection;
  };

  ParserSelection select(const DetectionSample& sample, const ParseOptions& options) const;
  std::vector<const FormatRegistration*> candidates_for(const std::string& path) const;
  std::vector<Candidate> run_detection(const DetectionSample& sample,
                                       const std::vector<const FormatRegistration*>& regs) const;
  std::string unsupported_format_message(const DetectionSample& sample,
                                         const std::vector<Candidate>& results) const;
};

/// Register the built-in delimited formats: csv (priority 100) and tsv (priority 90)
void register_builtin_formats(FormatRegistry& registry);

} // namespace datapilot

#endif // DATAPILOT_FORMAT_REGISTRY_H
