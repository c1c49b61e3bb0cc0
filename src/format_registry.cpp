/**
 * @file format_registry.cpp
 * @brief Format registration, candidate ranking and parser selection.
 */

#include "datapilot/format_registry.h"

#include "datapilot/delimited_parser.h"
#include "datapilot/error.h"
#include "datapilot/logging.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace datapilot {

namespace {

std::string normalize_extension(const std::string& ext) {
  std::string normalized;
  normalized.reserve(ext.size() + 1);
  if (ext.empty() || ext[0] != '.') {
    normalized += '.';
  }
  for (char c : ext) {
    normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return normalized;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += sep;
    }
    out += items[i];
  }
  return out;
}

DetectionSample make_sample(const std::vector<uint8_t>& bytes, const std::string& path,
                            std::optional<size_t> total_size) {
  DetectionSample sample;
  sample.data = bytes.data();
  sample.size = bytes.size();
  sample.path = path;
  sample.total_size = total_size;
  return sample;
}

} // anonymous namespace

void FormatRegistry::register_format(FormatRegistration registration) {
  if (registration.format.empty()) {
    throw std::invalid_argument("Format name cannot be empty");
  }
  if (!registration.detector) {
    throw std::invalid_argument("Format '" + registration.format + "' has no detector");
  }
  if (!registration.parser_factory) {
    throw std::invalid_argument("Format '" + registration.format + "' has no parser factory");
  }

  for (auto& ext : registration.extensions) {
    ext = normalize_extension(ext);
  }

  auto existing = registrations_.find(registration.format);
  if (existing != registrations_.end()) {
    logger()->warn("Format '{}' is already registered; replacing the previous registration",
                   registration.format);
    for (const auto& ext : existing->second.extensions) {
      auto& formats = extension_map_[ext];
      formats.erase(std::remove(formats.begin(), formats.end(), registration.format),
                    formats.end());
      if (formats.empty()) {
        extension_map_.erase(ext);
      }
    }
  }

  for (const auto& ext : registration.extensions) {
    auto& formats = extension_map_[ext];
    if (std::find(formats.begin(), formats.end(), registration.format) == formats.end()) {
      formats.push_back(registration.format);
    }
  }

  logger()->info("Registered format {} (extensions: {}, priority {})", registration.format,
                 join(registration.extensions, ", "), registration.priority);
  std::string name = registration.format;
  registrations_[name] = std::move(registration);
}

std::vector<const FormatRegistration*>
FormatRegistry::candidates_for(const std::string& path) const {
  std::vector<const FormatRegistration*> candidates;
  std::string ext = path.empty() ? std::string() : file_extension(path);

  auto it = ext.empty() ? extension_map_.end() : extension_map_.find(ext);
  if (it != extension_map_.end()) {
    for (const auto& format : it->second) {
      candidates.push_back(&registrations_.at(format));
    }
  } else {
    if (!path.empty()) {
      logger()->debug("No format registered for extension '{}', trying all formats", ext);
    }
    for (const auto& entry : registrations_) {
      candidates.push_back(&entry.second);
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const FormatRegistration* a, const FormatRegistration* b) {
                     return a->priority > b->priority;
                   });
  return candidates;
}

std::vector<FormatRegistry::Candidate>
FormatRegistry::run_detection(const DetectionSample& sample,
                              const std::vector<const FormatRegistration*>& regs) const {
  std::vector<Candidate> results;
  results.reserve(regs.size());
  for (const auto* reg : regs) {
    Candidate candidate{reg, FormatDetectionResult()};
    try {
      candidate.detection = reg->detector->detect(sample);
    } catch (const std::exception& e) {
      // A failing detector only disqualifies its own format
      logger()->warn("Detection failed for {}: {}", reg->format, e.what());
      candidate.detection = FormatDetectionResult();
      candidate.detection.metadata["error"] = e.what();
    } catch (...) {
      logger()->warn("Detection failed for {}: unknown exception", reg->format);
      candidate.detection = FormatDetectionResult();
      candidate.detection.metadata["error"] = "unknown exception";
    }
    candidate.detection.format = reg->format;
    results.push_back(std::move(candidate));
  }

  std::stable_sort(results.begin(), results.end(), [](const Candidate& a, const Candidate& b) {
    if (a.detection.confidence != b.detection.confidence) {
      return a.detection.confidence > b.detection.confidence;
    }
    return a.registration->priority > b.registration->priority;
  });
  return results;
}

std::string FormatRegistry::unsupported_format_message(const DetectionSample& sample,
                                                       const std::vector<Candidate>& results) const {
  std::ostringstream ss;
  std::string ext = sample.path.empty() ? std::string() : file_extension(sample.path);
  ss << "Unsupported file format";
  if (!ext.empty()) {
    ss << ": " << ext;
  } else if (!sample.path.empty()) {
    ss << ": " << sample.path;
  }
  ss << "\n\n";
  ss << "Supported formats: " << join(supported_formats(), ", ") << "\n";
  ss << "Supported extensions: " << join(supported_extensions(), ", ") << "\n";

  if (!results.empty()) {
    ss << "\nDetection results:\n";
    size_t shown = std::min<size_t>(results.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
      ss << "  - " << results[i].detection.format << ": " << std::fixed << std::setprecision(1)
         << results[i].detection.confidence * 100.0 << "% confidence\n";
    }
  }
  return ss.str();
}

ParserSelection FormatRegistry::select(const DetectionSample& sample,
                                       const ParseOptions& options) const {
  if (options.format) {
    auto it = registrations_.find(*options.format);
    if (it == registrations_.end()) {
      throw FormatException(ErrorCode::UNSUPPORTED_FORMAT,
                            "Unsupported format: " + *options.format +
                                ". Available formats: " + join(supported_formats(), ", "),
                            {"Use one of the available formats with --format"});
    }
    auto results = run_detection(sample, {&it->second});
    ParserSelection selection;
    selection.format = it->first;
    selection.detection = std::move(results.front().detection);
    selection.parser = it->second.parser_factory(options);
    logger()->info("Using requested format {}", selection.format);
    return selection;
  }

  auto results = run_detection(sample, candidates_for(sample.path));
  if (results.empty() || results.front().detection.confidence < ACCEPTANCE_FLOOR) {
    throw FormatException(ErrorCode::UNSUPPORTED_FORMAT, unsupported_format_message(sample, results),
                          {"Check if the file is corrupted",
                           "Try specifying the format explicitly: --format csv",
                           "Specify the delimiter explicitly (e.g. --delimiter ';')",
                           "Convert the file to a supported format first"});
  }

  Candidate& best = results.front();
  ParserSelection selection;
  selection.format = best.registration->format;
  selection.parser = best.registration->parser_factory(options);
  selection.detection = std::move(best.detection);
  logger()->info("Selected format {} (confidence: {:.2f})", selection.format,
                 selection.detection.confidence);
  return selection;
}

ParserSelection FormatRegistry::get_parser(const std::string& path,
                                           const ParseOptions& options) const {
  FileSource source(path);
  std::vector<uint8_t> bytes;
  read_fully(source, bytes, options.sample_size);
  if (bytes.empty()) {
    throw FormatException(ErrorCode::EMPTY_FILE, "File is empty: " + path,
                          {"Check that the file contains data"});
  }
  return select(make_sample(bytes, path, source.size_hint()), options);
}

ParserSelection FormatRegistry::get_parser(const uint8_t* data, size_t size,
                                           const ParseOptions& options) const {
  if (size == 0) {
    throw FormatException(ErrorCode::EMPTY_FILE, "Input is empty",
                          {"Check that the input contains data"});
  }
  DetectionSample sample;
  sample.data = data;
  sample.size = std::min(size, options.sample_size);
  sample.total_size = size;
  return select(sample, options);
}

std::vector<FormatDetectionResult> FormatRegistry::detect_all(const std::string& path,
                                                              const ParseOptions& options) const {
  std::vector<uint8_t> bytes = read_prefix(path, options.sample_size);
  std::vector<const FormatRegistration*> all;
  for (const auto& entry : registrations_) {
    all.push_back(&entry.second);
  }

  std::optional<size_t> total;
  if (bytes.size() == options.sample_size) {
    total = FileSource(path).size_hint();
  } else {
    total = bytes.size();
  }

  std::vector<FormatDetectionResult> detections;
  for (auto& candidate : run_detection(make_sample(bytes, path, total), all)) {
    detections.push_back(std::move(candidate.detection));
  }
  return detections;
}

std::vector<std::string> FormatRegistry::supported_formats() const {
  std::vector<std::string> formats;
  for (const auto& entry : registrations_) {
    formats.push_back(entry.first);
  }
  return formats;
}

std::vector<std::string> FormatRegistry::supported_extensions() const {
  std::vector<std::string> extensions;
  for (const auto& entry : extension_map_) {
    extensions.push_back(entry.first);
  }
  return extensions;
}

std::optional<FormatInfo> FormatRegistry::format_info(const std::string& format) const {
  auto it = registrations_.find(format);
  if (it == registrations_.end()) {
    return std::nullopt;
  }
  return FormatInfo{it->second.format, it->second.extensions, it->second.priority};
}

bool FormatRegistry::is_format_supported(const std::string& format) const {
  return registrations_.count(format) > 0;
}

//-----------------------------------------------------------------------------
// Built-in formats
//-----------------------------------------------------------------------------

namespace {

FormatRegistration delimited_registration(DelimitedFormat format, int priority) {
  FormatRegistration registration;
  registration.format = format.name;
  registration.extensions = format.extensions;
  registration.priority = priority;
  registration.detector = std::make_shared<DelimitedDetector>(format);
  registration.parser_factory = [format](const ParseOptions& options) {
    return std::unique_ptr<FormatParser>(std::make_unique<DelimitedParser>(options, format));
  };
  return registration;
}

} // anonymous namespace

void register_builtin_formats(FormatRegistry& registry) {
  registry.register_format(delimited_registration(DelimitedFormat::csv(), 100));
  registry.register_format(delimited_registration(DelimitedFormat::tsv(), 90));
}

} // namespace datapilot
