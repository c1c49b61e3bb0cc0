/**
 * @file encoding.h
 * @brief Byte-encoding detection and streaming transcoding to UTF-8.
 *
 * detect_encoding() checks for a byte-order mark first; a BOM is
 * authoritative. Without one, a regular pattern of null bytes indicates
 * UTF-16, and anything else is treated as UTF-8 with a confidence that drops
 * for invalid sequences and control characters. Uses simdutf for validation
 * and conversion.
 */

#ifndef DATAPILOT_ENCODING_H
#define DATAPILOT_ENCODING_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace datapilot {

/// Character encodings the library can read.
enum class CharEncoding : uint8_t {
  UTF8 = 0,
  UTF16_LE = 1,
  UTF16_BE = 2,
  LATIN1 = 3,
  UNKNOWN = 255
};

/**
 * @brief Result of encoding detection.
 *
 * `encoding` is the normalized label handed to decoders ("utf8" or
 * "utf16le"). A big-endian BOM still reports the label "utf16le"; the actual
 * byte order is kept in `detected` so the transcoder can swap bytes.
 */
struct EncodingResult {
  std::string encoding = "utf8";
  CharEncoding detected = CharEncoding::UTF8;
  double confidence = 0.5;
  bool has_bom = false;
  size_t bom_length = 0; ///< 0, 2 or 3
  bool needs_transcoding = false;

  // Evidence gathered from the sample
  double null_ratio = 0.0;
  size_t invalid_sequences = 0;
  size_t control_chars = 0;
};

/// Get the display name of an encoding (e.g., "UTF-8", "UTF-16LE").
const char* encoding_to_string(CharEncoding enc);

/// Parse an encoding name to CharEncoding.
/// Case-insensitive, ignores '-' and '_': "utf-8", "UTF16LE", "utf_16_be",
/// "latin1", "iso-8859-1". Returns CharEncoding::UNKNOWN for unrecognized names.
CharEncoding parse_encoding_name(std::string_view name);

/// Detect the encoding of a byte sample. Stateless.
/// Empty input yields "utf8" with confidence 0.5.
EncodingResult detect_encoding(const uint8_t* data, size_t size);

inline EncodingResult detect_encoding(std::string_view sample) {
  return detect_encoding(reinterpret_cast<const uint8_t*>(sample.data()), sample.size());
}

/**
 * @brief Incremental conversion of a byte stream to UTF-8.
 *
 * Chunks may split a UTF-16 code unit or a surrogate pair; the incomplete
 * tail is carried into the next call. Unpaired surrogates and a dangling odd
 * byte at finish() become U+FFFD. UTF-8 input is passed through unchanged
 * apart from the BOM.
 *
 * @example
 * @code
 * auto enc = datapilot::detect_encoding(sample.data(), sample.size());
 * datapilot::Utf8Transcoder transcoder(enc.detected, enc.bom_length);
 * std::string text = transcoder.convert(chunk, n);
 * text += transcoder.finish();
 * @endcode
 */
class Utf8Transcoder {
public:
  /**
   * @param source Encoding of the incoming bytes
   * @param bom_length Number of leading bytes to discard
   * @throws FormatException with UNSUPPORTED_ENCODING for CharEncoding::UNKNOWN
   */
  explicit Utf8Transcoder(CharEncoding source, size_t bom_length = 0);

  /// Convert the next chunk, returning the UTF-8 text it completes.
  std::string convert(const uint8_t* data, size_t size);

  /// Flush any carried partial code unit.
  std::string finish();

  CharEncoding source() const { return source_; }

private:
  CharEncoding source_;
  size_t bom_remaining_;
  std::string carry_; // Incomplete UTF-16 tail from the previous chunk

  std::string convert_utf16(const uint8_t* data, size_t size);
};

} // namespace datapilot

#endif // DATAPILOT_ENCODING_H
