/**
 * @file encoding.cpp
 * @brief Encoding detection and streaming transcoding implementation.
 *
 * Uses simdutf for UTF-8 validation and for UTF-16/Latin-1 conversion. A
 * scalar decoder handles malformed UTF-16 so that bad input degrades to
 * U+FFFD instead of failing.
 */

#include "datapilot/encoding.h"

#include "datapilot/error.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <simdutf.h>
#include <vector>

namespace datapilot {

namespace {

// Encode a Unicode code point as UTF-8 bytes.
void append_utf8(uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

bool is_high_surrogate(uint16_t unit) {
  return unit >= 0xD800 && unit <= 0xDBFF;
}

bool is_low_surrogate(uint16_t unit) {
  return unit >= 0xDC00 && unit <= 0xDFFF;
}

uint16_t read_unit(const uint8_t* p, bool little_endian) {
  return little_endian ? static_cast<uint16_t>(p[0] | (p[1] << 8))
                       : static_cast<uint16_t>((p[0] << 8) | p[1]);
}

struct Utf8Scan {
  size_t invalid_sequences = 0;
  size_t multibyte = 0;
};

// Walk the sample checking each leading byte's declared length against its
// continuation bytes. A sequence cut off by the end of the sample is not
// counted as invalid.
Utf8Scan scan_utf8(const uint8_t* data, size_t size) {
  Utf8Scan scan;
  size_t i = 0;
  while (i < size) {
    uint8_t b = data[i];
    if (b < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint8_t lo = 0x80, hi = 0xBF; // Allowed range of the second byte
    if (b >= 0xC2 && b <= 0xDF) {
      len = 2;
    } else if (b >= 0xE0 && b <= 0xEF) {
      len = 3;
      if (b == 0xE0)
        lo = 0xA0; // Overlong
      if (b == 0xED)
        hi = 0x9F; // Surrogates
    } else if (b >= 0xF0 && b <= 0xF4) {
      len = 4;
      if (b == 0xF0)
        lo = 0x90;
      if (b == 0xF4)
        hi = 0x8F;
    } else {
      ++scan.invalid_sequences;
      ++i;
      continue;
    }

    bool ok = true;
    bool truncated = false;
    for (size_t k = 1; k < len; ++k) {
      if (i + k >= size) {
        truncated = true;
        break;
      }
      uint8_t c = data[i + k];
      uint8_t min = k == 1 ? lo : 0x80;
      uint8_t max = k == 1 ? hi : 0xBF;
      if (c < min || c > max) {
        ok = false;
        break;
      }
    }
    if (truncated && ok) {
      break;
    }
    if (!ok) {
      ++scan.invalid_sequences;
      ++i;
      continue;
    }
    ++scan.multibyte;
    i += len;
  }
  return scan;
}

} // namespace

const char* encoding_to_string(CharEncoding enc) {
  switch (enc) {
  case CharEncoding::UTF8:
    return "UTF-8";
  case CharEncoding::UTF16_LE:
    return "UTF-16LE";
  case CharEncoding::UTF16_BE:
    return "UTF-16BE";
  case CharEncoding::LATIN1:
    return "Latin-1";
  case CharEncoding::UNKNOWN:
    return "Unknown";
  }
  return "Unknown";
}

CharEncoding parse_encoding_name(std::string_view name) {
  // Normalize: lowercase, remove hyphens and underscores
  std::string normalized;
  normalized.reserve(name.size());
  for (char c : name) {
    if (c != '-' && c != '_') {
      normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }

  if (normalized == "utf8")
    return CharEncoding::UTF8;
  if (normalized == "utf16le" || normalized == "utf16")
    return CharEncoding::UTF16_LE;
  if (normalized == "utf16be")
    return CharEncoding::UTF16_BE;
  if (normalized == "latin1" || normalized == "iso88591")
    return CharEncoding::LATIN1;

  return CharEncoding::UNKNOWN;
}

EncodingResult detect_encoding(const uint8_t* data, size_t size) {
  EncodingResult result;

  if (size == 0) {
    // No evidence either way
    result.confidence = 0.5;
    return result;
  }

  // BOM check is authoritative
  if (size >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
    result.encoding = "utf8";
    result.detected = CharEncoding::UTF8;
    result.confidence = 1.0;
    result.has_bom = true;
    result.bom_length = 3;
    return result;
  }
  if (size >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
    result.encoding = "utf16le";
    result.detected = CharEncoding::UTF16_LE;
    result.confidence = 1.0;
    result.has_bom = true;
    result.bom_length = 2;
    result.needs_transcoding = true;
    return result;
  }
  if (size >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
    // Big-endian bytes, reported under the little-endian label
    result.encoding = "utf16le";
    result.detected = CharEncoding::UTF16_BE;
    result.confidence = 1.0;
    result.has_bom = true;
    result.bom_length = 2;
    result.needs_transcoding = true;
    return result;
  }

  // No BOM. Null bytes are valid UTF-8 but a regular pattern of them in
  // text means UTF-16.
  size_t null_even = 0;
  size_t null_odd = 0;
  size_t control = 0;
  for (size_t i = 0; i < size; ++i) {
    uint8_t b = data[i];
    if (b == 0) {
      if (i % 2 == 0)
        ++null_even;
      else
        ++null_odd;
    }
    if ((b < 0x20 && b != '\t' && b != '\n' && b != '\r') || b == 0x7F) {
      ++control;
    }
  }
  size_t nulls = null_even + null_odd;
  result.null_ratio = static_cast<double>(nulls) / static_cast<double>(size);
  result.control_chars = control;

  if (size >= 2 && result.null_ratio >= 0.2) {
    double odd_share = static_cast<double>(null_odd) / static_cast<double>(nulls);
    double even_share = static_cast<double>(null_even) / static_cast<double>(nulls);
    if (odd_share > 0.8 || even_share > 0.8) {
      // ASCII in UTF-16LE puts the zero byte second (odd offsets)
      result.encoding = "utf16le";
      result.detected = odd_share > 0.8 ? CharEncoding::UTF16_LE : CharEncoding::UTF16_BE;
      result.confidence = std::min(0.9, result.null_ratio * 2.0);
      result.needs_transcoding = true;
      return result;
    }
  }

  result.encoding = "utf8";
  result.detected = CharEncoding::UTF8;

  const char* chars = reinterpret_cast<const char*>(data);
  if (simdutf::validate_ascii(chars, size)) {
    result.confidence = 0.95;
  } else if (simdutf::validate_utf8(chars, size)) {
    result.confidence = 0.9;
  } else {
    Utf8Scan scan = scan_utf8(data, size);
    result.invalid_sequences = scan.invalid_sequences;
    if (scan.invalid_sequences == 0) {
      // Only a sequence cut off at the end of the sample
      result.confidence = 0.9;
    } else {
      double invalid_ratio =
          static_cast<double>(scan.invalid_sequences) / static_cast<double>(size);
      result.confidence = std::max(0.1, 0.7 - 2.0 * invalid_ratio);
    }
  }

  if (static_cast<double>(control) / static_cast<double>(size) > 0.1) {
    result.confidence = std::min(result.confidence, 0.3);
  }
  return result;
}

//-----------------------------------------------------------------------------
// Utf8Transcoder
//-----------------------------------------------------------------------------

Utf8Transcoder::Utf8Transcoder(CharEncoding source, size_t bom_length)
    : source_(source), bom_remaining_(bom_length) {
  if (source == CharEncoding::UNKNOWN) {
    throw FormatException(ErrorCode::UNSUPPORTED_ENCODING, "Cannot transcode unknown encoding",
                          {"Specify the encoding explicitly (utf8, utf16le, utf16be, latin1)"});
  }
}

std::string Utf8Transcoder::convert(const uint8_t* data, size_t size) {
  // Drop the BOM, which may itself be split across chunks
  size_t skip = std::min(bom_remaining_, size);
  bom_remaining_ -= skip;
  data += skip;
  size -= skip;

  switch (source_) {
  case CharEncoding::UTF8:
    return std::string(reinterpret_cast<const char*>(data), size);

  case CharEncoding::LATIN1: {
    const char* src = reinterpret_cast<const char*>(data);
    std::string out(simdutf::utf8_length_from_latin1(src, size), '\0');
    size_t written = simdutf::convert_latin1_to_utf8(src, size, out.data());
    out.resize(written);
    return out;
  }

  case CharEncoding::UTF16_LE:
  case CharEncoding::UTF16_BE:
    return convert_utf16(data, size);

  case CharEncoding::UNKNOWN:
    break;
  }
  return std::string();
}

std::string Utf8Transcoder::convert_utf16(const uint8_t* data, size_t size) {
  const bool little_endian = source_ == CharEncoding::UTF16_LE;

  std::string bytes;
  bytes.reserve(carry_.size() + size);
  bytes.append(carry_);
  bytes.append(reinterpret_cast<const char*>(data), size);
  carry_.clear();

  const uint8_t* src = reinterpret_cast<const uint8_t*>(bytes.data());
  size_t units = bytes.size() / 2;

  // Hold back a trailing high surrogate until its partner arrives
  if (units > 0 && is_high_surrogate(read_unit(src + 2 * (units - 1), little_endian))) {
    --units;
  }
  carry_.assign(bytes, 2 * units, std::string::npos);

  if (units == 0) {
    return std::string();
  }

  // Copy into an aligned char16_t buffer to avoid misaligned access
  std::vector<char16_t> aligned16(units);
  std::memcpy(aligned16.data(), src, units * sizeof(char16_t));

  bool valid = little_endian ? simdutf::validate_utf16le(aligned16.data(), units)
                             : simdutf::validate_utf16be(aligned16.data(), units);
  if (valid) {
    size_t utf8_len = little_endian ? simdutf::utf8_length_from_utf16le(aligned16.data(), units)
                                    : simdutf::utf8_length_from_utf16be(aligned16.data(), units);
    std::string out(utf8_len, '\0');
    size_t written = little_endian
                         ? simdutf::convert_utf16le_to_utf8(aligned16.data(), units, out.data())
                         : simdutf::convert_utf16be_to_utf8(aligned16.data(), units, out.data());
    out.resize(written);
    return out;
  }

  // Malformed input: decode unit by unit, replacing unpaired surrogates
  std::string out;
  out.reserve(units * 3);
  for (size_t i = 0; i < units; ++i) {
    uint16_t unit = read_unit(src + 2 * i, little_endian);
    if (is_high_surrogate(unit) && i + 1 < units) {
      uint16_t next = read_unit(src + 2 * (i + 1), little_endian);
      if (is_low_surrogate(next)) {
        uint32_t cp = 0x10000 + ((static_cast<uint32_t>(unit) - 0xD800) << 10) +
                      (static_cast<uint32_t>(next) - 0xDC00);
        append_utf8(cp, out);
        ++i;
        continue;
      }
    }
    if (is_high_surrogate(unit) || is_low_surrogate(unit)) {
      append_utf8(REPLACEMENT_CHAR, out);
    } else {
      append_utf8(unit, out);
    }
  }
  return out;
}

std::string Utf8Transcoder::finish() {
  std::string out;
  if (!carry_.empty()) {
    append_utf8(REPLACEMENT_CHAR, out);
    carry_.clear();
  }
  return out;
}

} // namespace datapilot
