/**
 * @file source.h
 * @brief Byte sources feeding the parsers.
 *
 * The parsing core never performs I/O itself. A ByteSource hands out bytes in
 * caller-sized chunks; no seeking is assumed. Detection that needs a bounded
 * prefix uses read_prefix() or reads the first chunk of the source.
 */

#ifndef DATAPILOT_SOURCE_H
#define DATAPILOT_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace datapilot {

/**
 * @brief Sequential byte supplier.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * @brief Read up to @p capacity bytes into @p out.
   * @return Number of bytes read, 0 at end of input
   * @throws FormatException with IO_ERROR on read failure
   */
  virtual size_t read(uint8_t* out, size_t capacity) = 0;

  /// Display name used in messages (a path, or "<memory>")
  virtual std::string name() const = 0;

  /// Total size in bytes if known up front
  virtual std::optional<size_t> size_hint() const { return std::nullopt; }
};

/**
 * @brief Reads a file through POSIX open/read.
 *
 * The constructor opens the file and throws FormatException with
 * FILE_NOT_FOUND, PERMISSION_DENIED or IO_ERROR if it cannot.
 */
class FileSource : public ByteSource {
public:
  explicit FileSource(const std::string& path);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  size_t read(uint8_t* out, size_t capacity) override;
  std::string name() const override { return path_; }
  std::optional<size_t> size_hint() const override { return size_; }

private:
  std::string path_;
  int fd_ = -1;
  size_t size_ = 0;
};

/**
 * @brief Serves bytes from an owned in-memory buffer.
 */
class MemorySource : public ByteSource {
public:
  explicit MemorySource(std::vector<uint8_t> data, std::string name = "<memory>")
      : data_(std::move(data)), name_(std::move(name)) {}

  explicit MemorySource(std::string_view text, std::string name = "<memory>")
      : data_(text.begin(), text.end()), name_(std::move(name)) {}

  size_t read(uint8_t* out, size_t capacity) override;
  std::string name() const override { return name_; }
  std::optional<size_t> size_hint() const override { return data_.size(); }

private:
  std::vector<uint8_t> data_;
  std::string name_;
  size_t pos_ = 0;
};

/// Read at most @p max_bytes from the start of a file.
/// @throws FormatException if the file cannot be opened or read
std::vector<uint8_t> read_prefix(const std::string& path, size_t max_bytes);

/// Fill @p out from @p source until @p max_bytes are read or the source is exhausted.
size_t read_fully(ByteSource& source, std::vector<uint8_t>& out, size_t max_bytes);

/// Lowercase extension including the dot (".csv"), or empty if none.
std::string file_extension(const std::string& path);

} // namespace datapilot

#endif // DATAPILOT_SOURCE_H
