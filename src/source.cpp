#include "datapilot/source.h"

#include "datapilot/error.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace datapilot {

FileSource::FileSource(const std::string& path) : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY);
  if (fd_ < 0) {
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      throw FormatException(ErrorCode::FILE_NOT_FOUND, "File not found: " + path,
                            {"Check that the path is spelled correctly",
                             "Use an absolute path if the working directory is uncertain"});
    }
    if (err == EACCES || err == EPERM) {
      throw FormatException(ErrorCode::PERMISSION_DENIED, "Permission denied: " + path,
                            {"Check the file's read permissions"});
    }
    throw FormatException(ErrorCode::IO_ERROR,
                          "Failed to open file: " + path + " (" + std::strerror(err) + ")");
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    ::close(fd_);
    fd_ = -1;
    throw FormatException(ErrorCode::IO_ERROR, "Failed to stat file: " + path);
  }
  if (S_ISDIR(st.st_mode)) {
    ::close(fd_);
    fd_ = -1;
    throw FormatException(ErrorCode::IO_ERROR, "Path is a directory: " + path,
                          {"Pass a file path rather than a directory"});
  }
  size_ = static_cast<size_t>(st.st_size);
}

FileSource::~FileSource() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

size_t FileSource::read(uint8_t* out, size_t capacity) {
  while (true) {
    ssize_t n = ::read(fd_, out, capacity);
    if (n >= 0) {
      return static_cast<size_t>(n);
    }
    if (errno != EINTR) {
      throw FormatException(ErrorCode::IO_ERROR,
                            "Failed to read file: " + path_ + " (" + std::strerror(errno) + ")");
    }
  }
}

size_t MemorySource::read(uint8_t* out, size_t capacity) {
  size_t n = std::min(capacity, data_.size() - pos_);
  if (n > 0) {
    std::memcpy(out, data_.data() + pos_, n);
    pos_ += n;
  }
  return n;
}

size_t read_fully(ByteSource& source, std::vector<uint8_t>& out, size_t max_bytes) {
  size_t start = out.size();
  out.resize(start + max_bytes);
  size_t total = 0;
  while (total < max_bytes) {
    size_t n = source.read(out.data() + start + total, max_bytes - total);
    if (n == 0) {
      break;
    }
    total += n;
  }
  out.resize(start + total);
  return total;
}

std::vector<uint8_t> read_prefix(const std::string& path, size_t max_bytes) {
  FileSource source(path);
  std::vector<uint8_t> buffer;
  read_fully(source, buffer, max_bytes);
  return buffer;
}

std::string file_extension(const std::string& path) {
  size_t slash = path.find_last_of("/\\");
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
      dot + 1 == path.size()) {
    return "";
  }
  std::string ext = path.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

} // namespace datapilot
