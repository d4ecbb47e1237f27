/* @file FileLogger.cpp
 * @brief buffered fwrite-based file sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// pledge headers
#include "io/FileLogger.hpp"

using namespace pledge::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "w");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk);
  return true;
}

void FileLogger::write(const std::string& csv) {
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunk && !flush())
    std::cerr << "[FileLogger] dropped " << buffer_.size() << " buffered bytes\n";
}

bool FileLogger::flush() {
  if (!fp_)
    return buffer_.empty();

  std::size_t total = 0;
  while (total < buffer_.size()) {
    std::size_t n = std::fwrite(buffer_.data() + total, 1, buffer_.size() - total, fp_);
    if (n == 0) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      buffer_.clear();
      return false;
    }
    total += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (!fp_)
    return;
  if (!flush())
    std::cerr << "[FileLogger] flush on close failed\n";
  std::fclose(fp_);
  fp_ = nullptr;
}
