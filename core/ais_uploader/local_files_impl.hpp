// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_LOCAL_FILES_IMPL_HPP
#define AIS_LOCAL_FILES_IMPL_HPP

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include "local_files.hpp"

namespace ais {
namespace uploader {

class LocalFileSystem : public ILocalFileSystem {
public:
  LocalFileStat stat(const std::string& path) const override {
    LocalFileStat result;
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
      result.error = ec.message();
      return result;
    }
    if (!std::filesystem::is_regular_file(status)) {
      return result;
    }
    result.exists = true;
    result.size = static_cast<uint64_t>(std::filesystem::file_size(path, ec));
    if (ec) {
      result.error = ec.message();
    }
    return result;
  }
};

/**
 * IArchiveReader over a read-only file descriptor. Reads use pread, so the
 * descriptor has no shared offset to reset between ranges.
 */
class ArchiveReader : public IArchiveReader {
public:
  explicit ArchiveReader(const std::string& path)
      : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)),
        open_errno_(fd_ < 0 ? errno : 0) {}

  ~ArchiveReader() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ArchiveReader(const ArchiveReader&) = delete;
  ArchiveReader& operator=(const ArchiveReader&) = delete;

  bool isOpen() const {
    return fd_ >= 0;
  }

  /**
   * Why the file could not be opened; empty when isOpen()
   */
  std::error_code openError() const {
    return std::error_code(open_errno_, std::generic_category());
  }

  int64_t readAt(uint64_t offset, char* buffer, uint64_t length) override {
    uint64_t total = 0;
    while (total < length) {
      ssize_t got = ::pread(
        fd_, buffer + total, static_cast<size_t>(length - total),
        static_cast<off_t>(offset + total)
      );
      if (got < 0) {
        if (errno == EINTR) {
          continue;
        }
        return -1;
      }
      if (got == 0) {
        break;
      }
      total += static_cast<uint64_t>(got);
    }
    return static_cast<int64_t>(total);
  }

private:
  int fd_;
  int open_errno_;
};

class ArchiveReaderFactory : public IArchiveReaderFactory {
public:
  std::unique_ptr<IArchiveReader> open(const std::string& path, std::error_code& error) override {
    auto reader = std::make_unique<ArchiveReader>(path);
    if (!reader->isOpen()) {
      error = reader->openError();
      return nullptr;
    }
    error.clear();
    return reader;
  }
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_LOCAL_FILES_IMPL_HPP
