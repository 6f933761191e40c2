// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_LOCAL_FILES_HPP
#define AIS_LOCAL_FILES_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace ais {
namespace uploader {

/**
 * What the local filesystem reports about one archive.
 * `error` is set when the query itself failed (permissions, I/O), in
 * which case `exists` and `size` carry no information.
 */
struct LocalFileStat {
  bool exists = false;
  uint64_t size = 0;
  std::string error;
};

/**
 * Local archive metadata, injectable so tests can fake missing files,
 * size drift and stat errors.
 */
class ILocalFileSystem {
public:
  virtual ~ILocalFileSystem() = default;

  virtual LocalFileStat stat(const std::string& path) const = 0;
};

/**
 * Positional reader over one open archive. Each part transfer opens its
 * own reader, so implementations need not be thread-safe.
 */
class IArchiveReader {
public:
  virtual ~IArchiveReader() = default;

  /**
   * Read up to `length` bytes starting at `offset`.
   * @return Bytes read (fewer than `length` at end of file), or -1 on error
   */
  virtual int64_t readAt(uint64_t offset, char* buffer, uint64_t length) = 0;
};

class IArchiveReaderFactory {
public:
  virtual ~IArchiveReaderFactory() = default;

  /**
   * @param error Set to the reason when the file cannot be opened
   * @return A reader, or nullptr if the file cannot be opened
   */
  virtual std::unique_ptr<IArchiveReader> open(
    const std::string& path, std::error_code& error
  ) = 0;
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_LOCAL_FILES_HPP
