// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_FILE_RANGE_READER_HPP
#define AIS_FILE_RANGE_READER_HPP

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

#include "transfer_error.hpp"
#include "local_files.hpp"

namespace ais {
namespace uploader {

struct RangeReadResult {
  bool success;
  FailureKind kind;
  std::string error_message;

  static RangeReadResult Success() {
    return {true, FailureKind::NONE, ""};
  }

  static RangeReadResult Failure(FailureKind kind, const std::string& message) {
    return {false, kind, message};
  }
};

/**
 * Map the reason a local file could not be opened to a failure kind:
 * EACCES/EPERM are PERMISSION, ENOENT/ENOTDIR are NOT_FOUND, anything
 * else (EMFILE, EIO, ...) is LOCAL_IO.
 */
FailureKind classifyOpenError(const std::error_code& error);

/**
 * Read exactly `length` bytes starting at `offset` into `buffer`.
 *
 * The buffer is resized to `length`. A file that cannot be opened fails
 * with the kind classifyOpenError gives; a read error or short read fails
 * with LOCAL_IO.
 */
RangeReadResult readFileRange(
  IArchiveReaderFactory& readers, const std::string& path, uint64_t offset, uint64_t length,
  std::vector<char>& buffer
);

}  // namespace uploader
}  // namespace ais

#endif  // AIS_FILE_RANGE_READER_HPP
