// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_range_reader.hpp"

namespace ais {
namespace uploader {

FailureKind classifyOpenError(const std::error_code& error) {
  if (error == std::errc::permission_denied || error == std::errc::operation_not_permitted) {
    return FailureKind::PERMISSION;
  }
  if (error == std::errc::no_such_file_or_directory || error == std::errc::not_a_directory) {
    return FailureKind::NOT_FOUND;
  }
  return FailureKind::LOCAL_IO;
}

RangeReadResult readFileRange(
  IArchiveReaderFactory& readers, const std::string& path, uint64_t offset, uint64_t length,
  std::vector<char>& buffer
) {
  std::error_code open_error;
  auto reader = readers.open(path, open_error);
  if (!reader) {
    return RangeReadResult::Failure(
      classifyOpenError(open_error),
      "Cannot open local file: " + path + " - " + open_error.message()
    );
  }

  buffer.resize(static_cast<size_t>(length));
  if (length == 0) {
    return RangeReadResult::Success();
  }

  int64_t got = reader->readAt(offset, buffer.data(), length);
  if (got < 0) {
    return RangeReadResult::Failure(
      FailureKind::LOCAL_IO, "Read at offset " + std::to_string(offset) + " failed: " + path
    );
  }
  if (static_cast<uint64_t>(got) != length) {
    return RangeReadResult::Failure(
      FailureKind::LOCAL_IO, "Short read from " + path + ": expected " + std::to_string(length) +
                               " bytes, got " + std::to_string(got)
    );
  }
  return RangeReadResult::Success();
}

}  // namespace uploader
}  // namespace ais
