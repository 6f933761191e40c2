// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_transfer_worker.hpp"

#include <vector>

#include "file_range_reader.hpp"

#define AIS_LOG_COMPONENT "part_worker"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;

PartTransferWorker::PartTransferWorker(IObjectStore& store, IArchiveReaderFactory& readers)
    : store_(store)
    , readers_(readers) {}

PartTransferResult PartTransferWorker::transferPart(
  const std::string& file_path, const PartSpec& spec, const MultipartHandle& handle
) const {
  if (spec.part_number < 1 || spec.end <= spec.start) {
    return PartTransferResult::Failure(
      spec.part_number, FailureKind::INVALID_INPUT, "Invalid part specification"
    );
  }

  // Part tasks run on TaskGroup threads, which do not inherit the
  // session thread's object scope.
  AIS_LOG_SCOPED_OBJECT(handle.key);
  AIS_LOG_SCOPED_PART(spec.part_number);

  std::vector<char> buffer;
  auto read = readFileRange(readers_, file_path, spec.start, spec.length(), buffer);
  if (!read.success) {
    AIS_LOG_ERROR(
      "Reading part failed" << kv("path", file_path) << " - " << read.error_message
    );
    return PartTransferResult::Failure(spec.part_number, read.kind, read.error_message);
  }

  auto sent = store_.uploadPart(handle, spec.part_number, buffer.data(), spec.length());
  if (!sent.success) {
    AIS_LOG_ERROR(
      "Part upload failed" << kv("code", sent.error_code) << " - " << sent.error_message
    );
    return PartTransferResult::Failure(spec.part_number, sent.kind, sent.error_message);
  }

  PartReceipt receipt;
  receipt.part_number = spec.part_number;
  receipt.size = spec.length();
  receipt.etag = sent.value;

  AIS_LOG_DEBUG("Part committed" << kv("bytes", receipt.size) << kv("etag", receipt.etag));
  return PartTransferResult::Success(receipt);
}

}  // namespace uploader
}  // namespace ais
