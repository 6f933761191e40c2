// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_PART_TRANSFER_WORKER_HPP
#define AIS_PART_TRANSFER_WORKER_HPP

#include <string>

#include "object_store.hpp"
#include "part_planner.hpp"
#include "local_files.hpp"

namespace ais {
namespace uploader {

/**
 * Outcome of one part transfer. On failure receipt.part_number still
 * identifies the part.
 */
struct PartTransferResult {
  bool success;
  PartReceipt receipt;
  FailureKind kind;
  std::string error_message;

  static PartTransferResult Success(const PartReceipt& receipt) {
    return {true, receipt, FailureKind::NONE, ""};
  }

  static PartTransferResult Failure(
    int part_number, FailureKind kind, const std::string& message
  ) {
    PartReceipt receipt;
    receipt.part_number = part_number;
    return {false, receipt, kind, message};
  }
};

/**
 * Uploads one byte range of a local file as one part of an open
 * multipart upload.
 *
 * Holds no mutable state; a single worker may be shared by all threads
 * of a session. Makes exactly one attempt per call.
 */
class PartTransferWorker {
public:
  PartTransferWorker(IObjectStore& store, IArchiveReaderFactory& readers);

  /**
   * Read [spec.start, spec.end) from file_path and send it as
   * spec.part_number.
   */
  PartTransferResult transferPart(
    const std::string& file_path, const PartSpec& spec, const MultipartHandle& handle
  ) const;

private:
  IObjectStore& store_;
  IArchiveReaderFactory& readers_;
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_PART_TRANSFER_WORKER_HPP
