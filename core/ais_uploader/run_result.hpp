// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_RUN_RESULT_HPP
#define AIS_RUN_RESULT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "transfer_error.hpp"

namespace ais {
namespace uploader {

/**
 * One file that failed during a run.
 */
struct FileFailure {
  std::string local_path;
  std::string remote_key;
  FailureKind kind = FailureKind::UNKNOWN;
  std::string message;
};

/**
 * Counters for one UploadCoordinator::runUpload() call.
 * Invariant: total_files == uploaded + failed + skipped + deferred.
 */
struct RunResult {
  size_t total_files = 0;
  size_t uploaded = 0;
  size_t failed = 0;
  size_t skipped = 0;   // already in the ledger with matching size
  size_t deferred = 0;  // not attempted: max_files limit or stop request
  size_t ledger_errors = 0;
  uint64_t bytes_uploaded = 0;
  bool stopped = false;
  std::vector<FileFailure> failures;
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_RUN_RESULT_HPP
