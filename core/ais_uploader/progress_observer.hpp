// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_PROGRESS_OBSERVER_HPP
#define AIS_PROGRESS_OBSERVER_HPP

#include <cstddef>
#include <cstdint>

#include "file_descriptor.hpp"
#include "run_result.hpp"

namespace ais {
namespace uploader {

enum class TransferMode { DIRECT, MULTIPART };

/**
 * Receives progress events from the coordinator and multipart sessions.
 *
 * Calls for one run are serialized; an observer needs no locking of its
 * own unless it is shared between runs. Every method defaults to a no-op.
 */
class IUploadObserver {
public:
  virtual ~IUploadObserver() = default;

  virtual void onRunStarted(size_t /*pending_files*/, uint64_t /*pending_bytes*/) {}

  virtual void onFileStarted(const FileDescriptor& /*file*/, TransferMode /*mode*/) {}

  /**
   * Cumulative bytes confirmed by the store for the current file.
   * For multipart files this is called from part threads, possibly
   * concurrently, so a later call may carry a smaller bytes_done.
   */
  virtual void onBytesTransferred(
    const FileDescriptor& /*file*/, uint64_t /*bytes_done*/, uint64_t /*bytes_total*/
  ) {}

  virtual void onFileFinished(const FileDescriptor& /*file*/, bool /*success*/) {}

  virtual void onRunFinished(const RunResult& /*result*/) {}
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_PROGRESS_OBSERVER_HPP
