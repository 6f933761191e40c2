// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_MULTIPART_SESSION_HPP
#define AIS_MULTIPART_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "file_descriptor.hpp"
#include "object_store.hpp"
#include "part_planner.hpp"
#include "progress_observer.hpp"
#include "local_files.hpp"

namespace ais {
namespace uploader {

/**
 * Multipart session lifecycle.
 *
 *   INITIATING -> TRANSFERRING -> COMPLETING -> COMMITTED
 *   TRANSFERRING | COMPLETING -> ABORTING -> ABORTED
 *   INITIATING -> FAILED   (no remote upload exists, nothing to abort)
 */
enum class SessionState {
  INITIATING,
  TRANSFERRING,
  COMPLETING,
  COMMITTED,
  ABORTING,
  ABORTED,
  FAILED
};

std::string sessionStateToString(SessionState state);

struct SessionConfig {
  uint64_t part_size = kDefaultPartSize;
  size_t max_concurrent_parts = 10;
};

/**
 * Result of a multipart session
 */
struct SessionResult {
  bool success;
  std::string etag;
  size_t parts_committed;
  FailureKind kind;
  std::string error_message;
  SessionState final_state;

  static SessionResult Success(const std::string& etag, size_t parts) {
    return {true, etag, parts, FailureKind::NONE, "", SessionState::COMMITTED};
  }

  static SessionResult Failure(
    FailureKind kind, const std::string& message, SessionState final_state, size_t parts = 0
  ) {
    return {false, "", parts, kind, message, final_state};
  }
};

/**
 * Transfers one file as a multipart upload.
 *
 * Parts run concurrently on a TaskGroup of max_concurrent_parts threads.
 * The first part failure stops dispatch; in-flight parts finish, then the
 * remote upload is aborted. Receipts are sorted by part number and must
 * cover 1..N exactly before completion is requested.
 *
 * A session handles exactly one file; create a new one per file.
 *
 * Usage:
 *   MultipartSession session(store, readers, config, observer);
 *   SessionResult result = session.run(file, bucket);
 */
class MultipartSession {
public:
  MultipartSession(
    IObjectStore& store, IArchiveReaderFactory& readers, const SessionConfig& config,
    IUploadObserver* observer = nullptr
  );

  // Non-copyable, non-movable
  MultipartSession(const MultipartSession&) = delete;
  MultipartSession& operator=(const MultipartSession&) = delete;
  MultipartSession(MultipartSession&&) = delete;
  MultipartSession& operator=(MultipartSession&&) = delete;

  /**
   * Run the session to COMMITTED, ABORTED or FAILED.
   * @throws std::logic_error if the session has already run
   */
  SessionResult run(const FileDescriptor& file, const std::string& bucket);

  SessionState state() const;

  /**
   * Every state entered so far, in order.
   */
  std::vector<SessionState> stateHistory() const;

  /**
   * Sort receipts by part number and check that they are exactly
   * 1..expected_count, without gaps or duplicates.
   *
   * @param error Receives a description of the violation, may be null
   * @return false if the receipts are not a complete set
   */
  static bool orderReceipts(
    std::vector<PartReceipt>& receipts, size_t expected_count, std::string* error = nullptr
  );

private:
  void transition(SessionState next);

  SessionResult abortSession(
    const MultipartHandle& handle, FailureKind kind, const std::string& message, size_t parts
  );

  IObjectStore& store_;
  IArchiveReaderFactory& readers_;
  SessionConfig config_;
  IUploadObserver* observer_;

  mutable std::mutex state_mutex_;
  SessionState state_ = SessionState::INITIATING;
  std::vector<SessionState> history_;
  bool started_ = false;
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_MULTIPART_SESSION_HPP
