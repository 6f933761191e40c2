// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_session.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <system_error>

#include "part_transfer_worker.hpp"
#include "task_group.hpp"

#define AIS_LOG_COMPONENT "multipart_session"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;

std::string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::INITIATING:
      return "INITIATING";
    case SessionState::TRANSFERRING:
      return "TRANSFERRING";
    case SessionState::COMPLETING:
      return "COMPLETING";
    case SessionState::COMMITTED:
      return "COMMITTED";
    case SessionState::ABORTING:
      return "ABORTING";
    case SessionState::ABORTED:
      return "ABORTED";
    case SessionState::FAILED:
      return "FAILED";
    default:
      return "UNKNOWN";
  }
}

MultipartSession::MultipartSession(
  IObjectStore& store, IArchiveReaderFactory& readers, const SessionConfig& config,
  IUploadObserver* observer
)
    : store_(store)
    , readers_(readers)
    , config_(config)
    , observer_(observer) {}

SessionState MultipartSession::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

std::vector<SessionState> MultipartSession::stateHistory() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return history_;
}

void MultipartSession::transition(SessionState next) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!history_.empty()) {
    AIS_LOG_DEBUG(
      "Session state" << kv("from", sessionStateToString(state_))
                      << kv("to", sessionStateToString(next))
    );
  }
  state_ = next;
  history_.push_back(next);
}

bool MultipartSession::orderReceipts(
  std::vector<PartReceipt>& receipts, size_t expected_count, std::string* error
) {
  std::sort(receipts.begin(), receipts.end(), [](const PartReceipt& a, const PartReceipt& b) {
    return a.part_number < b.part_number;
  });

  if (receipts.size() != expected_count) {
    if (error) {
      *error = "Expected " + std::to_string(expected_count) + " part receipts, got " +
               std::to_string(receipts.size());
    }
    return false;
  }

  for (size_t i = 0; i < receipts.size(); ++i) {
    int expected_number = static_cast<int>(i + 1);
    if (receipts[i].part_number != expected_number) {
      if (error) {
        *error = "Part receipts are not contiguous: expected part " +
                 std::to_string(expected_number) + ", found " +
                 std::to_string(receipts[i].part_number);
      }
      return false;
    }
  }
  return true;
}

SessionResult MultipartSession::run(const FileDescriptor& file, const std::string& bucket) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (started_) {
      throw std::logic_error("MultipartSession::run called twice");
    }
    started_ = true;
  }

  AIS_LOG_SCOPED_OBJECT(file.remote_key);
  transition(SessionState::INITIATING);

  PartPlan plan;
  try {
    plan = planParts(file.size, config_.part_size);
  } catch (const std::invalid_argument& e) {
    transition(SessionState::FAILED);
    return SessionResult::Failure(FailureKind::INVALID_INPUT, e.what(), SessionState::FAILED);
  }
  if (plan.size() > kMaxPartCount) {
    transition(SessionState::FAILED);
    return SessionResult::Failure(
      FailureKind::INVALID_INPUT,
      "File needs " + std::to_string(plan.size()) + " parts, store allows " +
        std::to_string(kMaxPartCount),
      SessionState::FAILED
    );
  }

  auto created = store_.createMultipartUpload(bucket, file.remote_key);
  if (!created.success) {
    AIS_LOG_ERROR(
      "Failed to initiate multipart upload" << kv("code", created.error_code) << " - "
                                            << created.error_message
    );
    transition(SessionState::FAILED);
    return SessionResult::Failure(created.kind, created.error_message, SessionState::FAILED);
  }

  MultipartHandle handle;
  handle.bucket = bucket;
  handle.key = file.remote_key;
  handle.upload_id = created.value;

  AIS_LOG_INFO(
    "Multipart upload started" << kv("parts", plan.size()) << kv("part_size", config_.part_size)
                               << kv("upload_id", handle.upload_id)
  );
  transition(SessionState::TRANSFERRING);

  PartTransferWorker worker(store_, readers_);
  std::mutex collect_mutex;
  std::vector<PartReceipt> receipts;
  receipts.reserve(plan.size());
  uint64_t bytes_done = 0;
  bool have_failure = false;
  FailureKind failure_kind = FailureKind::UNKNOWN;
  std::string failure_message;

  TaskGroup group(config_.max_concurrent_parts);
  auto transfer = [&](size_t index) {
    auto result = worker.transferPart(file.local_path, plan[index], handle);

    uint64_t done_now = 0;
    {
      std::lock_guard<std::mutex> lock(collect_mutex);
      if (!result.success) {
        if (!have_failure) {
          have_failure = true;
          failure_kind = result.kind;
          failure_message =
            "Part " + std::to_string(result.receipt.part_number) + ": " + result.error_message;
        }
        return false;
      }
      receipts.push_back(result.receipt);
      bytes_done += result.receipt.size;
      done_now = bytes_done;
    }

    // Outside the lock, so calls may overlap and arrive out of order
    if (observer_) {
      observer_->onBytesTransferred(file, done_now, file.size);
    }
    AIS_LOG_INFO_THROTTLE(
      2.0, "Upload progress" << kv("bytes_done", done_now) << kv("bytes_total", file.size)
    );
    return true;
  };

  TaskGroupResult summary;
  try {
    summary = group.run(plan.size(), transfer);
  } catch (const std::system_error& e) {
    return abortSession(
      handle, FailureKind::UNKNOWN, std::string("Cannot start part workers: ") + e.what(), 0
    );
  }

  if (summary.failed > 0) {
    if (!have_failure) {
      failure_message = "Part task raised an exception";
    }
    return abortSession(handle, failure_kind, failure_message, receipts.size());
  }

  transition(SessionState::COMPLETING);

  std::string order_error;
  if (!orderReceipts(receipts, plan.size(), &order_error)) {
    return abortSession(handle, FailureKind::INTEGRITY, order_error, receipts.size());
  }

  auto completed = store_.completeMultipartUpload(handle, receipts);
  if (!completed.success) {
    FailureKind kind =
      completed.kind == FailureKind::UNKNOWN ? FailureKind::REMOTE_REJECTED : completed.kind;
    return abortSession(
      handle, kind, "Completion rejected: " + completed.error_message, receipts.size()
    );
  }

  transition(SessionState::COMMITTED);
  AIS_LOG_INFO(
    "Multipart upload committed" << kv("parts", receipts.size()) << kv("etag", completed.value)
  );
  return SessionResult::Success(completed.value, receipts.size());
}

SessionResult MultipartSession::abortSession(
  const MultipartHandle& handle, FailureKind kind, const std::string& message, size_t parts
) {
  transition(SessionState::ABORTING);
  AIS_LOG_WARN(
    "Aborting multipart upload" << kv("upload_id", handle.upload_id)
                                << kv("kind", failureKindToString(kind)) << " - " << message
  );

  auto aborted = store_.abortMultipartUpload(handle);
  if (!aborted.success) {
    // Orphaned parts are left for the bucket lifecycle policy
    AIS_LOG_WARN(
      "Abort request failed" << kv("upload_id", handle.upload_id)
                             << kv("code", aborted.error_code) << " - " << aborted.error_message
    );
  }

  transition(SessionState::ABORTED);
  return SessionResult::Failure(kind, message, SessionState::ABORTED, parts);
}

}  // namespace uploader
}  // namespace ais
