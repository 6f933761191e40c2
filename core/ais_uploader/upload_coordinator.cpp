// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_coordinator.hpp"

#include <vector>

#include "file_range_reader.hpp"
#include "local_files_impl.hpp"
#include "multipart_session.hpp"

#define AIS_LOG_COMPONENT "upload_coordinator"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;

namespace {

// Direct PUT and some S3-compatible stores return no ETag; ask for it.
std::string fetchEtagIfMissing(
  IObjectStore& store, const std::string& bucket, const FileDescriptor& file,
  const std::string& etag
) {
  if (!etag.empty()) {
    return etag;
  }
  auto head = store.headObject(bucket, file.remote_key);
  if (!head.success || !head.exists) {
    AIS_LOG_WARN(
      "Could not fetch ETag after upload" << kv("key", file.remote_key) << " - "
                                          << head.error_message
    );
    return "";
  }
  return head.etag;
}

}  // namespace

UploadCoordinator::UploadCoordinator(
  ProgressLedger& ledger, IObjectStore& store, const CoordinatorConfig& config,
  IUploadObserver* observer
)
    : ledger_(ledger)
    , store_(store)
    , config_(config)
    , observer_(observer)
    , owned_files_(std::make_unique<LocalFileSystem>())
    , owned_readers_(std::make_unique<ArchiveReaderFactory>())
    , files_(*owned_files_)
    , readers_(*owned_readers_) {}

UploadCoordinator::UploadCoordinator(
  ProgressLedger& ledger, IObjectStore& store, const CoordinatorConfig& config,
  ILocalFileSystem& files, IArchiveReaderFactory& readers, IUploadObserver* observer
)
    : ledger_(ledger)
    , store_(store)
    , config_(config)
    , observer_(observer)
    , files_(files)
    , readers_(readers) {}

UploadCoordinator::~UploadCoordinator() = default;

void UploadCoordinator::requestStop() {
  stop_requested_.store(true);
}

bool UploadCoordinator::stopRequested() const {
  return stop_requested_.load();
}

const CoordinatorConfig& UploadCoordinator::config() const {
  return config_;
}

RunResult UploadCoordinator::runUpload(
  const std::vector<FileDescriptor>& candidates, std::optional<size_t> max_files
) {
  RunResult result;
  result.total_files = candidates.size();

  std::vector<const FileDescriptor*> pending;
  for (const auto& file : candidates) {
    if (ledger_.isUploaded(file)) {
      ++result.skipped;
    } else {
      pending.push_back(&file);
    }
  }

  if (max_files && pending.size() > *max_files) {
    result.deferred += pending.size() - *max_files;
    pending.resize(*max_files);
  }

  uint64_t pending_bytes = 0;
  for (const auto* file : pending) {
    pending_bytes += file->size;
  }

  AIS_LOG_INFO(
    "Upload run started" << kv("candidates", result.total_files) << kv("pending", pending.size())
                         << kv("already_uploaded", result.skipped)
                         << kv("pending_bytes", pending_bytes) << kv("bucket", config_.bucket)
  );
  if (observer_) {
    observer_->onRunStarted(pending.size(), pending_bytes);
  }

  for (size_t i = 0; i < pending.size(); ++i) {
    if (stop_requested_.load()) {
      result.deferred += pending.size() - i;
      result.stopped = true;
      AIS_LOG_WARN(
        "Stop requested, leaving remaining files" << kv("remaining", pending.size() - i)
      );
      break;
    }

    const FileDescriptor& file = *pending[i];

    // Another run may have committed the file since the filter above
    if (ledger_.isUploaded(file)) {
      ++result.skipped;
      continue;
    }

    AIS_LOG_INFO(
      "Uploading file" << kv("index", i + 1) << kv("of", pending.size())
                       << kv("key", file.remote_key) << kv("size", file.size)
    );

    FileOutcome outcome = uploadOne(file);
    if (outcome.success) {
      ++result.uploaded;
      result.bytes_uploaded += file.size;
      if (!ledger_.recordSuccess(file, outcome.etag)) {
        ++result.ledger_errors;
        AIS_LOG_ERROR(
          "Uploaded but could not persist ledger" << kv("path", file.local_path)
                                                  << kv("ledger", ledger_.path())
        );
      }
    } else {
      ++result.failed;
      FileFailure failure;
      failure.local_path = file.local_path;
      failure.remote_key = file.remote_key;
      failure.kind = outcome.kind;
      failure.message = outcome.message;
      result.failures.push_back(failure);
      AIS_LOG_ERROR(
        "Upload failed" << kv("path", file.local_path)
                        << kv("kind", failureKindToString(outcome.kind)) << " - "
                        << outcome.message
      );
    }

    if (observer_) {
      observer_->onFileFinished(file, outcome.success);
    }
  }

  AIS_LOG_INFO(
    "Upload run finished" << kv("total", result.total_files) << kv("uploaded", result.uploaded)
                          << kv("failed", result.failed) << kv("skipped", result.skipped)
                          << kv("deferred", result.deferred)
                          << kv("ledger_errors", result.ledger_errors)
  );
  if (observer_) {
    observer_->onRunFinished(result);
  }
  return result;
}

UploadCoordinator::FileOutcome UploadCoordinator::uploadOne(const FileDescriptor& file) {
  AIS_LOG_SCOPED_OBJECT(file.remote_key);
  FileOutcome outcome;

  auto current = files_.stat(file.local_path);
  if (!current.error.empty()) {
    outcome.kind = FailureKind::LOCAL_IO;
    outcome.message = "Cannot stat local file: " + current.error;
    return outcome;
  }
  if (!current.exists) {
    outcome.kind = FailureKind::NOT_FOUND;
    outcome.message = "Local file no longer exists: " + file.local_path;
    return outcome;
  }
  if (current.size != file.size) {
    outcome.kind = FailureKind::LOCAL_IO;
    outcome.message = "File size changed since scan (" + std::to_string(file.size) + " -> " +
                      std::to_string(current.size) + ")";
    return outcome;
  }

  bool multipart = file.size > config_.multipart_threshold;
  if (observer_) {
    observer_->onFileStarted(file, multipart ? TransferMode::MULTIPART : TransferMode::DIRECT);
  }

  outcome = multipart ? uploadMultipart(file) : uploadDirect(file);
  if (outcome.success) {
    outcome.etag = fetchEtagIfMissing(store_, config_.bucket, file, outcome.etag);
  }
  return outcome;
}

UploadCoordinator::FileOutcome UploadCoordinator::uploadDirect(const FileDescriptor& file) {
  FileOutcome outcome;

  std::vector<char> buffer;
  auto read = readFileRange(readers_, file.local_path, 0, file.size, buffer);
  if (!read.success) {
    outcome.kind = read.kind;
    outcome.message = read.error_message;
    return outcome;
  }

  auto put = store_.putObject(config_.bucket, file.remote_key, buffer.data(), file.size);
  if (!put.success) {
    outcome.kind = put.kind;
    outcome.message = put.error_message;
    return outcome;
  }

  if (observer_) {
    observer_->onBytesTransferred(file, file.size, file.size);
  }
  outcome.success = true;
  outcome.etag = put.value;
  return outcome;
}

UploadCoordinator::FileOutcome UploadCoordinator::uploadMultipart(const FileDescriptor& file) {
  SessionConfig session_config;
  session_config.part_size = config_.part_size;
  session_config.max_concurrent_parts = config_.max_concurrent_parts;

  MultipartSession session(store_, readers_, session_config, observer_);
  auto session_result = session.run(file, config_.bucket);

  FileOutcome outcome;
  outcome.success = session_result.success;
  outcome.etag = session_result.etag;
  outcome.kind = session_result.kind;
  outcome.message = session_result.error_message;
  return outcome;
}

ValidationReport UploadCoordinator::validateUploaded() {
  ValidationReport report;

  for (const auto& record : ledger_.records()) {
    ++report.total;

    auto local = files_.stat(record.local_path);
    if (!local.error.empty()) {
      ++report.invalid;
      report.errors.push_back("Cannot stat " + record.local_path + ": " + local.error);
      continue;
    }
    if (!local.exists) {
      ++report.missing;
      report.errors.push_back("Local file missing: " + record.local_path);
      continue;
    }
    uint64_t local_size = local.size;

    auto head = store_.headObject(config_.bucket, record.remote_key);
    if (!head.success) {
      ++report.invalid;
      report.errors.push_back(
        "Error checking " + record.remote_key + ": " + head.error_message
      );
    } else if (!head.exists) {
      ++report.invalid;
      report.errors.push_back("Not found in bucket: " + record.remote_key);
    } else if (head.size != local_size) {
      ++report.invalid;
      report.errors.push_back(
        "Size mismatch for " + record.remote_key + ": local=" + std::to_string(local_size) +
        " remote=" + std::to_string(head.size)
      );
    } else {
      ++report.valid;
    }
  }

  AIS_LOG_INFO(
    "Validation finished" << kv("total", report.total) << kv("valid", report.valid)
                          << kv("invalid", report.invalid) << kv("missing", report.missing)
  );
  return report;
}

}  // namespace uploader
}  // namespace ais
