// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_UPLOAD_COORDINATOR_HPP
#define AIS_UPLOAD_COORDINATOR_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "file_descriptor.hpp"
#include "local_files.hpp"
#include "object_store.hpp"
#include "part_planner.hpp"
#include "progress_ledger.hpp"
#include "progress_observer.hpp"
#include "run_result.hpp"

namespace ais {
namespace uploader {

constexpr uint64_t kDefaultMultipartThreshold = 100 * kMiB;

/**
 * Configuration for the Upload Coordinator
 */
struct CoordinatorConfig {
  std::string bucket;

  // Files strictly larger than the threshold use a multipart session
  uint64_t multipart_threshold = kDefaultMultipartThreshold;
  uint64_t part_size = kDefaultPartSize;
  size_t max_concurrent_parts = 10;
};

/**
 * Result of checking ledger records against the object store
 */
struct ValidationReport {
  size_t total = 0;
  size_t valid = 0;
  size_t invalid = 0;  // remote object absent or of a different size
  size_t missing = 0;  // local file gone
  std::vector<std::string> errors;
};

/**
 * Upload Coordinator - runs one upload pass over scanned archives
 *
 * For each candidate not already in the ledger, in scan order:
 * - files up to multipart_threshold go out as a single PUT
 * - larger files go through a MultipartSession
 * - the ledger is updated only after the store confirms the commit
 *
 * A failed file is counted and itemized; the run continues with the next
 * file. Files are processed one at a time; parallelism is per part.
 *
 * Usage:
 *   ProgressLedger ledger("ais_upload_progress.json");
 *   S3Client store(s3_config);
 *   UploadCoordinator coordinator(ledger, store, config);
 *   RunResult result = coordinator.runUpload(scanner.scan());
 */
class UploadCoordinator {
public:
  UploadCoordinator(
    ProgressLedger& ledger, IObjectStore& store, const CoordinatorConfig& config,
    IUploadObserver* observer = nullptr
  );

  /**
   * Constructor with injected local file access (for testing)
   */
  UploadCoordinator(
    ProgressLedger& ledger, IObjectStore& store, const CoordinatorConfig& config,
    ILocalFileSystem& files, IArchiveReaderFactory& readers, IUploadObserver* observer = nullptr
  );

  ~UploadCoordinator();

  // Non-copyable, non-movable
  UploadCoordinator(const UploadCoordinator&) = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;
  UploadCoordinator(UploadCoordinator&&) = delete;
  UploadCoordinator& operator=(UploadCoordinator&&) = delete;

  /**
   * Upload every candidate that is not already recorded in the ledger.
   *
   * @param candidates Scanner output, in scan order
   * @param max_files Attempt at most this many pending files; the rest
   *                  are counted as deferred
   * @return Run counters; never throws for a single file's failure
   */
  RunResult runUpload(
    const std::vector<FileDescriptor>& candidates, std::optional<size_t> max_files = std::nullopt
  );

  /**
   * Check every ledger record against the local file and the store.
   */
  ValidationReport validateUploaded();

  /**
   * Finish the file in flight and stop before the next one.
   * Thread-safe and async-signal-safe.
   */
  void requestStop();

  bool stopRequested() const;

  const CoordinatorConfig& config() const;

private:
  struct FileOutcome {
    bool success = false;
    std::string etag;
    FailureKind kind = FailureKind::NONE;
    std::string message;
  };

  FileOutcome uploadOne(const FileDescriptor& file);
  FileOutcome uploadDirect(const FileDescriptor& file);
  FileOutcome uploadMultipart(const FileDescriptor& file);

  ProgressLedger& ledger_;
  IObjectStore& store_;
  CoordinatorConfig config_;
  IUploadObserver* observer_;

  // Default implementations when nothing is injected
  std::unique_ptr<ILocalFileSystem> owned_files_;
  std::unique_ptr<IArchiveReaderFactory> owned_readers_;
  ILocalFileSystem& files_;
  IArchiveReaderFactory& readers_;

  std::atomic<bool> stop_requested_{false};
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_UPLOAD_COORDINATOR_HPP
