// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_PROGRESS_LEDGER_HPP
#define AIS_PROGRESS_LEDGER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "file_descriptor.hpp"

namespace ais {
namespace uploader {

/**
 * Ledger entry for one uploaded file, keyed by local_path.
 */
struct UploadRecord {
  std::string local_path;
  std::string filename;
  std::string remote_key;
  uint64_t size = 0;        // on-disk size at upload time
  std::string upload_time;  // ISO 8601, UTC
  std::string remote_etag;
  std::string year;
  std::string month;
};

/**
 * Records grouped by year, then month; records in a month are ordered by
 * filename.
 */
using LedgerSnapshot = std::map<std::string, std::map<std::string, std::vector<UploadRecord>>>;

/**
 * How the ledger file looked when it was loaded
 */
enum class LedgerLoadStatus {
  LOADED,   // parsed successfully
  MISSING,  // no file yet, started empty
  CORRUPT   // unreadable or not a JSON object, started empty
};

/**
 * Durable record of files committed to the object store.
 *
 * The ledger is a single JSON document rewritten in full after every
 * successful upload. Writes go to "<path>.tmp", which is fsynced and renamed
 * over the ledger before the directory is fsynced, so a crash or power loss
 * during a save leaves the previous version intact.
 *
 * Strings that are not valid UTF-8 are stored alongside a hex copy of their
 * bytes ("<field>_hex"), so such paths reload exactly.
 *
 * Loading fails open: a missing or corrupt ledger starts empty and the
 * affected files are uploaded again.
 *
 * Thread Safety:
 * - All methods are thread-safe (internal mutex)
 * - One process per ledger file is assumed; there is no file lock
 */
class ProgressLedger {
public:
  /**
   * Open the ledger at `path`, loading existing records if present.
   */
  explicit ProgressLedger(const std::string& path);
  ~ProgressLedger();

  // Non-copyable, non-movable
  ProgressLedger(const ProgressLedger&) = delete;
  ProgressLedger& operator=(const ProgressLedger&) = delete;
  ProgressLedger(ProgressLedger&&) = delete;
  ProgressLedger& operator=(ProgressLedger&&) = delete;

  /**
   * True iff a record exists for file.local_path and its stored size
   * equals file.size. A size mismatch means the file changed since it
   * was uploaded.
   */
  bool isUploaded(const FileDescriptor& file) const;

  /**
   * Insert or overwrite the record for `file` and persist the ledger.
   *
   * Call only after the store has confirmed the object is committed.
   *
   * @return false if persisting failed; the record stays in memory and is
   *         written by the next successful save
   */
  bool recordSuccess(const FileDescriptor& file, const std::string& remote_etag);

  std::optional<UploadRecord> get(const std::string& local_path) const;

  /**
   * All records ordered by local path
   */
  std::vector<UploadRecord> records() const;

  LedgerSnapshot snapshot() const;

  size_t size() const;

  /**
   * Persist the whole ledger (temp file + rename).
   */
  bool save();

  const std::string& path() const;

  LedgerLoadStatus loadStatus() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * Current UTC time formatted as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string currentTimestampUtc();

}  // namespace uploader
}  // namespace ais

#endif  // AIS_PROGRESS_LEDGER_HPP
