// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "progress_ledger.hpp"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>

#define AIS_LOG_COMPONENT "progress_ledger"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;
using json = nlohmann::json;
namespace fs = std::filesystem;

std::string currentTimestampUtc() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

bool isValidUtf8(const std::string& text) {
  try {
    json(text).dump();
    return true;
  } catch (const json::type_error&) {
    return false;
  }
}

std::string hexEncode(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHexDigits[c >> 4]);
    out.push_back(kHexDigits[c & 0x0f]);
  }
  return out;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string hexDecode(const std::string& hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("hex field has odd length");
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = hexValue(hex[i]);
    int low = hexValue(hex[i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("hex field has a non-hex digit");
    }
    out.push_back(static_cast<char>((high << 4) | low));
  }
  return out;
}

// Entry key for a local path. Paths that are not valid UTF-8 cannot be JSON
// keys, so they get a hex key and the exact bytes in "local_path_hex".
std::string entryKey(const std::string& local_path) {
  if (isValidUtf8(local_path)) {
    return local_path;
  }
  return "hex:" + hexEncode(local_path);
}

// Non-UTF-8 strings are written lossily by the dump; the "<name>_hex"
// sibling keeps the exact bytes
void putString(json& entry, const std::string& name, const std::string& value) {
  entry[name] = value;
  if (!isValidUtf8(value)) {
    entry[name + "_hex"] = hexEncode(value);
  }
}

std::string getString(const json& entry, const std::string& name, const std::string& fallback) {
  auto hex = entry.find(name + "_hex");
  if (hex != entry.end()) {
    return hexDecode(hex->get<std::string>());
  }
  return entry.value(name, fallback);
}

json recordToJson(const UploadRecord& record) {
  json entry = json::object();
  if (!isValidUtf8(record.local_path)) {
    entry["local_path_hex"] = hexEncode(record.local_path);
  }
  putString(entry, "filename", record.filename);
  putString(entry, "s3_key", record.remote_key);
  entry["size"] = record.size;
  entry["upload_time"] = record.upload_time;
  putString(entry, "s3_etag", record.remote_etag);
  entry["year"] = record.year;
  entry["month"] = record.month;
  return entry;
}

// Throws nlohmann::json::exception when a field has the wrong type and
// std::invalid_argument when a value is out of range
UploadRecord recordFromJson(const std::string& key, const json& value) {
  UploadRecord record;
  record.local_path = getString(value, "local_path", key);
  const json& size = value.at("size");
  if (!size.is_number_unsigned()) {
    throw std::invalid_argument("size is not a non-negative integer");
  }
  record.size = size.get<uint64_t>();
  record.filename =
    getString(value, "filename", fs::path(record.local_path).filename().string());
  record.remote_key = getString(value, "s3_key", std::string());
  record.upload_time = value.value("upload_time", std::string());
  record.remote_etag = getString(value, "s3_etag", std::string());
  record.year = value.value("year", std::string());
  record.month = value.value("month", std::string());
  return record;
}

bool writeAll(int fd, const std::string& data) {
  const char* cursor = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd, cursor, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    cursor += written;
    remaining -= static_cast<size_t>(written);
  }
  return true;
}

// Flush the rename itself; without this a power loss can bring back the
// old directory entry
bool syncDirectory(const fs::path& dir) {
  int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return false;
  }
  bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

}  // namespace

class ProgressLedger::Impl {
public:
  std::string path;
  std::map<std::string, UploadRecord> records;
  LedgerLoadStatus load_status = LedgerLoadStatus::MISSING;
  mutable std::mutex mutex;

  void load() {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      AIS_LOG_INFO("No ledger found, starting empty" << kv("path", path));
      load_status = LedgerLoadStatus::MISSING;
      return;
    }

    std::ifstream in(path);
    if (!in) {
      AIS_LOG_WARN("Cannot open ledger, starting empty" << kv("path", path));
      load_status = LedgerLoadStatus::CORRUPT;
      return;
    }

    json document;
    try {
      document = json::parse(in);
    } catch (const json::exception& e) {
      AIS_LOG_WARN("Ledger is corrupt, starting empty" << kv("path", path) << " - " << e.what());
      load_status = LedgerLoadStatus::CORRUPT;
      return;
    }

    if (!document.is_object()) {
      AIS_LOG_WARN("Ledger is not a JSON object, starting empty" << kv("path", path));
      load_status = LedgerLoadStatus::CORRUPT;
      return;
    }

    size_t skipped = 0;
    for (auto it = document.begin(); it != document.end(); ++it) {
      try {
        UploadRecord record = recordFromJson(it.key(), it.value());
        records[record.local_path] = std::move(record);
      } catch (const json::exception& e) {
        ++skipped;
        AIS_LOG_WARN(
          "Skipping malformed ledger entry" << kv("path", it.key()) << " - " << e.what()
        );
      } catch (const std::invalid_argument& e) {
        ++skipped;
        AIS_LOG_WARN(
          "Skipping malformed ledger entry" << kv("path", it.key()) << " - " << e.what()
        );
      }
    }

    load_status = LedgerLoadStatus::LOADED;
    AIS_LOG_INFO("Ledger loaded" << kv("records", records.size()) << kv("skipped", skipped));
  }

  // Caller holds mutex
  bool saveLocked() {
    std::string text;
    try {
      json document = json::object();
      for (const auto& [local_path, record] : records) {
        document[entryKey(local_path)] = recordToJson(record);
      }
      text = document.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
      AIS_LOG_ERROR("Cannot serialize ledger" << kv("path", path) << " - " << e.what());
      return false;
    }

    fs::path target(path);
    if (target.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(target.parent_path(), ec);
    }

    std::string tmp_path = path + ".tmp";
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
      AIS_LOG_ERROR(
        "Cannot write ledger temp file" << kv("path", tmp_path) << " - " << std::strerror(errno)
      );
      return false;
    }
    bool written = writeAll(fd, text) && ::fsync(fd) == 0;
    int write_errno = errno;
    bool closed = ::close(fd) == 0;
    if (!written || !closed) {
      AIS_LOG_ERROR(
        "Writing ledger temp file failed" << kv("path", tmp_path) << " - "
                                          << std::strerror(written ? errno : write_errno)
      );
      std::error_code ec;
      fs::remove(tmp_path, ec);
      return false;
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
      AIS_LOG_ERROR("Replacing ledger failed" << kv("path", path) << " - " << ec.message());
      fs::remove(tmp_path, ec);
      return false;
    }
    if (!syncDirectory(target.parent_path())) {
      AIS_LOG_ERROR(
        "Syncing ledger directory failed" << kv("path", path) << " - " << std::strerror(errno)
      );
      return false;
    }
    return true;
  }
};

ProgressLedger::ProgressLedger(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
  impl_->path = path;
  impl_->load();
}

ProgressLedger::~ProgressLedger() = default;

bool ProgressLedger::isUploaded(const FileDescriptor& file) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->records.find(file.local_path);
  if (it == impl_->records.end()) {
    return false;
  }
  if (it->second.size != file.size) {
    AIS_LOG_INFO(
      "File changed since upload" << kv("path", file.local_path) << kv("recorded", it->second.size)
                                  << kv("current", file.size)
    );
    return false;
  }
  return true;
}

bool ProgressLedger::recordSuccess(const FileDescriptor& file, const std::string& remote_etag) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  UploadRecord record;
  record.local_path = file.local_path;
  record.filename = file.filename;
  record.remote_key = file.remote_key;
  record.size = file.size;
  record.upload_time = currentTimestampUtc();
  record.remote_etag = remote_etag;
  record.year = file.year;
  record.month = file.month;
  impl_->records[file.local_path] = record;

  return impl_->saveLocked();
}

std::optional<UploadRecord> ProgressLedger::get(const std::string& local_path) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->records.find(local_path);
  if (it == impl_->records.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<UploadRecord> ProgressLedger::records() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  std::vector<UploadRecord> result;
  result.reserve(impl_->records.size());
  for (const auto& entry : impl_->records) {
    result.push_back(entry.second);
  }
  return result;
}

LedgerSnapshot ProgressLedger::snapshot() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  LedgerSnapshot grouped;
  for (const auto& entry : impl_->records) {
    const auto& record = entry.second;
    grouped[record.year][record.month].push_back(record);
  }
  for (auto& year : grouped) {
    for (auto& month : year.second) {
      std::sort(
        month.second.begin(), month.second.end(),
        [](const UploadRecord& a, const UploadRecord& b) {
          return a.filename < b.filename;
        }
      );
    }
  }
  return grouped;
}

size_t ProgressLedger::size() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->records.size();
}

bool ProgressLedger::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->saveLocked();
}

const std::string& ProgressLedger::path() const {
  return impl_->path;
}

LedgerLoadStatus ProgressLedger::loadStatus() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_status;
}

}  // namespace uploader
}  // namespace ais
