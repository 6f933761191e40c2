// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_FAKE_OBJECT_STORE_HPP
#define AIS_FAKE_OBJECT_STORE_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "object_store.hpp"

namespace ais {
namespace uploader {
namespace test {

/**
 * In-memory, thread-safe IObjectStore with fault injection.
 *
 * Objects and open uploads live in maps guarded by one mutex. Parts are
 * assembled in the order given to completeMultipartUpload, which is
 * checked to be ascending.
 */
class FakeObjectStore : public IObjectStore {
public:
  // ---- fault injection -----------------------------------------------------
  std::set<std::string> fail_put_keys;
  std::set<std::string> fail_create_keys;
  std::set<std::pair<std::string, int>> fail_parts;  // (key, part number)
  std::string part_error_code = "RequestTimeout";
  bool fail_complete = false;
  bool fail_abort = false;
  bool return_empty_put_etag = false;
  std::set<std::string> missing_buckets;
  bool connection_down = false;

  // Delay applied inside uploadPart, by part number
  std::function<std::chrono::milliseconds(int)> part_delay;

  // ---- observations --------------------------------------------------------
  std::atomic<int> put_calls{0};
  std::atomic<int> create_calls{0};
  std::atomic<int> part_calls{0};
  std::atomic<int> complete_calls{0};
  std::atomic<int> abort_calls{0};
  std::atomic<int> max_parts_in_flight{0};

  HeadObjectResult headObject(const std::string& /*bucket*/, const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) {
      return HeadObjectResult::NotFound();
    }
    return HeadObjectResult::Found(it->second.size(), etagFor(key));
  }

  StoreResult putObject(
    const std::string& /*bucket*/, const std::string& key, const char* data, uint64_t size
  ) override {
    ++put_calls;
    if (fail_put_keys.count(key)) {
      return StoreResult::Failure("injected put failure", "ServiceUnavailable");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = std::string(data ? data : "", static_cast<size_t>(size));
    return StoreResult::Success(return_empty_put_etag ? "" : etagFor(key));
  }

  StoreResult createMultipartUpload(
    const std::string& /*bucket*/, const std::string& key
  ) override {
    ++create_calls;
    if (fail_create_keys.count(key)) {
      return StoreResult::Failure("injected create failure", "AccessDenied");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string upload_id = "upload-" + std::to_string(++next_upload_id_);
    uploads_[upload_id] = {};
    return StoreResult::Success(upload_id);
  }

  StoreResult uploadPart(
    const MultipartHandle& handle, int part_number, const char* data, uint64_t size
  ) override {
    ++part_calls;
    int now_in_flight = ++in_flight_;
    int seen = max_parts_in_flight.load();
    while (now_in_flight > seen &&
           !max_parts_in_flight.compare_exchange_weak(seen, now_in_flight)) {
    }

    if (part_delay) {
      std::this_thread::sleep_for(part_delay(part_number));
    }

    StoreResult result = StoreResult::Success();
    if (fail_parts.count({handle.key, part_number})) {
      result = StoreResult::Failure("injected part failure", part_error_code);
    } else {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = uploads_.find(handle.upload_id);
      if (it == uploads_.end()) {
        result = StoreResult::Failure("no such upload", "NoSuchUpload");
      } else {
        it->second[part_number] = std::string(data, static_cast<size_t>(size));
        result = StoreResult::Success("\"part-" + std::to_string(part_number) + "\"");
      }
    }

    --in_flight_;
    return result;
  }

  StoreResult completeMultipartUpload(
    const MultipartHandle& handle, const std::vector<PartReceipt>& ordered_receipts
  ) override {
    ++complete_calls;
    std::lock_guard<std::mutex> lock(mutex_);
    completed_orders_.emplace_back();
    for (const auto& receipt : ordered_receipts) {
      completed_orders_.back().push_back(receipt.part_number);
    }
    if (fail_complete) {
      return StoreResult::Failure("injected completion failure", "InvalidPart");
    }

    auto it = uploads_.find(handle.upload_id);
    if (it == uploads_.end()) {
      return StoreResult::Failure("no such upload", "NoSuchUpload");
    }

    std::string assembled;
    int previous = 0;
    for (const auto& receipt : ordered_receipts) {
      if (receipt.part_number <= previous) {
        return StoreResult::Failure("parts not ascending", "InvalidPartOrder");
      }
      previous = receipt.part_number;
      auto part = it->second.find(receipt.part_number);
      if (part == it->second.end()) {
        return StoreResult::Failure("unknown part", "InvalidPart");
      }
      assembled += part->second;
    }
    objects_[handle.key] = assembled;
    uploads_.erase(it);
    return StoreResult::Success(
      etagFor(handle.key) + "-" + std::to_string(ordered_receipts.size())
    );
  }

  StoreResult abortMultipartUpload(const MultipartHandle& handle) override {
    ++abort_calls;
    if (fail_abort) {
      return StoreResult::Failure("injected abort failure", "InternalError");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    uploads_.erase(handle.upload_id);
    return StoreResult::Success();
  }

  StoreResult testConnection() override {
    if (connection_down) {
      return StoreResult::Failure("connection refused", "NetworkingError");
    }
    return StoreResult::Success();
  }

  StoreResult headBucket(const std::string& bucket) override {
    if (missing_buckets.count(bucket)) {
      return StoreResult::Failure("Bucket does not exist: " + bucket, "NoSuchBucket");
    }
    return StoreResult::Success();
  }

  // ---- test accessors ------------------------------------------------------
  bool hasObject(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(key) > 0;
  }

  std::string object(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    return it == objects_.end() ? std::string() : it->second;
  }

  void removeObject(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
  }

  size_t openUploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploads_.size();
  }

  std::vector<std::vector<int>> completedOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_orders_;
  }

private:
  static std::string etagFor(const std::string& key) {
    return "etag-" + std::to_string(std::hash<std::string>{}(key));
  }

  mutable std::mutex mutex_;
  std::map<std::string, std::string> objects_;
  std::map<std::string, std::map<int, std::string>> uploads_;
  std::vector<std::vector<int>> completed_orders_;
  int next_upload_id_ = 0;
  std::atomic<int> in_flight_{0};
};

}  // namespace test
}  // namespace uploader
}  // namespace ais

#endif  // AIS_FAKE_OBJECT_STORE_HPP
