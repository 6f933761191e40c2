// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_S3_CLIENT_HPP
#define AIS_S3_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "object_store.hpp"

namespace ais {
namespace uploader {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // e.g. "https://play.min.io"; empty for AWS S3
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // a 100MB part on a slow link

  // Retries performed inside the AWS SDK for each request. The engine
  // itself never retries a failed part.
  int max_sdk_retries = 3;
};

/**
 * IObjectStore backed by the AWS SDK for C++
 *
 * Works with AWS S3 and S3-compatible storage (MinIO, Ceph RGW).
 * Custom endpoints use path-style addressing. Request bodies wrap the
 * caller's buffer without copying it.
 *
 * Thread-safe: the underlying Aws::S3::S3Client may be shared by all
 * part transfer threads.
 */
class S3Client : public IObjectStore {
public:
  explicit S3Client(const S3Config& config);
  ~S3Client() override;

  // Non-copyable, non-movable
  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;
  S3Client(S3Client&&) = delete;
  S3Client& operator=(S3Client&&) = delete;

  HeadObjectResult headObject(const std::string& bucket, const std::string& key) override;

  StoreResult putObject(
    const std::string& bucket, const std::string& key, const char* data, uint64_t size
  ) override;

  StoreResult createMultipartUpload(const std::string& bucket, const std::string& key) override;

  StoreResult uploadPart(
    const MultipartHandle& handle, int part_number, const char* data, uint64_t size
  ) override;

  StoreResult completeMultipartUpload(
    const MultipartHandle& handle, const std::vector<PartReceipt>& ordered_receipts
  ) override;

  StoreResult abortMultipartUpload(const MultipartHandle& handle) override;

  StoreResult testConnection() override;

  StoreResult headBucket(const std::string& bucket) override;

  /**
   * Get the endpoint URL ("" for AWS S3)
   */
  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_S3_CLIENT_HPP
