// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_OBJECT_STORE_HPP
#define AIS_OBJECT_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "transfer_error.hpp"

namespace ais {
namespace uploader {

/**
 * Result of a single object-store call.
 * value carries the ETag or upload id, depending on the call.
 */
struct StoreResult {
  bool success;
  std::string value;
  std::string error_message;
  std::string error_code;
  FailureKind kind;

  static StoreResult Success(const std::string& value = "") {
    return {true, value, "", "", FailureKind::NONE};
  }

  static StoreResult Failure(const std::string& message, const std::string& code = "") {
    return {false, "", message, code, classifyErrorCode(code)};
  }

  static StoreResult Failure(
    const std::string& message, const std::string& code, FailureKind kind
  ) {
    return {false, "", message, code, kind};
  }
};

/**
 * Result of a HEAD request on an object.
 * A missing object is a successful call with exists == false.
 */
struct HeadObjectResult {
  bool success;
  bool exists;
  uint64_t size;
  std::string etag;
  std::string error_message;
  std::string error_code;

  static HeadObjectResult Found(uint64_t size, const std::string& etag) {
    return {true, true, size, etag, "", ""};
  }

  static HeadObjectResult NotFound() {
    return {true, false, 0, "", "", ""};
  }

  static HeadObjectResult Failure(const std::string& message, const std::string& code = "") {
    return {false, false, 0, "", message, code};
  }
};

/**
 * Token identifying an open multipart upload.
 */
struct MultipartHandle {
  std::string bucket;
  std::string key;
  std::string upload_id;
};

/**
 * Proof that one part was stored remotely.
 */
struct PartReceipt {
  int part_number = 0;
  uint64_t size = 0;
  std::string etag;
};

/**
 * Object-store operations used by the upload engine.
 *
 * Implementations must be safe to call from several threads at once:
 * parts of one file are uploaded concurrently. Object ETags are
 * returned without surrounding quotes; part ETags are opaque and are
 * passed back unchanged on completion.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  virtual HeadObjectResult headObject(const std::string& bucket, const std::string& key) = 0;

  /**
   * Upload a whole object in one request.
   * @return value = ETag of the stored object (may be empty)
   */
  virtual StoreResult putObject(
    const std::string& bucket, const std::string& key, const char* data, uint64_t size
  ) = 0;

  /**
   * Open a multipart upload.
   * @return value = upload id
   */
  virtual StoreResult createMultipartUpload(const std::string& bucket, const std::string& key) = 0;

  /**
   * Upload one part of an open multipart upload.
   * @return value = part ETag
   */
  virtual StoreResult uploadPart(
    const MultipartHandle& handle, int part_number, const char* data, uint64_t size
  ) = 0;

  /**
   * Commit a multipart upload. Receipts must be in ascending part order.
   * @return value = aggregate ETag
   */
  virtual StoreResult completeMultipartUpload(
    const MultipartHandle& handle, const std::vector<PartReceipt>& ordered_receipts
  ) = 0;

  virtual StoreResult abortMultipartUpload(const MultipartHandle& handle) = 0;

  /**
   * Verify that the endpoint answers and the credentials are accepted.
   */
  virtual StoreResult testConnection() = 0;

  /**
   * Check that a bucket exists and is accessible.
   * A missing bucket fails with FailureKind::NOT_FOUND.
   */
  virtual StoreResult headBucket(const std::string& bucket) = 0;
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_OBJECT_STORE_HPP
