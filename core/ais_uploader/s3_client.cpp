// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <boost/interprocess/streams/bufferstream.hpp>

#include <cstdlib>
#include <mutex>

#include "s3_client_test_helpers.hpp"

#define AIS_LOG_COMPONENT "s3_client"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must bracket every SDK object in the process.
// A reference-counted singleton ties the SDK lifetime to live clients.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

std::string stripEtagQuotes(const std::string& etag) {
  if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
    return etag.substr(1, etag.size() - 2);
  }
  return etag;
}

std::string normalizeEndpointImpl(const std::string& endpoint_url) {
  std::string endpoint = endpoint_url;
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint;
}

bool useVirtualAddressingImpl(const S3Config& config) {
  return config.endpoint_url.empty();
}

S3Config resolveCredentialsImpl(const S3Config& config) {
  S3Config resolved = config;
  if (resolved.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      resolved.access_key = key;
    }
  }
  if (resolved.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      resolved.secret_key = key;
    }
  }
  return resolved;
}

namespace {

// Exception name when the service sent one; otherwise the HTTP status
template <typename ErrorType>
std::string errorCodeOf(const Aws::Client::AWSError<ErrorType>& error) {
  std::string code = error.GetExceptionName();
  if (!code.empty()) {
    return code;
  }
  if (error.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION) {
    return "NetworkingError";
  }
  return std::to_string(static_cast<int>(error.GetResponseCode()));
}

template <typename ErrorType>
StoreResult failureFrom(const char* operation, const Aws::Client::AWSError<ErrorType>& error) {
  std::string code = errorCodeOf(error);
  std::string message = std::string(operation) + " failed: " + std::string(error.GetMessage());
  return StoreResult::Failure(message, code);
}

}  // namespace

std::shared_ptr<Aws::IOStream> wrapBodyBuffer(const char* data, uint64_t size) {
  // bufferstream needs a mutable pointer but the SDK only reads the body
  return Aws::MakeShared<boost::interprocess::bufferstream>(
    "AisS3Body", const_cast<char*>(data), static_cast<size_t>(size)
  );
}

// =============================================================================
// S3Client Implementation
// =============================================================================

class S3Client::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() {
    AwsSdkManager::instance().addRef();
  }

  ~Impl() {
    // SDK objects must be gone before release() may call ShutdownAPI
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    if (!config.endpoint_url.empty()) {
      client_config.endpointOverride = normalizeEndpointImpl(config.endpoint_url);
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;

    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;

    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "AisS3RetryStrategy", static_cast<long>(config.max_sdk_retries)
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);

    client = std::make_shared<Aws::S3::S3Client>(
      credentials, client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      useVirtualAddressingImpl(config)
    );
  }
};

S3Client::S3Client(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = resolveCredentialsImpl(config);
  impl_->initClient();
  AIS_LOG_DEBUG(
    "S3 client created" << kv("region", impl_->config.region)
                        << kv("endpoint", impl_->config.endpoint_url)
  );
}

S3Client::~S3Client() = default;

HeadObjectResult S3Client::headObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    if (error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
      return HeadObjectResult::NotFound();
    }
    return HeadObjectResult::Failure(
      "HeadObject failed: " + std::string(error.GetMessage()), errorCodeOf(error)
    );
  }

  const auto& result = outcome.GetResult();
  return HeadObjectResult::Found(
    static_cast<uint64_t>(result.GetContentLength()), stripEtagQuotes(result.GetETag())
  );
}

StoreResult S3Client::putObject(
  const std::string& bucket, const std::string& key, const char* data, uint64_t size
) {
  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentType("application/octet-stream");
  request.SetBody(wrapBodyBuffer(data, size));
  request.SetContentLength(static_cast<long long>(size));

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("PutObject", outcome.GetError());
  }
  return StoreResult::Success(stripEtagQuotes(outcome.GetResult().GetETag()));
}

StoreResult S3Client::createMultipartUpload(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetContentType("application/octet-stream");

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("CreateMultipartUpload", outcome.GetError());
  }
  return StoreResult::Success(outcome.GetResult().GetUploadId());
}

StoreResult S3Client::uploadPart(
  const MultipartHandle& handle, int part_number, const char* data, uint64_t size
) {
  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(handle.bucket);
  request.SetKey(handle.key);
  request.SetUploadId(handle.upload_id);
  request.SetPartNumber(part_number);
  request.SetBody(wrapBodyBuffer(data, size));
  request.SetContentLength(static_cast<long long>(size));

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("UploadPart", outcome.GetError());
  }
  return StoreResult::Success(outcome.GetResult().GetETag());
}

StoreResult S3Client::completeMultipartUpload(
  const MultipartHandle& handle, const std::vector<PartReceipt>& ordered_receipts
) {
  Aws::S3::Model::CompletedMultipartUpload completed_upload;
  for (const auto& receipt : ordered_receipts) {
    Aws::S3::Model::CompletedPart part;
    part.SetETag(receipt.etag);
    part.SetPartNumber(receipt.part_number);
    completed_upload.AddParts(part);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(handle.bucket);
  request.SetKey(handle.key);
  request.SetUploadId(handle.upload_id);
  request.SetMultipartUpload(completed_upload);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("CompleteMultipartUpload", outcome.GetError());
  }
  return StoreResult::Success(stripEtagQuotes(outcome.GetResult().GetETag()));
}

StoreResult S3Client::abortMultipartUpload(const MultipartHandle& handle) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(handle.bucket);
  request.SetKey(handle.key);
  request.SetUploadId(handle.upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFrom("AbortMultipartUpload", outcome.GetError());
  }
  return StoreResult::Success();
}

StoreResult S3Client::testConnection() {
  auto outcome = impl_->client->ListBuckets();
  if (!outcome.IsSuccess()) {
    return failureFrom("ListBuckets", outcome.GetError());
  }
  AIS_LOG_DEBUG("Connection verified" << kv("buckets", outcome.GetResult().GetBuckets().size()));
  return StoreResult::Success();
}

StoreResult S3Client::headBucket(const std::string& bucket) {
  Aws::S3::Model::HeadBucketRequest request;
  request.SetBucket(bucket);

  auto outcome = impl_->client->HeadBucket(request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    if (error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
      return StoreResult::Failure("Bucket does not exist: " + bucket, "NoSuchBucket");
    }
    return failureFrom("HeadBucket", error);
  }
  return StoreResult::Success();
}

const std::string& S3Client::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace uploader
}  // namespace ais
