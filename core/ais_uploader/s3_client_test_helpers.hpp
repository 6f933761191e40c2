// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_S3_CLIENT_TEST_HELPERS_HPP
#define AIS_S3_CLIENT_TEST_HELPERS_HPP

// This header is for testing only - exposes internal implementations
// defined in s3_client.cpp

#include <aws/core/utils/memory/stl/AWSStreamFwd.h>

#include <cstdint>
#include <memory>
#include <string>

#include "s3_client.hpp"

namespace ais {
namespace uploader {

/**
 * Remove one pair of surrounding double quotes from an ETag
 */
std::string stripEtagQuotes(const std::string& etag);

/**
 * Drop trailing slashes from an endpoint URL
 */
std::string normalizeEndpointImpl(const std::string& endpoint_url);

/**
 * Virtual-hosted addressing for AWS S3, path style for custom endpoints
 */
bool useVirtualAddressingImpl(const S3Config& config);

/**
 * Fill empty credentials from AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY
 */
S3Config resolveCredentialsImpl(const S3Config& config);

/**
 * Request body stream over `size` bytes at `data`, without copying
 */
std::shared_ptr<Aws::IOStream> wrapBodyBuffer(const char* data, uint64_t size);

}  // namespace uploader
}  // namespace ais

#endif  // AIS_S3_CLIENT_TEST_HELPERS_HPP
