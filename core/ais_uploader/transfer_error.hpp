// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_TRANSFER_ERROR_HPP
#define AIS_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ais {
namespace uploader {

/**
 * Classification of a failed transfer step.
 */
enum class FailureKind {
  NONE,
  NETWORK,          // timeouts, throttling, connection errors
  PERMISSION,       // credentials rejected or access denied
  NOT_FOUND,        // local file, bucket, key or upload id missing
  LOCAL_IO,         // local read failed or returned fewer bytes than planned
  INVALID_INPUT,    // caller supplied an impossible request
  INTEGRITY,        // receipts do not cover parts 1..N exactly
  REMOTE_REJECTED,  // store refused the completion or part layout
  UNKNOWN
};

const char* failureKindToString(FailureKind kind);

/**
 * Map an S3/HTTP error code (AWSError exception name or HTTP status as
 * text) to a FailureKind. Unrecognized codes map to UNKNOWN.
 */
FailureKind classifyErrorCode(const std::string& error_code);

/**
 * Run-level failure detected before any transfer: missing base path,
 * unreachable store, absent bucket, invalid configuration.
 */
class SetupError : public std::runtime_error {
public:
  explicit SetupError(const std::string& message)
      : std::runtime_error(message) {}
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_TRANSFER_ERROR_HPP
