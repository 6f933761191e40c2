// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_error.hpp"

#include <map>

namespace ais {
namespace uploader {

const char* failureKindToString(FailureKind kind) {
  switch (kind) {
    case FailureKind::NONE:
      return "none";
    case FailureKind::NETWORK:
      return "network";
    case FailureKind::PERMISSION:
      return "permission";
    case FailureKind::NOT_FOUND:
      return "not_found";
    case FailureKind::LOCAL_IO:
      return "local_io";
    case FailureKind::INVALID_INPUT:
      return "invalid_input";
    case FailureKind::INTEGRITY:
      return "integrity";
    case FailureKind::REMOTE_REJECTED:
      return "remote_rejected";
    case FailureKind::UNKNOWN:
    default:
      return "unknown";
  }
}

FailureKind classifyErrorCode(const std::string& error_code) {
  static const std::map<std::string, FailureKind> kinds = {
    // Transient S3/HTTP errors
    {"RequestTimeout", FailureKind::NETWORK},
    {"ServiceUnavailable", FailureKind::NETWORK},
    {"InternalError", FailureKind::NETWORK},
    {"SlowDown", FailureKind::NETWORK},
    {"RequestTimeTooSkewed", FailureKind::NETWORK},
    {"OperationAborted", FailureKind::NETWORK},
    {"Throttling", FailureKind::NETWORK},
    {"ThrottlingException", FailureKind::NETWORK},
    {"500", FailureKind::NETWORK},
    {"503", FailureKind::NETWORK},

    // Network errors
    {"ConnectionReset", FailureKind::NETWORK},
    {"ConnectionTimeout", FailureKind::NETWORK},
    {"ConnectionRefused", FailureKind::NETWORK},
    {"NetworkingError", FailureKind::NETWORK},
    {"UnknownEndpoint", FailureKind::NETWORK},

    // MinIO-specific
    {"XMinioServerNotInitialized", FailureKind::NETWORK},

    // Credentials
    {"AccessDenied", FailureKind::PERMISSION},
    {"InvalidAccessKeyId", FailureKind::PERMISSION},
    {"SignatureDoesNotMatch", FailureKind::PERMISSION},
    {"ExpiredToken", FailureKind::PERMISSION},
    {"InvalidToken", FailureKind::PERMISSION},
    {"403", FailureKind::PERMISSION},

    // Missing resources
    {"NoSuchKey", FailureKind::NOT_FOUND},
    {"NoSuchBucket", FailureKind::NOT_FOUND},
    {"NoSuchUpload", FailureKind::NOT_FOUND},
    {"NotFound", FailureKind::NOT_FOUND},
    {"FileNotFound", FailureKind::NOT_FOUND},
    {"404", FailureKind::NOT_FOUND},

    // Part layout rejected by the store
    {"InvalidPart", FailureKind::REMOTE_REJECTED},
    {"InvalidPartOrder", FailureKind::REMOTE_REJECTED},
    {"EntityTooSmall", FailureKind::REMOTE_REJECTED},
    {"EntityTooLarge", FailureKind::REMOTE_REJECTED},
    {"XAmzContentSHA256Mismatch", FailureKind::REMOTE_REJECTED},
  };

  auto it = kinds.find(error_code);
  if (it == kinds.end()) {
    return FailureKind::UNKNOWN;
  }
  return it->second;
}

}  // namespace uploader
}  // namespace ais
