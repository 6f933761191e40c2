// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_UPLOADER_CONFIG_HPP
#define AIS_UPLOADER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "s3_client.hpp"
#include "upload_coordinator.hpp"

namespace ais {
namespace uploader {

/**
 * Complete configuration of an upload run
 */
struct UploaderConfig {
  // Object store
  S3Config s3;
  std::string bucket;

  // Transfer settings
  uint64_t part_size = kDefaultPartSize;
  uint64_t multipart_threshold = kDefaultMultipartThreshold;
  size_t max_concurrent_parts = 10;

  // Local state
  std::string ledger_path = "ais_upload_progress.json";
  std::string archive_extension = ".rar";

  CoordinatorConfig coordinatorConfig() const {
    CoordinatorConfig config;
    config.bucket = bucket;
    config.part_size = part_size;
    config.multipart_threshold = multipart_threshold;
    config.max_concurrent_parts = max_concurrent_parts;
    return config;
  }
};

}  // namespace uploader
}  // namespace ais

#endif  // AIS_UPLOADER_CONFIG_HPP
