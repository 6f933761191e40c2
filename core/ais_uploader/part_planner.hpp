// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_PART_PLANNER_HPP
#define AIS_PART_PLANNER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ais {
namespace uploader {

constexpr uint64_t kMiB = 1024ULL * 1024ULL;
constexpr uint64_t kDefaultPartSize = 100 * kMiB;

// S3 limits for multipart uploads
constexpr uint64_t kMinPartSize = 5 * kMiB;
constexpr uint64_t kMaxPartSize = 5ULL * 1024 * kMiB;
constexpr size_t kMaxPartCount = 10000;

/**
 * Byte range [start, end) of one part. Part numbers are 1-based.
 */
struct PartSpec {
  int part_number = 0;
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t length() const {
    return end - start;
  }
};

using PartPlan = std::vector<PartSpec>;

/**
 * Split a file into parts of `part_size` bytes; only the last part may
 * be shorter. The plan covers [0, file_size) contiguously and holds
 * ceil(file_size / part_size) parts numbered 1..N.
 *
 * @throws std::invalid_argument if file_size or part_size is zero
 */
PartPlan planParts(uint64_t file_size, uint64_t part_size);

}  // namespace uploader
}  // namespace ais

#endif  // AIS_PART_PLANNER_HPP
