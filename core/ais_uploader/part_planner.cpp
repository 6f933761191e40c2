// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "part_planner.hpp"

#include <algorithm>
#include <stdexcept>

namespace ais {
namespace uploader {

PartPlan planParts(uint64_t file_size, uint64_t part_size) {
  if (file_size == 0) {
    throw std::invalid_argument("planParts: file size must be positive");
  }
  if (part_size == 0) {
    throw std::invalid_argument("planParts: part size must be positive");
  }

  uint64_t count = (file_size + part_size - 1) / part_size;

  PartPlan plan;
  plan.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    PartSpec spec;
    spec.part_number = static_cast<int>(i + 1);
    spec.start = i * part_size;
    spec.end = std::min(spec.start + part_size, file_size);
    plan.push_back(spec);
  }
  return plan;
}

}  // namespace uploader
}  // namespace ais
