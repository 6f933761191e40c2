// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_FILE_DESCRIPTOR_HPP
#define AIS_FILE_DESCRIPTOR_HPP

#include <cstdint>
#include <string>

namespace ais {
namespace uploader {

/**
 * One candidate archive discovered under BASE/YEAR/MONTH.
 *
 * Produced by the scanner once per run and never modified afterwards.
 * local_path is the identity used by the progress ledger.
 */
struct FileDescriptor {
  std::string local_path;  // absolute path, unique key
  std::string filename;
  uint64_t size = 0;
  int64_t modified_time = 0;  // seconds since epoch
  std::string year;
  std::string month;  // zero-padded to two digits
  std::string remote_key;
};

/**
 * Build the deterministic object key "{year}/{month}/{filename}".
 */
inline std::string makeRemoteKey(
  const std::string& year, const std::string& month, const std::string& filename
) {
  return year + "/" + month + "/" + filename;
}

}  // namespace uploader
}  // namespace ais

#endif  // AIS_FILE_DESCRIPTOR_HPP
