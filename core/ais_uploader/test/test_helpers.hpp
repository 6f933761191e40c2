// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_UPLOADER_TEST_HELPERS_HPP
#define AIS_UPLOADER_TEST_HELPERS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "file_descriptor.hpp"

namespace ais {
namespace uploader {
namespace test {

namespace fs = std::filesystem;

/**
 * Create a temporary directory for testing
 */
inline std::string createTempDir(const std::string& prefix = "ais_test_") {
  std::string dir =
    "/tmp/" + prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  fs::create_directories(dir);
  return dir;
}

/**
 * Write `size` bytes with a position-dependent pattern, so that parts
 * assembled in the wrong order produce different content.
 */
inline std::string createArchiveFile(const std::string& path, uint64_t size) {
  fs::create_directories(fs::path(path).parent_path());
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return "";
  }
  std::vector<char> chunk(64 * 1024);
  uint64_t written = 0;
  while (written < size) {
    size_t n = static_cast<size_t>(std::min<uint64_t>(chunk.size(), size - written));
    for (size_t i = 0; i < n; ++i) {
      chunk[i] = static_cast<char>(((written + i) * 31 + (written + i) / 251) & 0xff);
    }
    file.write(chunk.data(), static_cast<std::streamsize>(n));
    written += n;
  }
  return path;
}

inline std::string readWholeFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * Descriptor for an existing file placed at BASE/year/month/filename
 */
inline FileDescriptor describeFile(
  const std::string& path, const std::string& year, const std::string& month
) {
  FileDescriptor file;
  file.local_path = path;
  file.filename = fs::path(path).filename().string();
  file.size = fs::file_size(path);
  file.year = year;
  file.month = month;
  file.remote_key = makeRemoteKey(year, month, file.filename);
  return file;
}

/**
 * Create BASE/year/month/name with `size` bytes and describe it
 */
inline FileDescriptor createArchive(
  const std::string& base, const std::string& year, const std::string& month,
  const std::string& name, uint64_t size
) {
  std::string path = base + "/" + year + "/" + month + "/" + name;
  createArchiveFile(path, size);
  return describeFile(path, year, month);
}

}  // namespace test
}  // namespace uploader
}  // namespace ais

#endif  // AIS_UPLOADER_TEST_HELPERS_HPP
