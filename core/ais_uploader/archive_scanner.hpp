// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_ARCHIVE_SCANNER_HPP
#define AIS_ARCHIVE_SCANNER_HPP

#include <map>
#include <string>
#include <vector>

#include "file_descriptor.hpp"

namespace ais {
namespace uploader {

/**
 * Files grouped by year, then month
 */
using PeriodIndex = std::map<std::string, std::map<std::string, std::vector<FileDescriptor>>>;

/**
 * Discovers archives laid out as BASE/YEAR/MONTH/<name><extension>.
 *
 * YEAR and MONTH must be all-digit directory names; anything else is
 * ignored. Months are zero-padded to two digits in the descriptor and the
 * remote key, so "BASE/2024/3/a.rar" becomes "2024/03/a.rar".
 */
class ArchiveScanner {
public:
  /**
   * @throws SetupError if base_path does not exist or is not a directory
   */
  explicit ArchiveScanner(const std::string& base_path, const std::string& extension = ".rar");

  /**
   * Walk the tree. Results are ordered by year, month, then filename.
   * Unreadable entries are skipped with a warning.
   */
  std::vector<FileDescriptor> scan() const;

  /**
   * Write the grouped file list as JSON.
   * @return false if the file could not be written
   */
  static bool saveFileList(
    const std::vector<FileDescriptor>& files, const std::string& output_path
  );

  static PeriodIndex groupByPeriod(const std::vector<FileDescriptor>& files);

  const std::string& basePath() const {
    return base_path_;
  }

private:
  std::string base_path_;
  std::string extension_;
};

/**
 * True if s is non-empty and contains only ASCII digits
 */
bool isAllDigits(const std::string& s);

}  // namespace uploader
}  // namespace ais

#endif  // AIS_ARCHIVE_SCANNER_HPP
