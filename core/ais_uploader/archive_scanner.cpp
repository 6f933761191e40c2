// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "archive_scanner.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <tuple>

#include "transfer_error.hpp"

#define AIS_LOG_COMPONENT "archive_scanner"
#include "ais_log_macros.hpp"

namespace ais {
namespace uploader {

using logging::kv;
namespace fs = std::filesystem;

bool isAllDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

namespace {

std::vector<fs::path> digitSubdirectories(const fs::path& parent) {
  std::vector<fs::path> dirs;
  std::error_code ec;
  for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec) && isAllDigits(it->path().filename().string())) {
      dirs.push_back(it->path());
    }
  }
  if (ec) {
    AIS_LOG_WARN("Cannot list directory" << kv("path", parent.string()) << " - " << ec.message());
  }
  return dirs;
}

std::string padMonth(const std::string& month) {
  if (month.size() >= 2) {
    return month;
  }
  return std::string(2 - month.size(), '0') + month;
}

int64_t modifiedSeconds(const fs::directory_entry& entry) {
  std::error_code ec;
  auto ftime = entry.last_write_time(ec);
  if (ec) {
    return 0;
  }
  // file_clock and system_clock share an epoch offset only in C++20
  auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now()
  );
  return std::chrono::duration_cast<std::chrono::seconds>(system_time.time_since_epoch()).count();
}

}  // namespace

ArchiveScanner::ArchiveScanner(const std::string& base_path, const std::string& extension)
    : base_path_(base_path)
    , extension_(extension) {
  std::error_code ec;
  if (!fs::exists(base_path_, ec)) {
    throw SetupError("Base path does not exist: " + base_path_);
  }
  if (!fs::is_directory(base_path_, ec)) {
    throw SetupError("Base path is not a directory: " + base_path_);
  }
}

std::vector<FileDescriptor> ArchiveScanner::scan() const {
  std::vector<FileDescriptor> files;

  for (const auto& year_dir : digitSubdirectories(base_path_)) {
    std::string year = year_dir.filename().string();

    for (const auto& month_dir : digitSubdirectories(year_dir)) {
      std::string month = padMonth(month_dir.filename().string());

      std::error_code ec;
      for (fs::directory_iterator it(month_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || it->path().extension() != extension_) {
          continue;
        }

        uint64_t size = it->file_size(entry_ec);
        if (entry_ec) {
          AIS_LOG_WARN(
            "Skipping unreadable file" << kv("path", it->path().string()) << " - "
                                       << entry_ec.message()
          );
          continue;
        }

        FileDescriptor file;
        file.local_path = fs::absolute(it->path()).lexically_normal().string();
        file.filename = it->path().filename().string();
        file.size = size;
        file.modified_time = modifiedSeconds(*it);
        file.year = year;
        file.month = month;
        file.remote_key = makeRemoteKey(year, month, file.filename);
        files.push_back(file);
      }
      if (ec) {
        AIS_LOG_WARN(
          "Cannot list directory" << kv("path", month_dir.string()) << " - " << ec.message()
        );
      }
    }
  }

  std::sort(files.begin(), files.end(), [](const FileDescriptor& a, const FileDescriptor& b) {
    return std::tie(a.year, a.month, a.filename) < std::tie(b.year, b.month, b.filename);
  });

  AIS_LOG_INFO("Scan finished" << kv("base_path", base_path_) << kv("files", files.size()));
  return files;
}

PeriodIndex ArchiveScanner::groupByPeriod(const std::vector<FileDescriptor>& files) {
  PeriodIndex index;
  for (const auto& file : files) {
    index[file.year][file.month].push_back(file);
  }
  return index;
}

bool ArchiveScanner::saveFileList(
  const std::vector<FileDescriptor>& files, const std::string& output_path
) {
  nlohmann::json document = nlohmann::json::object();
  for (const auto& [year, months] : groupByPeriod(files)) {
    for (const auto& [month, entries] : months) {
      nlohmann::json list = nlohmann::json::array();
      for (const auto& file : entries) {
        list.push_back({
          {"filename", file.filename},
          {"filepath", file.local_path},
          {"size", file.size},
          {"modified", file.modified_time},
          {"year", file.year},
          {"month", file.month},
          {"s3_key", file.remote_key},
        });
      }
      document[year][month] = list;
    }
  }

  // Names that are not valid UTF-8 are written with U+FFFD replacements
  std::string text;
  try {
    text = document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception& e) {
    AIS_LOG_ERROR("Cannot serialize file list" << kv("path", output_path) << " - " << e.what());
    return false;
  }

  std::ofstream out(output_path, std::ios::trunc);
  if (!out) {
    AIS_LOG_ERROR("Cannot open file list for writing" << kv("path", output_path));
    return false;
  }
  out << text;
  out.flush();
  if (!out) {
    AIS_LOG_ERROR("Writing file list failed" << kv("path", output_path));
    return false;
  }
  AIS_LOG_INFO("File list saved" << kv("path", output_path) << kv("files", files.size()));
  return true;
}

}  // namespace uploader
}  // namespace ais
