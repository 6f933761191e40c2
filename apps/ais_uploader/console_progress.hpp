// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_UPLOADER_CONSOLE_PROGRESS_HPP
#define AIS_UPLOADER_CONSOLE_PROGRESS_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>

#include "progress_observer.hpp"

namespace ais {
namespace cli {

/**
 * Prints one line per file and coarse percentages for multipart files.
 */
class ConsoleProgress : public uploader::IUploadObserver {
public:
  explicit ConsoleProgress(std::ostream& out);

  void onRunStarted(size_t pending_files, uint64_t pending_bytes) override;
  void onFileStarted(const uploader::FileDescriptor& file, uploader::TransferMode mode) override;
  void onBytesTransferred(
    const uploader::FileDescriptor& file, uint64_t bytes_done, uint64_t bytes_total
  ) override;
  void onFileFinished(const uploader::FileDescriptor& file, bool success) override;

private:
  std::ostream& out_;
  std::mutex mutex_;
  size_t total_files_ = 0;
  size_t current_file_ = 0;
  int last_percent_step_ = 0;
  bool multipart_ = false;
};

}  // namespace cli
}  // namespace ais

#endif  // AIS_UPLOADER_CONSOLE_PROGRESS_HPP
