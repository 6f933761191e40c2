// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "console_progress.hpp"

#include "commands.hpp"

namespace ais {
namespace cli {

ConsoleProgress::ConsoleProgress(std::ostream& out)
    : out_(out) {}

void ConsoleProgress::onRunStarted(size_t pending_files, uint64_t pending_bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  total_files_ = pending_files;
  current_file_ = 0;
  out_ << "Uploading " << pending_files << " files (" << format_size(pending_bytes) << ")"
       << std::endl;
}

void ConsoleProgress::onFileStarted(
  const uploader::FileDescriptor& file, uploader::TransferMode mode
) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++current_file_;
  multipart_ = mode == uploader::TransferMode::MULTIPART;
  last_percent_step_ = 0;
  out_ << "[" << current_file_ << "/" << total_files_ << "] " << file.remote_key << " ("
       << format_size(file.size) << (multipart_ ? ", multipart" : "") << ")" << std::endl;
}

void ConsoleProgress::onBytesTransferred(
  const uploader::FileDescriptor& /*file*/, uint64_t bytes_done, uint64_t bytes_total
) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!multipart_ || bytes_total == 0) {
    return;
  }
  // Report every 10%
  int step = static_cast<int>(bytes_done * 10 / bytes_total);
  if (step > last_percent_step_ && step < 10) {
    last_percent_step_ = step;
    out_ << "    " << step * 10 << "%" << std::endl;
  }
}

void ConsoleProgress::onFileFinished(const uploader::FileDescriptor& /*file*/, bool success) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "    " << (success ? "done" : "FAILED") << std::endl;
}

}  // namespace cli
}  // namespace ais
