// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_FILE_SINK_HPP
#define AIS_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "ais_log_attributes.hpp"

namespace ais {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * Rotating log file settings. A long upload run rotates by size and at
 * midnight; at most `max_files` rotated files are kept in `directory`.
 */
struct FileSinkConfig {
  bool enabled = false;
  severity_level level = severity_level::debug;
  std::string directory = "logs";
  std::string file_pattern = "ais_uploader_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = false;
};

/**
 * Create the rotating file sink.
 * Falls back to /tmp when `config.directory` cannot be created.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config);

/**
 * Directory the sink will write to: `config.directory`, created if needed,
 * or /tmp when that fails.
 */
std::string resolve_log_directory(const FileSinkConfig& config);

}  // namespace logging
}  // namespace ais

#endif  // AIS_FILE_SINK_HPP
