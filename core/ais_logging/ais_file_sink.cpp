// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ais_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/expressions.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

#include "ais_log_format.hpp"

namespace ais {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

std::string resolve_log_directory(const FileSinkConfig& config) {
  boost::filesystem::path dir(config.directory);
  boost::system::error_code ec;
  boost::filesystem::create_directories(dir, ec);
  if (ec || !boost::filesystem::is_directory(dir, ec)) {
    // The core has no sinks yet, so this goes straight to stderr
    std::cerr << "[ais_logging] Cannot use log directory '" << config.directory
              << "': " << (ec ? ec.message() : "not a directory") << "; writing to /tmp\n";
    return "/tmp";
  }
  return config.directory;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(const FileSinkConfig& config) {
  std::string directory = resolve_log_directory(config);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= config.level);
  if (config.format_json) {
    sink->set_formatter(&format_json_record);
  } else {
    sink->set_formatter(
      [](boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
        format_text_record(rec, strm, false);
      }
    );
  }
  return sink;
}

}  // namespace logging
}  // namespace ais
