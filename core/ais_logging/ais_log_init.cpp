// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ais_log_init.hpp"

#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <mutex>

#include "ais_log_macros.hpp"

namespace ais {
namespace logging {

namespace {

/**
 * Sinks and global attributes owned by this library.
 */
struct LoggingState {
  std::mutex mutex;
  bool initialized = false;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  std::optional<boost::log::attribute_set::iterator> run_id;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<bool> parse_bool(const std::string& s) {
  std::string lower = to_lower(s);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

struct EnvOverride {
  const char* name;
  std::function<void(LoggingConfig&, const std::string&)> apply;
};

void set_level(severity_level& target, const std::string& value) {
  if (auto level = parse_severity_level(value)) {
    target = *level;
  }
}

void set_flag(bool& target, const std::string& value) {
  if (auto flag = parse_bool(value)) {
    target = *flag;
  }
}

// Order matters: the sink-specific levels come after AIS_LOG_LEVEL.
const EnvOverride kEnvOverrides[] = {
  {"AIS_LOG_LEVEL",
   [](LoggingConfig& c, const std::string& v) {
     set_level(c.console.level, v);
     set_level(c.file.level, v);
   }},
  {"AIS_LOG_CONSOLE_LEVEL",
   [](LoggingConfig& c, const std::string& v) { set_level(c.console.level, v); }},
  {"AIS_LOG_CONSOLE_ENABLED",
   [](LoggingConfig& c, const std::string& v) { set_flag(c.console.enabled, v); }},
  {"AIS_LOG_COLORS", [](LoggingConfig& c, const std::string& v) { set_flag(c.console.colors, v); }},
  {"AIS_LOG_FILE_LEVEL",
   [](LoggingConfig& c, const std::string& v) { set_level(c.file.level, v); }},
  {"AIS_LOG_FILE_ENABLED",
   [](LoggingConfig& c, const std::string& v) { set_flag(c.file.enabled, v); }},
  {"AIS_LOG_FILE_DIR", [](LoggingConfig& c, const std::string& v) { c.file.directory = v; }},
  {"AIS_LOG_FORMAT",
   [](LoggingConfig& c, const std::string& v) { c.file.format_json = (to_lower(v) == "json"); }},
};

void remove_run_id_locked(LoggingState& s) {
  if (s.run_id) {
    boost::log::core::get()->remove_global_attribute(*s.run_id);
    s.run_id.reset();
  }
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);
  if (lower == "debug") {
    return severity_level::debug;
  } else if (lower == "info") {
    return severity_level::info;
  } else if (lower == "warn" || lower == "warning") {
    return severity_level::warn;
  } else if (lower == "error") {
    return severity_level::error;
  } else if (lower == "fatal") {
    return severity_level::fatal;
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  for (const auto& entry : kEnvOverrides) {
    const char* value = std::getenv(entry.name);
    if (value && value[0] != '\0') {
      entry.apply(config, value);
    }
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console.enabled) {
    s.console = create_console_sink(config.console);
    core->add_sink(s.console);
  }
  if (config.file.enabled) {
    s.file = create_file_sink(config.file);
    core->add_sink(s.file);
  }
  s.initialized = true;
}

void shutdown_logging() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  // Stopping an async sink drains its queue
  if (s.console) {
    s.console->stop();
    s.console->flush();
    core->remove_sink(s.console);
    s.console.reset();
  }
  if (s.file) {
    s.file->stop();
    s.file->flush();
    core->remove_sink(s.file);
    s.file.reset();
  }
  remove_run_id_locked(s);
  s.initialized = false;
}

void flush_logging() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.console) {
    s.console->flush();
  }
  if (s.file) {
    s.file->flush();
  }
}

bool is_logging_initialized() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.initialized;
}

void set_run_id(const std::string& id) {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  remove_run_id_locked(s);
  auto added = boost::log::core::get()->add_global_attribute(
    "RunId", boost::log::attributes::constant<std::string>(id)
  );
  s.run_id = added.first;
}

void clear_run_id() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  remove_run_id_locked(s);
}

}  // namespace logging
}  // namespace ais
