// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_LOG_ATTRIBUTES_HPP
#define AIS_LOG_ATTRIBUTES_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>
#include <string>

namespace ais {
namespace logging {

/**
 * Severity levels for uploader logging.
 * FATAL is reserved for errors that end the process.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
  }
  return "UNKNOWN";
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

// Record attributes understood by the ais sinks:
//   Severity    set by every AIS_LOG_* macro
//   Component   AIS_LOG_COMPONENT of the emitting translation unit
//   ObjectKey   remote key of the archive in flight (AIS_LOG_SCOPED_OBJECT)
//   PartNumber  multipart part number (AIS_LOG_SCOPED_PART)
//   RunId       upload run identifier (set_run_id)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(component, "Component", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(object_key, "ObjectKey", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(part_number, "PartNumber", int)
BOOST_LOG_ATTRIBUTE_KEYWORD(run_id, "RunId", std::string)

}  // namespace logging
}  // namespace ais

#endif  // AIS_LOG_ATTRIBUTES_HPP
