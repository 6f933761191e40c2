// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_LOG_MACROS_HPP
#define AIS_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <chrono>
#include <mutex>
#include <sstream>
#include <string>

#include "ais_log_attributes.hpp"

namespace ais {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in ais_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value fragment for structured messages.
 * Usage: AIS_LOG_INFO("Part committed" << kv("part", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace ais

// =============================================================================
// Component identification
// Define AIS_LOG_COMPONENT before including this header:
//
//   #define AIS_LOG_COMPONENT "multipart_session"
//   #include "ais_log_macros.hpp"
// =============================================================================
#ifndef AIS_LOG_COMPONENT
#define AIS_LOG_COMPONENT "ais"
#endif

#ifdef NDEBUG
#define AIS_LOG_ENABLE_DEBUG 0
#else
#define AIS_LOG_ENABLE_DEBUG 1
#endif

// The component travels as the Component attribute so the JSON sink can
// emit it as its own field.
#define AIS_LOG_SEV_(level, msg)                                                          \
  do {                                                                                    \
    BOOST_LOG_SEV(::ais::logging::get_logger(), ::ais::logging::severity_level::level)    \
      << ::boost::log::add_value("Component", std::string(AIS_LOG_COMPONENT)) << msg;     \
  } while (0)

#define AIS_LOG_DEBUG(msg)      \
  do {                          \
    if (AIS_LOG_ENABLE_DEBUG) { \
      AIS_LOG_SEV_(debug, msg); \
    }                           \
  } while (0)

#define AIS_LOG_INFO(msg) AIS_LOG_SEV_(info, msg)
#define AIS_LOG_WARN(msg) AIS_LOG_SEV_(warn, msg)
#define AIS_LOG_ERROR(msg) AIS_LOG_SEV_(error, msg)
#define AIS_LOG_FATAL(msg) AIS_LOG_SEV_(fatal, msg)

// =============================================================================
// Transfer context
// Every record emitted on this thread until scope exit carries the remote
// key (and, inside a part task, the part number).
//
//   AIS_LOG_SCOPED_OBJECT(file.remote_key);
//   AIS_LOG_SCOPED_PART(spec.part_number);
// =============================================================================
#define AIS_LOG_SCOPED_OBJECT(key)                                                      \
  BOOST_LOG_SCOPED_THREAD_ATTR(                                                         \
    "ObjectKey", ::boost::log::attributes::constant<std::string>(key)                   \
  )

#define AIS_LOG_SCOPED_PART(number) \
  BOOST_LOG_SCOPED_THREAD_ATTR("PartNumber", ::boost::log::attributes::constant<int>(number))

// =============================================================================
// Time-based throttling: log at most once per interval (seconds) per call site.
// Usage: AIS_LOG_INFO_THROTTLE(2.0, "Progress" << kv("bytes", done));
// =============================================================================
#define AIS_LOG_THROTTLE_(log_macro, interval_sec, msg)                                      \
  do {                                                                                      \
    static std::chrono::steady_clock::time_point _ais_last_log_time{};                     \
    static std::mutex _ais_throttle_mutex;                                                  \
    auto _ais_now = std::chrono::steady_clock::now();                                       \
    bool _ais_should_log = false;                                                           \
    {                                                                                       \
      std::lock_guard<std::mutex> _ais_lock(_ais_throttle_mutex);                           \
      if (_ais_now - _ais_last_log_time >= std::chrono::duration<double>(interval_sec)) {   \
        _ais_last_log_time = _ais_now;                                                      \
        _ais_should_log = true;                                                             \
      }                                                                                     \
    }                                                                                       \
    if (_ais_should_log) {                                                                  \
      log_macro(msg);                                                                       \
    }                                                                                       \
  } while (0)

#define AIS_LOG_INFO_THROTTLE(interval_sec, msg) AIS_LOG_THROTTLE_(AIS_LOG_INFO, interval_sec, msg)
#define AIS_LOG_WARN_THROTTLE(interval_sec, msg) AIS_LOG_THROTTLE_(AIS_LOG_WARN, interval_sec, msg)

#endif  // AIS_LOG_MACROS_HPP
