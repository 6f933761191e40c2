// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_CONSOLE_SINK_HPP
#define AIS_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "ais_log_attributes.hpp"

namespace ais {
namespace logging {

// Part transfer threads must never block on terminal output, so a full
// queue drops records.
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

struct ConsoleSinkConfig {
  bool enabled = true;
  bool colors = true;
  severity_level level = severity_level::info;
};

/**
 * Create the std::clog sink. The caller registers it with the core.
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(const ConsoleSinkConfig& config);

}  // namespace logging
}  // namespace ais

#endif  // AIS_CONSOLE_SINK_HPP
