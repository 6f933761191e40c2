// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_LOG_FORMAT_HPP
#define AIS_LOG_FORMAT_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/utility/formatting_ostream.hpp>

#include <string>

namespace ais {
namespace logging {

/**
 * Escape a string for embedding in a JSON string literal (RFC 8259).
 */
std::string escape_json(const std::string& s);

/**
 * One-line text layout shared by the console and file sinks:
 *
 *   [2024-03-01 12:00:00.000] [INFO] [coordinator] File uploaded size=10 | object=2024/03/a.rar
 *
 * The trailing context lists whichever of object, part and run are
 * attached to the record. Colors wrap the severity tag only.
 */
void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * One JSON object per record, with keys ts, level, component, msg,
 * thread_id and, when attached, object, part and run_id.
 */
void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm);

}  // namespace logging
}  // namespace ais

#endif  // AIS_LOG_FORMAT_HPP
