// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ais_log_format.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/support/date_time.hpp>

#include <cstdio>

#include "ais_log_attributes.hpp"

namespace ais {
namespace logging {

namespace expr = boost::log::expressions;

namespace {

typedef boost::log::attributes::current_thread_id::value_type thread_id_type;

const char* severity_color(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "\033[36m";
    case severity_level::info:
      return "\033[32m";
    case severity_level::warn:
      return "\033[33m";
    case severity_level::error:
      return "\033[31m";
    case severity_level::fatal:
      return "\033[35m";
  }
  return "";
}

constexpr const char* kResetColor = "\033[0m";

void write_timestamp(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  auto time_stamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
  if (time_stamp) {
    strm << *time_stamp;
  }
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          result += buf;
        } else {
          result += static_cast<char>(c);
        }
    }
  }
  return result;
}

void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
) {
  strm << "[";
  write_timestamp(rec, strm);
  strm << "] ";

  if (auto sev = rec[severity]) {
    if (use_colors) {
      strm << severity_color(*sev) << "[" << *sev << "]" << kResetColor << " ";
    } else {
      strm << "[" << *sev << "] ";
    }
  }
  if (auto comp = rec[component]) {
    strm << "[" << *comp << "] ";
  }

  strm << rec[expr::smessage];

  // Context attributes, only the ones present on this record
  const char* separator = " | ";
  if (auto key = rec[object_key]) {
    strm << separator << "object=" << *key;
    separator = " ";
  }
  if (auto part = rec[part_number]) {
    strm << separator << "part=" << *part;
    separator = " ";
  }
  if (auto run = rec[run_id]) {
    strm << separator << "run=" << *run;
  }
}

void format_json_record(boost::log::record_view const& rec, boost::log::formatting_ostream& strm) {
  strm << "{\"ts\":\"";
  write_timestamp(rec, strm);
  strm << "\",\"level\":\"";
  if (auto sev = rec[severity]) {
    strm << *sev;
  }
  strm << "\"";
  if (auto comp = rec[component]) {
    strm << ",\"component\":\"" << escape_json(*comp) << "\"";
  }
  strm << ",\"msg\":\"" << escape_json(rec[expr::smessage].get()) << "\"";

  auto thread_id = boost::log::extract<thread_id_type>("ThreadID", rec);
  if (thread_id) {
    strm << ",\"thread_id\":\"" << *thread_id << "\"";
  }
  if (auto key = rec[object_key]) {
    strm << ",\"object\":\"" << escape_json(*key) << "\"";
  }
  if (auto part = rec[part_number]) {
    strm << ",\"part\":" << *part;
  }
  if (auto run = rec[run_id]) {
    strm << ",\"run_id\":\"" << escape_json(*run) << "\"";
  }
  strm << "}";
}

}  // namespace logging
}  // namespace ais
