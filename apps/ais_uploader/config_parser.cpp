// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cstdlib>
#include <fstream>

#include "part_planner.hpp"

#define AIS_LOG_COMPONENT "config_parser"
#include "ais_log_macros.hpp"

namespace ais {
namespace cli {

using logging::kv;
using uploader::kMiB;

namespace {

bool parse_level(const YAML::Node& node, logging::severity_level& level, std::string& error) {
  auto name = node.as<std::string>();
  auto parsed = logging::parse_severity_level(name);
  if (!parsed) {
    error = "Unknown log level: " + name;
    return false;
  }
  level = *parsed;
  return true;
}

// Positive integer from the environment, or 0 when unset or malformed
uint64_t env_positive(const char* name) {
  const char* value = std::getenv(name);
  if (!value || !*value) {
    return 0;
  }
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(value, &end, 10);
  if (*end != '\0' || parsed == 0) {
    AIS_LOG_WARN("Ignoring invalid environment value" << kv("name", name) << kv("value", value));
    return 0;
  }
  return parsed;
}

void env_string(const char* name, std::string& target) {
  if (const char* value = std::getenv(name)) {
    if (*value) {
      target = value;
    }
  }
}

}  // namespace

// ============================================================================
// ConfigParser Implementation
// ============================================================================

bool ConfigParser::load_from_file(const std::string& path, CliConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, CliConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["s3"] && !parse_s3(node["s3"], config)) {
      return false;
    }
    if (node["upload"] && !parse_upload(node["upload"], config)) {
      return false;
    }
    if (node["ledger"] && !parse_ledger(node["ledger"], config.uploader)) {
      return false;
    }
    if (node["logging"] && !parse_logging(node["logging"], config.logging)) {
      return false;
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_s3(const YAML::Node& node, CliConfig& config) {
  auto& s3 = config.uploader.s3;
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    config.uploader.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_retries"]) {
    s3.max_sdk_retries = node["max_retries"].as<int>();
  }
  return true;
}

bool ConfigParser::parse_upload(const YAML::Node& node, CliConfig& config) {
  auto& uploader = config.uploader;
  if (node["base_path"]) {
    config.base_path = node["base_path"].as<std::string>();
  }
  if (node["extension"]) {
    uploader.archive_extension = node["extension"].as<std::string>();
  }
  if (node["part_size_mb"]) {
    uploader.part_size = node["part_size_mb"].as<uint64_t>() * kMiB;
  }
  if (node["multipart_threshold_mb"]) {
    uploader.multipart_threshold = node["multipart_threshold_mb"].as<uint64_t>() * kMiB;
  }
  if (node["max_concurrent_parts"]) {
    uploader.max_concurrent_parts = node["max_concurrent_parts"].as<size_t>();
  }
  return true;
}

bool ConfigParser::parse_ledger(const YAML::Node& node, uploader::UploaderConfig& config) {
  if (node["path"]) {
    config.ledger_path = node["path"].as<std::string>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, logging::LoggingConfig& logging) {
  if (node["console"]) {
    const auto& console = node["console"];
    auto& sink = logging.console;
    if (console["enabled"]) {
      sink.enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      sink.colors = console["colors"].as<bool>();
    }
    if (console["level"] && !parse_level(console["level"], sink.level, last_error_)) {
      return false;
    }
  }

  if (node["file"]) {
    const auto& file = node["file"];
    auto& sink = logging.file;
    if (file["enabled"]) {
      sink.enabled = file["enabled"].as<bool>();
    }
    if (file["level"] && !parse_level(file["level"], sink.level, last_error_)) {
      return false;
    }
    if (file["directory"]) {
      sink.directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      sink.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      sink.format_json = file["format"].as<std::string>() == "json";
    }
    if (file["rotation_size_mb"]) {
      sink.rotation_size_mb = file["rotation_size_mb"].as<uint64_t>();
    }
    if (file["max_files"]) {
      sink.max_files = file["max_files"].as<int>();
    }
    if (file["rotate_at_midnight"]) {
      sink.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

void ConfigParser::apply_env_overrides(CliConfig& config) {
  auto& uploader = config.uploader;
  env_string("AWS_ACCESS_KEY_ID", uploader.s3.access_key);
  env_string("AWS_SECRET_ACCESS_KEY", uploader.s3.secret_key);
  env_string("AWS_DEFAULT_REGION", uploader.s3.region);
  env_string("S3_BUCKET_NAME", uploader.bucket);
  env_string("S3_ENDPOINT_URL", uploader.s3.endpoint_url);

  if (uint64_t parts = env_positive("MAX_CONCURRENT_PARTS")) {
    uploader.max_concurrent_parts = static_cast<size_t>(parts);
  }
  if (uint64_t part_mb = env_positive("PART_SIZE_MB")) {
    uploader.part_size = part_mb * kMiB;
  }
  if (uint64_t retries = env_positive("MAX_RETRIES")) {
    uploader.s3.max_sdk_retries = static_cast<int>(retries);
  }

  logging::apply_env_overrides(config.logging);
}

bool ConfigParser::validate(const uploader::UploaderConfig& config, std::string& error_msg) {
  if (config.part_size == 0) {
    error_msg = "part size must be positive";
    return false;
  }
  if (config.part_size < uploader::kMinPartSize) {
    error_msg = "part size must be at least 5 MiB";
    return false;
  }
  if (config.part_size > uploader::kMaxPartSize) {
    error_msg = "part size must not exceed 5 GiB";
    return false;
  }
  if (config.max_concurrent_parts == 0) {
    error_msg = "max_concurrent_parts must be positive";
    return false;
  }
  if (config.ledger_path.empty()) {
    error_msg = "ledger path must not be empty";
    return false;
  }
  if (config.archive_extension.empty() || config.archive_extension[0] != '.') {
    error_msg = "archive extension must start with '.'";
    return false;
  }
  if (config.s3.max_sdk_retries < 0) {
    error_msg = "max_retries must not be negative";
    return false;
  }
  return true;
}

}  // namespace cli
}  // namespace ais
