// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_UPLOADER_CONFIG_PARSER_HPP
#define AIS_UPLOADER_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "ais_log_init.hpp"
#include "uploader_config.hpp"

namespace ais {
namespace cli {

/**
 * Everything the command-line tool needs for one invocation
 */
struct CliConfig {
  uploader::UploaderConfig uploader;
  logging::LoggingConfig logging;
  std::string base_path;
};

/**
 * YAML configuration loader for ais_uploader.
 *
 * Sections: s3, upload, ledger, logging. Keys that are absent keep their
 * defaults. Precedence is file, then environment (apply_env_overrides),
 * then command-line flags applied by the caller.
 *
 * Example:
 *   s3:
 *     endpoint_url: http://minio:9000
 *     bucket: archives
 *     region: us-east-1
 *   upload:
 *     base_path: /data/archives
 *     part_size_mb: 100
 *     max_concurrent_parts: 10
 *   ledger:
 *     path: ais_upload_progress.json
 *   logging:
 *     console:
 *       level: info
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from a YAML file
   *
   * @param path Path to YAML configuration file
   * @param config Output configuration, only keys present are overwritten
   * @return true on success, false on error (see get_last_error())
   */
  bool load_from_file(const std::string& path, CliConfig& config);

  /**
   * Load configuration from a YAML string
   */
  bool load_from_string(const std::string& yaml_content, CliConfig& config);

  /**
   * Apply AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_DEFAULT_REGION,
   * S3_BUCKET_NAME, S3_ENDPOINT_URL, MAX_CONCURRENT_PARTS, PART_SIZE_MB and
   * MAX_RETRIES. Numeric values that do not parse are ignored with a warning.
   */
  static void apply_env_overrides(CliConfig& config);

  /**
   * Check transfer settings against the limits of the object store
   *
   * @param error_msg Receives the first violation
   */
  static bool validate(const uploader::UploaderConfig& config, std::string& error_msg);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, CliConfig& config);
  bool parse_upload(const YAML::Node& node, CliConfig& config);
  bool parse_ledger(const YAML::Node& node, uploader::UploaderConfig& config);
  bool parse_logging(const YAML::Node& node, logging::LoggingConfig& logging);

  mutable std::string last_error_;
};

}  // namespace cli
}  // namespace ais

#endif  // AIS_UPLOADER_CONFIG_PARSER_HPP
