// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "config_parser.hpp"

using namespace ais::cli;
using ais::uploader::kMiB;

namespace {

const char* kEnvNames[] = {
  "AWS_ACCESS_KEY_ID",    "AWS_SECRET_ACCESS_KEY", "AWS_DEFAULT_REGION",
  "S3_BUCKET_NAME",       "S3_ENDPOINT_URL",       "MAX_CONCURRENT_PARTS",
  "PART_SIZE_MB",         "MAX_RETRIES",           "AIS_LOG_LEVEL",
};

}  // namespace

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (const char* name : kEnvNames) {
      unsetenv(name);
    }
  }

  void TearDown() override {
    for (const char* name : kEnvNames) {
      unsetenv(name);
    }
  }

  ConfigParser parser_;
};

// ============================================================================
// YAML loading
// ============================================================================

TEST_F(ConfigParserTest, LoadsAllSections) {
  const char* yaml = R"(
s3:
  endpoint_url: http://minio:9000
  bucket: archives
  region: eu-west-1
  use_ssl: false
  max_retries: 5
upload:
  base_path: /data/archives
  extension: .zip
  part_size_mb: 64
  multipart_threshold_mb: 200
  max_concurrent_parts: 4
ledger:
  path: /var/lib/ais/progress.json
logging:
  console:
    level: warn
    colors: false
  file:
    enabled: true
    directory: /var/log/ais
    format: json
)";

  CliConfig config;
  ASSERT_TRUE(parser_.load_from_string(yaml, config)) << parser_.get_last_error();

  EXPECT_EQ(config.uploader.s3.endpoint_url, "http://minio:9000");
  EXPECT_EQ(config.uploader.bucket, "archives");
  EXPECT_EQ(config.uploader.s3.region, "eu-west-1");
  EXPECT_FALSE(config.uploader.s3.use_ssl);
  EXPECT_EQ(config.uploader.s3.max_sdk_retries, 5);
  EXPECT_EQ(config.base_path, "/data/archives");
  EXPECT_EQ(config.uploader.archive_extension, ".zip");
  EXPECT_EQ(config.uploader.part_size, 64 * kMiB);
  EXPECT_EQ(config.uploader.multipart_threshold, 200 * kMiB);
  EXPECT_EQ(config.uploader.max_concurrent_parts, 4u);
  EXPECT_EQ(config.uploader.ledger_path, "/var/lib/ais/progress.json");
  EXPECT_EQ(config.logging.console.level, ais::logging::severity_level::warn);
  EXPECT_FALSE(config.logging.console.colors);
  EXPECT_TRUE(config.logging.file.enabled);
  EXPECT_EQ(config.logging.file.directory, "/var/log/ais");
  EXPECT_TRUE(config.logging.file.format_json);
}

TEST_F(ConfigParserTest, AbsentKeysKeepDefaults) {
  CliConfig config;
  ASSERT_TRUE(parser_.load_from_string("s3:\n  bucket: only\n", config));

  EXPECT_EQ(config.uploader.bucket, "only");
  EXPECT_EQ(config.uploader.s3.region, "us-east-1");
  EXPECT_EQ(config.uploader.part_size, 100 * kMiB);
  EXPECT_EQ(config.uploader.max_concurrent_parts, 10u);
  EXPECT_EQ(config.uploader.ledger_path, "ais_upload_progress.json");
  EXPECT_EQ(config.uploader.archive_extension, ".rar");
}

TEST_F(ConfigParserTest, RejectsMalformedYaml) {
  CliConfig config;
  EXPECT_FALSE(parser_.load_from_string("s3: [unclosed", config));
  EXPECT_FALSE(parser_.get_last_error().empty());
}

TEST_F(ConfigParserTest, RejectsWrongValueType) {
  CliConfig config;
  EXPECT_FALSE(parser_.load_from_string("upload:\n  max_concurrent_parts: many\n", config));
}

TEST_F(ConfigParserTest, RejectsUnknownLogLevel) {
  CliConfig config;
  EXPECT_FALSE(parser_.load_from_string("logging:\n  console:\n    level: loud\n", config));
  EXPECT_NE(parser_.get_last_error().find("loud"), std::string::npos);
}

TEST_F(ConfigParserTest, MissingFile) {
  CliConfig config;
  EXPECT_FALSE(parser_.load_from_file("/nonexistent/ais.yaml", config));
  EXPECT_NE(parser_.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() /
              ("ais_config_" +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
               ".yaml");
  {
    std::ofstream out(path);
    out << "s3:\n  bucket: from-file\n";
  }

  CliConfig config;
  EXPECT_TRUE(parser_.load_from_file(path.string(), config));
  EXPECT_EQ(config.uploader.bucket, "from-file");
  std::filesystem::remove(path);
}

// ============================================================================
// Environment overrides
// ============================================================================

TEST_F(ConfigParserTest, EnvironmentOverridesFile) {
  CliConfig config;
  ASSERT_TRUE(parser_.load_from_string("s3:\n  bucket: from-file\n  region: eu-west-1\n", config));

  setenv("S3_BUCKET_NAME", "from-env", 1);
  setenv("AWS_DEFAULT_REGION", "ap-south-1", 1);
  setenv("S3_ENDPOINT_URL", "http://ceph:7480", 1);
  setenv("AWS_ACCESS_KEY_ID", "key", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "secret", 1);
  setenv("MAX_CONCURRENT_PARTS", "6", 1);
  setenv("PART_SIZE_MB", "32", 1);
  setenv("MAX_RETRIES", "7", 1);
  ConfigParser::apply_env_overrides(config);

  EXPECT_EQ(config.uploader.bucket, "from-env");
  EXPECT_EQ(config.uploader.s3.region, "ap-south-1");
  EXPECT_EQ(config.uploader.s3.endpoint_url, "http://ceph:7480");
  EXPECT_EQ(config.uploader.s3.access_key, "key");
  EXPECT_EQ(config.uploader.s3.secret_key, "secret");
  EXPECT_EQ(config.uploader.max_concurrent_parts, 6u);
  EXPECT_EQ(config.uploader.part_size, 32 * kMiB);
  EXPECT_EQ(config.uploader.s3.max_sdk_retries, 7);
}

TEST_F(ConfigParserTest, MalformedNumbersInEnvironmentAreIgnored) {
  CliConfig config;
  setenv("MAX_CONCURRENT_PARTS", "lots", 1);
  setenv("PART_SIZE_MB", "0", 1);
  ConfigParser::apply_env_overrides(config);

  EXPECT_EQ(config.uploader.max_concurrent_parts, 10u);
  EXPECT_EQ(config.uploader.part_size, 100 * kMiB);
}

TEST_F(ConfigParserTest, EnvironmentReachesLogging) {
  CliConfig config;
  setenv("AIS_LOG_LEVEL", "debug", 1);
  ConfigParser::apply_env_overrides(config);

  EXPECT_EQ(config.logging.console.level, ais::logging::severity_level::debug);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigParserTest, DefaultsAreValid) {
  ais::uploader::UploaderConfig config;
  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, ValidationRejectsBadSettings) {
  std::string error;

  ais::uploader::UploaderConfig zero_part;
  zero_part.part_size = 0;
  EXPECT_FALSE(ConfigParser::validate(zero_part, error));

  ais::uploader::UploaderConfig small_part;
  small_part.part_size = 4 * kMiB;
  EXPECT_FALSE(ConfigParser::validate(small_part, error));

  ais::uploader::UploaderConfig huge_part;
  huge_part.part_size = 6ULL * 1024 * kMiB;
  EXPECT_FALSE(ConfigParser::validate(huge_part, error));

  ais::uploader::UploaderConfig no_workers;
  no_workers.max_concurrent_parts = 0;
  EXPECT_FALSE(ConfigParser::validate(no_workers, error));

  ais::uploader::UploaderConfig no_ledger;
  no_ledger.ledger_path.clear();
  EXPECT_FALSE(ConfigParser::validate(no_ledger, error));

  ais::uploader::UploaderConfig bad_extension;
  bad_extension.archive_extension = "rar";
  EXPECT_FALSE(ConfigParser::validate(bad_extension, error));
  EXPECT_NE(error.find("extension"), std::string::npos);
}
