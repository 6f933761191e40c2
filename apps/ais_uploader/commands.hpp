// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef AIS_UPLOADER_COMMANDS_HPP
#define AIS_UPLOADER_COMMANDS_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "config_parser.hpp"
#include "object_store.hpp"
#include "upload_coordinator.hpp"

namespace ais {
namespace cli {

/**
 * Flags accepted by the subcommands. Unset optionals leave the file and
 * environment configuration untouched.
 */
struct CommandOptions {
  std::string config_file;
  std::optional<std::string> base_path;
  std::optional<std::string> bucket;
  std::optional<std::string> region;
  std::optional<std::string> endpoint;
  std::optional<std::string> access_key;
  std::optional<std::string> secret_key;
  std::optional<std::string> ledger;
  std::optional<std::string> extension;
  std::optional<uint64_t> part_size_mb;
  std::optional<size_t> max_concurrent_parts;
  std::optional<size_t> max_files;
  std::string output = "ais_files.json";
  bool resume = false;
};

/**
 * Creates the object store used by upload and validate
 */
using ObjectStoreFactory =
  std::function<std::unique_ptr<uploader::IObjectStore>(const uploader::S3Config& config)>;

/**
 * Command handler for the ais_uploader CLI
 */
class Commands {
public:
  /**
   * Uses S3Client as the object store
   */
  Commands();

  explicit Commands(ObjectStoreFactory store_factory);
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse and execute command line
   *
   * @return Process exit code
   */
  int execute(int argc, char* argv[]);

  /**
   * Scan, check the store and upload pending archives
   */
  int upload(const CliConfig& config, const CommandOptions& options);

  /**
   * Scan and write the file list
   */
  int scan(const CliConfig& config, const CommandOptions& options);

  /**
   * Print the ledger grouped by year and month
   */
  int status(const CliConfig& config);

  /**
   * Compare every ledger record with the bucket
   */
  int validate(const CliConfig& config);

  /**
   * Print discovered, uploaded and pending counts per period
   */
  int info(const CliConfig& config);

  /**
   * Ask a running upload to stop after the file in flight.
   * Only touches atomics, safe to call from a signal handler.
   */
  void request_stop();

  /**
   * Parse flags from argv[start..argc)
   *
   * @param error Receives a message for unknown flags or bad values
   */
  static bool parse_options(
    int argc, char* argv[], int start, CommandOptions& options, std::string& error
  );

  /**
   * Merge config file, environment and flags, in that order
   */
  static bool build_config(const CommandOptions& options, CliConfig& config, std::string& error);

private:
  void print_usage();

  ObjectStoreFactory store_factory_;
  std::atomic<uploader::UploadCoordinator*> active_coordinator_{nullptr};
  std::atomic<bool> stop_requested_{false};
};

/**
 * Format size for human readable output
 */
std::string format_size(uint64_t size);

}  // namespace cli
}  // namespace ais

#endif  // AIS_UPLOADER_COMMANDS_HPP
