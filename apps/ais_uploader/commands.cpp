// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

#include "ais_log_init.hpp"
#include "archive_scanner.hpp"
#include "console_progress.hpp"
#include "progress_ledger.hpp"
#include "s3_client.hpp"
#include "transfer_error.hpp"

#define AIS_LOG_COMPONENT "commands"
#include "ais_log_macros.hpp"

namespace ais {
namespace cli {

namespace fs = std::filesystem;
using logging::kv;

namespace {

constexpr size_t kMaxPrintedErrors = 10;

/**
 * Initializes logging for one command and shuts it down afterwards, unless
 * logging was already running.
 */
class LoggingScope {
public:
  explicit LoggingScope(const logging::LoggingConfig& config)
      : owns_(!logging::is_logging_initialized()) {
    if (owns_) {
      logging::init_logging(config);
    }
  }

  ~LoggingScope() {
    if (owns_) {
      logging::shutdown_logging();
    }
  }

  LoggingScope(const LoggingScope&) = delete;
  LoggingScope& operator=(const LoggingScope&) = delete;

private:
  bool owns_;
};

// Local start time, e.g. "20240301-120000"; tags every record of one run.
std::string make_run_id() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream oss;
  oss << std::put_time(&local, "%Y%m%d-%H%M%S");
  return oss.str();
}

bool parse_count(
  const std::string& flag, const std::string& value, uint64_t& out, std::string& error
) {
  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size() || value[0] == '-') {
      throw std::invalid_argument(value);
    }
    out = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    error = "Invalid value for " + flag + ": " + value;
  } catch (const std::out_of_range&) {
    error = "Value out of range for " + flag + ": " + value;
  }
  return false;
}

void print_rule(size_t width = 50) {
  std::cout << std::string(width, '=') << std::endl;
}

}  // namespace

std::string format_size(uint64_t size) {
  const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit_index = 0;
  double value = static_cast<double>(size);

  while (value >= 1024.0 && unit_index < 4) {
    value /= 1024.0;
    unit_index++;
  }

  std::ostringstream oss;
  if (unit_index == 0) {
    oss << size << " B";
  } else {
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit_index];
  }
  return oss.str();
}

// ============================================================================
// Construction and parsing
// ============================================================================

Commands::Commands()
    : Commands([](const uploader::S3Config& config) -> std::unique_ptr<uploader::IObjectStore> {
        return std::make_unique<uploader::S3Client>(config);
      }) {}

Commands::Commands(ObjectStoreFactory store_factory)
    : store_factory_(std::move(store_factory)) {}

void Commands::request_stop() {
  stop_requested_.store(true);
  if (auto* coordinator = active_coordinator_.load()) {
    coordinator->requestStop();
  }
}

bool Commands::parse_options(
  int argc, char* argv[], int start, CommandOptions& options, std::string& error
) {
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--resume") {
      options.resume = true;
      continue;
    }

    if (i + 1 >= argc) {
      error = "Missing value for " + arg;
      return false;
    }
    std::string value = argv[++i];
    uint64_t number = 0;

    if (arg == "--config" || arg == "-c") {
      options.config_file = value;
    } else if (arg == "--base-path" || arg == "-p") {
      options.base_path = value;
    } else if (arg == "--bucket" || arg == "-b") {
      options.bucket = value;
    } else if (arg == "--region" || arg == "-r") {
      options.region = value;
    } else if (arg == "--endpoint") {
      options.endpoint = value;
    } else if (arg == "--access-key") {
      options.access_key = value;
    } else if (arg == "--secret-key") {
      options.secret_key = value;
    } else if (arg == "--ledger") {
      options.ledger = value;
    } else if (arg == "--extension") {
      options.extension = value;
    } else if (arg == "--output" || arg == "-o") {
      options.output = value;
    } else if (arg == "--max-files") {
      if (!parse_count(arg, value, number, error)) {
        return false;
      }
      options.max_files = static_cast<size_t>(number);
    } else if (arg == "--part-size-mb") {
      if (!parse_count(arg, value, number, error)) {
        return false;
      }
      options.part_size_mb = number;
    } else if (arg == "--max-concurrent-parts") {
      if (!parse_count(arg, value, number, error)) {
        return false;
      }
      options.max_concurrent_parts = static_cast<size_t>(number);
    } else {
      error = "Unknown option '" + arg + "'";
      return false;
    }
  }
  return true;
}

bool Commands::build_config(const CommandOptions& options, CliConfig& config, std::string& error) {
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      error = parser.get_last_error();
      return false;
    }
  }

  ConfigParser::apply_env_overrides(config);

  auto& uploader = config.uploader;
  if (options.base_path) {
    config.base_path = *options.base_path;
  }
  if (options.bucket) {
    uploader.bucket = *options.bucket;
  }
  if (options.region) {
    uploader.s3.region = *options.region;
  }
  if (options.endpoint) {
    uploader.s3.endpoint_url = *options.endpoint;
  }
  if (options.access_key) {
    uploader.s3.access_key = *options.access_key;
  }
  if (options.secret_key) {
    uploader.s3.secret_key = *options.secret_key;
  }
  if (options.ledger) {
    uploader.ledger_path = *options.ledger;
  }
  if (options.extension) {
    uploader.archive_extension = *options.extension;
  }
  if (options.part_size_mb) {
    uploader.part_size = *options.part_size_mb * uploader::kMiB;
  }
  if (options.max_concurrent_parts) {
    uploader.max_concurrent_parts = *options.max_concurrent_parts;
  }

  return ConfigParser::validate(uploader, error);
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return 0;
  }

  if (command != "upload" && command != "scan" && command != "status" && command != "validate" &&
      command != "info") {
    std::cerr << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }

  CommandOptions options;
  std::string error;
  if (!parse_options(argc, argv, 2, options, error)) {
    std::cerr << "Error: " << error << std::endl;
    return 1;
  }

  CliConfig config;
  if (!build_config(options, config, error)) {
    std::cerr << "Error: Invalid configuration: " << error << std::endl;
    return 1;
  }

  LoggingScope logging_scope(config.logging);

  try {
    if (command == "upload") {
      return upload(config, options);
    } else if (command == "scan") {
      return scan(config, options);
    } else if (command == "status") {
      return status(config);
    } else if (command == "validate") {
      return validate(config);
    } else {
      return info(config);
    }
  } catch (const uploader::SetupError& e) {
    AIS_LOG_ERROR("Setup failed" << kv("command", command) << " - " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

// ============================================================================
// Commands
// ============================================================================

int Commands::upload(const CliConfig& config, const CommandOptions& options) {
  const auto& settings = config.uploader;
  if (config.base_path.empty()) {
    std::cerr << "Error: --base-path is required" << std::endl;
    return 1;
  }
  if (settings.bucket.empty()) {
    std::cerr << "Error: --bucket is required" << std::endl;
    return 1;
  }

  uploader::ArchiveScanner scanner(config.base_path, settings.archive_extension);

  auto store = store_factory_(settings.s3);
  auto connection = store->testConnection();
  if (!connection.success) {
    std::cerr << "Error: Object store connection failed: " << connection.error_message
              << std::endl;
    return 1;
  }
  auto bucket = store->headBucket(settings.bucket);
  if (!bucket.success) {
    std::cerr << "Error: Bucket '" << settings.bucket << "' is not accessible: "
              << bucket.error_message << std::endl;
    return 1;
  }

  auto files = scanner.scan();
  uploader::ProgressLedger ledger(settings.ledger_path);
  ConsoleProgress progress(std::cout);
  uploader::UploadCoordinator coordinator(ledger, *store, settings.coordinatorConfig(), &progress);

  std::optional<size_t> max_files = options.resume ? std::nullopt : options.max_files;
  if (options.resume) {
    std::cout << "Resuming upload from previous session..." << std::endl;
  } else {
    std::cout << "Starting upload..." << std::endl;
  }

  logging::set_run_id(make_run_id());
  AIS_LOG_INFO(
    "Upload run started" << kv("base_path", config.base_path) << kv("bucket", settings.bucket)
                         << kv("candidates", files.size())
  );

  active_coordinator_.store(&coordinator);
  if (stop_requested_.load()) {
    coordinator.requestStop();
  }
  auto result = coordinator.runUpload(files, max_files);
  active_coordinator_.store(nullptr);
  logging::clear_run_id();

  std::cout << std::endl << "Upload Results" << std::endl;
  print_rule();
  std::cout << "  Total Files:            " << result.total_files << std::endl;
  std::cout << "  Successfully Uploaded:  " << result.uploaded << std::endl;
  std::cout << "  Failed:                 " << result.failed << std::endl;
  std::cout << "  Skipped:                " << result.skipped << std::endl;
  std::cout << "  Deferred:               " << result.deferred << std::endl;
  std::cout << "  Bytes Uploaded:         " << format_size(result.bytes_uploaded) << std::endl;

  if (!result.failures.empty()) {
    std::cout << std::endl << "Failures:" << std::endl;
    for (size_t i = 0; i < result.failures.size() && i < kMaxPrintedErrors; ++i) {
      const auto& failure = result.failures[i];
      std::cout << "  - " << failure.local_path << " ["
                << uploader::failureKindToString(failure.kind) << "] " << failure.message
                << std::endl;
    }
    if (result.failures.size() > kMaxPrintedErrors) {
      std::cout << "  ... and " << result.failures.size() - kMaxPrintedErrors << " more"
                << std::endl;
    }
  }

  if (result.ledger_errors > 0) {
    std::cout << "Warning: " << result.ledger_errors
              << " uploads could not be recorded in " << ledger.path() << std::endl;
  }
  if (result.stopped) {
    std::cout << "Upload stopped; run again to continue." << std::endl;
  } else if (result.failed > 0) {
    std::cout << "Some files failed to upload. Check logs for details." << std::endl;
  } else if (result.uploaded > 0) {
    std::cout << "Upload completed successfully!" << std::endl;
  }

  // Per-file failures are reported above; only setup errors are fatal
  return 0;
}

int Commands::scan(const CliConfig& config, const CommandOptions& options) {
  if (config.base_path.empty()) {
    std::cerr << "Error: --base-path is required" << std::endl;
    return 1;
  }

  std::cout << "Scanning archive directory: " << config.base_path << std::endl;
  uploader::ArchiveScanner scanner(config.base_path, config.uploader.archive_extension);
  auto files = scanner.scan();

  if (!uploader::ArchiveScanner::saveFileList(files, options.output)) {
    std::cerr << "Error: Failed to write file list to " << options.output << std::endl;
    return 1;
  }

  uploader::ProgressLedger ledger(config.uploader.ledger_path);
  size_t pending = 0;
  for (const auto& file : files) {
    if (!ledger.isUploaded(file)) {
      ++pending;
    }
  }

  std::cout << std::endl << "Scan Summary" << std::endl;
  print_rule(30);
  std::cout << std::left << std::setw(8) << "Year" << std::setw(8) << "Month" << "Files"
            << std::endl;
  for (const auto& [year, months] : uploader::ArchiveScanner::groupByPeriod(files)) {
    for (const auto& [month, entries] : months) {
      std::cout << std::left << std::setw(8) << year << std::setw(8) << month << entries.size()
                << std::endl;
    }
  }
  std::cout << std::endl;
  std::cout << "Total files found: " << files.size() << std::endl;
  std::cout << "Files ready for upload: " << pending << std::endl;
  std::cout << "File list saved to: " << options.output << std::endl;
  return 0;
}

int Commands::status(const CliConfig& config) {
  uploader::ProgressLedger ledger(config.uploader.ledger_path);
  if (ledger.loadStatus() == uploader::LedgerLoadStatus::CORRUPT) {
    std::cout << "Warning: ledger " << ledger.path() << " is unreadable" << std::endl;
  }

  std::cout << "Upload Status (" << ledger.path() << ")" << std::endl;
  print_rule();
  std::cout << std::left << std::setw(8) << "Year" << std::setw(8) << "Month" << std::setw(16)
            << "Files Uploaded" << "Total Size" << std::endl;

  uint64_t total_size = 0;
  for (const auto& [year, months] : ledger.snapshot()) {
    for (const auto& [month, records] : months) {
      uint64_t month_size = 0;
      for (const auto& record : records) {
        month_size += record.size;
      }
      total_size += month_size;
      std::cout << std::left << std::setw(8) << year << std::setw(8) << month << std::setw(16)
                << records.size() << format_size(month_size) << std::endl;
    }
  }

  std::cout << std::endl;
  std::cout << "Total files uploaded: " << ledger.size() << std::endl;
  std::cout << "Total size uploaded: " << format_size(total_size) << std::endl;
  return 0;
}

int Commands::validate(const CliConfig& config) {
  const auto& settings = config.uploader;
  if (settings.bucket.empty()) {
    std::cerr << "Error: --bucket is required" << std::endl;
    return 1;
  }

  std::cout << "Validating uploaded files..." << std::endl;
  uploader::ProgressLedger ledger(settings.ledger_path);
  auto store = store_factory_(settings.s3);
  uploader::UploadCoordinator coordinator(ledger, *store, settings.coordinatorConfig());
  auto report = coordinator.validateUploaded();

  std::cout << std::endl << "Validation Results" << std::endl;
  print_rule();
  std::cout << "  Total Files:  " << report.total << std::endl;
  std::cout << "  Valid:        " << report.valid << std::endl;
  std::cout << "  Invalid:      " << report.invalid << std::endl;
  std::cout << "  Missing:      " << report.missing << std::endl;

  if (!report.errors.empty()) {
    std::cout << std::endl << "Validation Errors:" << std::endl;
    for (size_t i = 0; i < report.errors.size() && i < kMaxPrintedErrors; ++i) {
      std::cout << "  - " << report.errors[i] << std::endl;
    }
    if (report.errors.size() > kMaxPrintedErrors) {
      std::cout << "  ... and " << report.errors.size() - kMaxPrintedErrors << " more errors"
                << std::endl;
    }
  }

  return 0;
}

int Commands::info(const CliConfig& config) {
  if (config.base_path.empty()) {
    std::cerr << "Error: --base-path is required" << std::endl;
    return 1;
  }

  uploader::ArchiveScanner scanner(config.base_path, config.uploader.archive_extension);
  auto files = scanner.scan();
  uploader::ProgressLedger ledger(config.uploader.ledger_path);

  std::map<std::string, std::map<std::string, size_t>> uploaded_by_period;
  size_t pending = 0;
  for (const auto& file : files) {
    if (ledger.isUploaded(file)) {
      ++uploaded_by_period[file.year][file.month];
    } else {
      ++pending;
    }
  }

  std::cout << "Archive Information" << std::endl;
  print_rule();
  std::cout << "  Base Path:         " << fs::absolute(config.base_path).string() << std::endl;
  std::cout << "  S3 Bucket:         "
            << (config.uploader.bucket.empty() ? "(not set)" : config.uploader.bucket)
            << std::endl;
  std::cout << "  Files Discovered:  " << files.size() << std::endl;
  std::cout << "  Files Uploaded:    " << ledger.size() << std::endl;
  std::cout << "  Files Pending:     " << pending << std::endl;

  if (!files.empty()) {
    std::cout << std::endl << "Files by Year/Month" << std::endl;
    std::cout << std::left << std::setw(8) << "Year" << std::setw(8) << "Month" << std::setw(8)
              << "Total" << std::setw(10) << "Uploaded" << "Pending" << std::endl;
    for (const auto& [year, months] : uploader::ArchiveScanner::groupByPeriod(files)) {
      for (const auto& [month, entries] : months) {
        size_t uploaded = uploaded_by_period[year][month];
        std::cout << std::left << std::setw(8) << year << std::setw(8) << month << std::setw(8)
                  << entries.size() << std::setw(10) << uploaded << entries.size() - uploaded
                  << std::endl;
      }
    }
  }
  return 0;
}

void Commands::print_usage() {
  std::cout << "Usage: ais_uploader <command> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  upload    Upload pending archives to the bucket" << std::endl;
  std::cout << "  scan      Scan the archive directory and write a file list" << std::endl;
  std::cout << "  status    Show uploaded files from the progress ledger" << std::endl;
  std::cout << "  validate  Check ledger records against the bucket" << std::endl;
  std::cout << "  info      Show discovered, uploaded and pending files" << std::endl;
  std::cout << "  help      Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --base-path, -p PATH       Archive root (YEAR/MONTH/*.rar)" << std::endl;
  std::cout << "  --bucket, -b NAME          Destination bucket" << std::endl;
  std::cout << "  --region, -r REGION        Bucket region" << std::endl;
  std::cout << "  --endpoint URL             S3-compatible endpoint (MinIO, Ceph)" << std::endl;
  std::cout << "  --access-key KEY           Access key ID" << std::endl;
  std::cout << "  --secret-key KEY           Secret access key" << std::endl;
  std::cout << "  --ledger FILE              Progress ledger (default: ais_upload_progress.json)"
            << std::endl;
  std::cout << "  --max-files N              Upload at most N pending files" << std::endl;
  std::cout << "  --resume                   Upload every pending file, ignoring --max-files"
            << std::endl;
  std::cout << "  --part-size-mb N           Multipart part size (default: 100)" << std::endl;
  std::cout << "  --max-concurrent-parts N   Parts in flight per file (default: 10)"
            << std::endl;
  std::cout << "  --extension EXT            Archive extension (default: .rar)" << std::endl;
  std::cout << "  --output, -o FILE          Scan output (default: ais_files.json)" << std::endl;
  std::cout << "  --config, -c FILE          YAML configuration file" << std::endl;
}

}  // namespace cli
}  // namespace ais
