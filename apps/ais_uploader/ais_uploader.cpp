// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// AIS Uploader - resumable upload of YEAR/MONTH archive trees to S3

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

#include "commands.hpp"

namespace {

std::atomic<ais::cli::Commands*> g_commands{nullptr};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (auto* commands = g_commands.load()) {
      commands->request_stop();
    }
  }
}

}  // namespace

/**
 * Main entry point for ais_uploader
 */
int main(int argc, char* argv[]) {
  ais::cli::Commands commands;
  g_commands.store(&commands);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  int exit_code = 1;
  try {
    exit_code = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    exit_code = 1;
  }

  g_commands.store(nullptr);
  return exit_code;
}
