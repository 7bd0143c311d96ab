#ifndef COMMAND_HPP
#define COMMAND_HPP

#include "manifest.hpp"
#include "parity.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct RunOptions {
  std::optional<std::string> manifest;
  std::string host = "127.0.0.1";
  unsigned short port = 8787;
  RequestLogLevel request_log = RequestLogLevel::Errors;
  std::string mode = "mock";
  std::optional<std::string> fixtures;
  bool strict = false;
  bool allow_absolute_paths = false;
  bool live_reload = true;
  std::chrono::milliseconds live_reload_interval{1000};
};

struct PreparedRun {
  Manifest manifest;
  ValidationResult validation;
  fs::path build_dir;
  std::string mode;
};

// Loads and checks everything a run needs before a socket is opened.
PreparedRun prepare_run(const fs::path &project_dir, const fs::path &build_dir,
                        const RunOptions &options);

std::string format_validation_failure(const ValidationResult &validation);

// Wildcard bind addresses are shown as loopback.
std::string to_url(const std::string &host, unsigned short port,
                   const std::string &base_path);

// Serves the project until SIGINT or SIGTERM. Returns the exit code.
int run_flashless(const fs::path &project_dir, const fs::path &build_dir,
                  const RunOptions &options);

#endif
