#include "command.hpp"
#include "report.hpp"
#include "server/preview_server.hpp"
#include "utils/errors.hpp"
#include "utils/paths.hpp"
#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cctype>
#include <csignal>
#include <iostream>
#include <termcolor/termcolor.hpp>
#include <utility>

namespace {

std::string lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string quoted_list(const std::vector<std::string> &items) {
  std::string out = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "'" + items[i] + "'";
  }
  return out + "]";
}

std::string joined(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += ", ";
    }
    out += item;
  }
  return out;
}

void print_validation_warnings(const ValidationResult &validation) {
  log_warning("Validation problems detected. Use --strict to fail fast.");
  if (!validation.missing_required_files.empty()) {
    std::cout << termcolor::bright_yellow << "    " << termcolor::reset
              << "missing required files: "
              << joined(validation.missing_required_files) << "\n";
  }
  if (!validation.missing_fixture_files.empty()) {
    std::cout << termcolor::bright_yellow << "    " << termcolor::reset
              << "missing fixtures: "
              << joined(validation.missing_fixture_files) << "\n";
  }
  if (!validation.unresolved_routes.empty()) {
    std::cout << termcolor::bright_yellow << "    " << termcolor::reset
              << "unresolved routes: " << joined(validation.unresolved_routes)
              << "\n";
  }
}

void wait_for_shutdown_signal() {
  boost::asio::io_context ioc;
  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&ioc](const boost::system::error_code &, int) {
    ioc.stop();
  });
  ioc.run();
}

} // namespace

std::string format_validation_failure(const ValidationResult &validation) {
  return "Strict validation failed: missingRequiredFiles=" +
         quoted_list(validation.missing_required_files) +
         " missingFixtures=" + quoted_list(validation.missing_fixture_files) +
         " unresolvedRoutes=" + quoted_list(validation.unresolved_routes);
}

PreparedRun prepare_run(const fs::path &project_dir, const fs::path &build_dir,
                        const RunOptions &options) {
  PreparedRun run;
  run.mode = lowercase(options.mode);
  if (run.mode != "mock") {
    throw FlashlessError("Only '--mode mock' is supported in v1.");
  }

  fs::path project = fs::absolute(project_dir).lexically_normal();
  run.build_dir = build_dir.is_absolute() ? build_dir : project / build_dir;

  fs::path manifest_path = discover_manifest(project, options.manifest);
  run.manifest = load_manifest(manifest_path, project, options.fixtures,
                               options.allow_absolute_paths);

  if (run.manifest.api.mode == ApiMode::Proxy) {
    throw FlashlessError(
        "Manifest api.mode 'proxy' is not supported; use 'mock' fixtures.");
  }

  run.validation = validate_parity(run.manifest);
  if (options.strict && run.validation.has_errors()) {
    throw FlashlessError(format_validation_failure(run.validation));
  }
  return run;
}

std::string to_url(const std::string &host, unsigned short port,
                   const std::string &base_path) {
  std::string printable_host = host;
  if (host == "0.0.0.0" || host == "::") {
    printable_host = "127.0.0.1";
  } else if (host.find(':') != std::string::npos) {
    printable_host = "[" + host + "]";
  }

  std::string base = starts_with(base_path, "/") ? base_path : "/" + base_path;
  return "http://" + printable_host + ":" + std::to_string(port) + base;
}

int run_flashless(const fs::path &project_dir, const fs::path &build_dir,
                  const RunOptions &options) {
  PreparedRun run = prepare_run(project_dir, build_dir, options);
  std::string base_path = run.manifest.ui.base_path;
  fs::path manifest_path = run.manifest.source_path;

  PreviewServer server(std::move(run.manifest), options.host, options.port,
                       options.request_log, options.live_reload,
                       options.live_reload_interval);

  fs::path report_path =
      write_report(run.build_dir, server.router().manifest(), run.validation,
                   server.host(), server.port(), run.mode);

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║           flashless preview               ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  log_info("Manifest: " + manifest_path.string());
  log_info("Report:   " + report_path.string());
  if (run.validation.has_errors()) {
    print_validation_warnings(run.validation);
  }

  server.start();

  log_success("Preview running at " +
              to_url(server.host(), server.port(), base_path));
  if (options.live_reload) {
    log_info("Live reload enabled");
  }
  std::cout << termcolor::bright_blue << "Press Ctrl+C to stop."
            << termcolor::reset << "\n\n";

  wait_for_shutdown_signal();

  std::cout << "\n"
            << termcolor::bright_yellow << "⏳ Shutting down..."
            << termcolor::reset << "\n";
  server.stop();
  log_success("Stopped.");
  return 0;
}
