#include "core/command.hpp"
#include "core/manifest.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "flashless - Local preview for embedded web UIs\n\n";
  std::cout << "Commands:\n";
  std::cout << "  flashless run --project-dir DIR     Serve the UI with mocked "
               "API fixtures\n";
  std::cout << "  flashless init-manifest             Write a manifest "
               "template\n";
  std::cout << "  flashless --help                    Show this help\n\n";
  std::cout << "run options:\n";
  std::cout << "  --build-dir DIR              Report location (default: "
               "build)\n";
  std::cout << "  --manifest PATH              Manifest to load\n";
  std::cout << "  --bind-port PORT             Port to bind (default: 8787, 0 "
               "picks one)\n";
  std::cout << "  --host HOST                  Host to bind (default: "
               "127.0.0.1)\n";
  std::cout << "  --request-log LEVEL          all, errors or none (default: "
               "errors)\n";
  std::cout << "  --mode MODE                  mock (default)\n";
  std::cout << "  --fixtures DIR               Override api.fixturesDir\n";
  std::cout << "  --strict                     Fail on validation problems\n";
  std::cout << "  --allow-absolute-paths       Accept absolute manifest "
               "paths\n";
  std::cout << "  --no-live-reload             Disable live reload\n";
  std::cout << "  --live-reload-interval SECS  Watcher poll interval "
               "(default: 1)\n\n";
  std::cout << "init-manifest options:\n";
  std::cout << "  --output PATH                Output file (default: "
               "flashless.manifest.json)\n";
  std::cout << "  --force                      Overwrite an existing file\n";
}

static std::string next_value(const std::vector<std::string> &args,
                              size_t &index) {
  const std::string &flag = args[index];
  if (index + 1 >= args.size()) {
    throw FlashlessError("Missing value for " + flag);
  }
  return args[++index];
}

static unsigned short parse_port(const std::string &value) {
  size_t consumed = 0;
  int port = -1;
  try {
    port = std::stoi(value, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (consumed != value.size() || port < 0 || port > 65535) {
    throw FlashlessError("Invalid port: " + value);
  }
  return static_cast<unsigned short>(port);
}

static std::chrono::milliseconds parse_interval(const std::string &value) {
  size_t consumed = 0;
  double seconds = 0;
  try {
    seconds = std::stod(value, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (consumed != value.size() || !(seconds > 0)) {
    throw FlashlessError("Invalid live reload interval: " + value);
  }
  auto interval = std::chrono::milliseconds(
      static_cast<long long>(seconds * 1000.0 + 0.5));
  return interval.count() > 0 ? interval : std::chrono::milliseconds(1);
}

static int run_command(const std::vector<std::string> &args) {
  std::optional<fs::path> project_dir;
  fs::path build_dir = "build";
  RunOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--project-dir") {
      project_dir = next_value(args, i);
    } else if (arg == "--build-dir") {
      build_dir = next_value(args, i);
    } else if (arg == "--manifest") {
      options.manifest = next_value(args, i);
    } else if (arg == "--bind-port") {
      options.port = parse_port(next_value(args, i));
    } else if (arg == "--host") {
      options.host = next_value(args, i);
    } else if (arg == "--request-log") {
      options.request_log = parse_request_log_level(next_value(args, i));
    } else if (arg == "--mode") {
      options.mode = next_value(args, i);
    } else if (arg == "--fixtures") {
      options.fixtures = next_value(args, i);
    } else if (arg == "--strict") {
      options.strict = true;
    } else if (arg == "--allow-absolute-paths") {
      options.allow_absolute_paths = true;
    } else if (arg == "--no-live-reload") {
      options.live_reload = false;
    } else if (arg == "--live-reload-interval") {
      options.live_reload_interval = parse_interval(next_value(args, i));
    } else {
      throw FlashlessError("Unknown option for run: " + arg);
    }
  }

  if (!project_dir) {
    throw FlashlessError("run requires --project-dir");
  }
  return run_flashless(*project_dir, build_dir, options);
}

static int init_manifest_command(const std::vector<std::string> &args) {
  fs::path output = MANIFEST_FILE_NAME;
  bool force = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "--output") {
      output = next_value(args, i);
    } else if (arg == "--force") {
      force = true;
    } else {
      throw FlashlessError("Unknown option for init-manifest: " + arg);
    }
  }

  write_manifest_template(output, force);
  log_success("Wrote manifest template: " + output.string());
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  try {
    if (command == "run") {
      return run_command(args);
    } else if (command == "init-manifest") {
      return init_manifest_command(args);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }
  } catch (const FlashlessError &e) {
    std::cerr << "flashless error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
