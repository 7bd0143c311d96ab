#include "logging.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <termcolor/termcolor.hpp>

namespace {

// Worker threads log concurrently; keep each line in one piece.
std::mutex &console_mutex() {
  static std::mutex mutex;
  return mutex;
}

} // namespace

RequestLogLevel parse_request_log_level(const std::string &value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "none")
    return RequestLogLevel::None;
  if (lowered == "errors")
    return RequestLogLevel::Errors;
  if (lowered == "all")
    return RequestLogLevel::All;

  throw FlashlessError("Request log level must be one of 'all', 'errors' or "
                       "'none' (got '" +
                       value + "').");
}

std::string to_string(RequestLogLevel level) {
  switch (level) {
  case RequestLogLevel::None:
    return "none";
  case RequestLogLevel::Errors:
    return "errors";
  case RequestLogLevel::All:
    return "all";
  }
  return "errors";
}

bool should_log_request(RequestLogLevel level, std::optional<unsigned> status) {
  switch (level) {
  case RequestLogLevel::None:
    return false;
  case RequestLogLevel::Errors:
    return !status || *status >= 400;
  case RequestLogLevel::All:
    return true;
  }
  return true;
}

std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

void log_request(const std::string &method, const std::string &path,
                 std::optional<unsigned> status) {
  std::lock_guard<std::mutex> lock(console_mutex());

  std::cout << termcolor::bright_blue << "[" << get_timestamp() << "]"
            << termcolor::reset << " ";

  if (method == "GET") {
    std::cout << termcolor::bright_cyan;
  } else if (method == "POST") {
    std::cout << termcolor::bright_yellow;
  } else if (method == "PUT" || method == "PATCH") {
    std::cout << termcolor::bright_magenta;
  } else if (method == "DELETE") {
    std::cout << termcolor::bright_red;
  }
  std::cout << method << termcolor::reset << " ";

  std::cout << termcolor::white << path << termcolor::reset << " ";

  if (!status) {
    std::cout << termcolor::bright_red << "-" << termcolor::reset;
  } else {
    unsigned code = *status;
    if (code >= 200 && code < 300) {
      std::cout << termcolor::bright_green;
    } else if (code >= 300 && code < 400) {
      std::cout << termcolor::bright_yellow;
    } else if (code >= 400 && code < 500) {
      std::cout << termcolor::bright_red;
    } else if (code >= 500) {
      std::cout << termcolor::red << termcolor::bold;
    }
    std::cout << code << termcolor::reset;
  }

  std::cout << std::endl;
}

void log_success(const std::string &message) {
  std::lock_guard<std::mutex> lock(console_mutex());
  std::cout << termcolor::bright_green << "✓ " << termcolor::reset << message
            << "\n";
}

void log_info(const std::string &message) {
  std::lock_guard<std::mutex> lock(console_mutex());
  std::cout << termcolor::bright_blue << "→ " << termcolor::reset << message
            << "\n";
}

void log_warning(const std::string &message) {
  std::lock_guard<std::mutex> lock(console_mutex());
  std::cout << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

void log_error(const std::string &message) {
  std::lock_guard<std::mutex> lock(console_mutex());
  std::cerr << termcolor::bright_red << "✗ Error: " << termcolor::reset
            << message << "\n";
}
