#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <optional>
#include <string>

enum class RequestLogLevel { None, Errors, All };

// Accepts "none", "errors" or "all" in any case.
RequestLogLevel parse_request_log_level(const std::string &value);
std::string to_string(RequestLogLevel level);

// An unknown status counts as an error so that dropped responses are visible.
bool should_log_request(RequestLogLevel level, std::optional<unsigned> status);

std::string get_timestamp();

void log_request(const std::string &method, const std::string &path,
                 std::optional<unsigned> status);

void log_success(const std::string &message);
void log_info(const std::string &message);
void log_warning(const std::string &message);
void log_error(const std::string &message);

#endif
