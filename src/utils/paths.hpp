#ifndef PATHS_HPP
#define PATHS_HPP

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Lexical POSIX normalisation: collapses duplicate slashes, "." and "..".
// An absolute path never rises above "/"; an empty result becomes ".".
std::string normalize_posix_path(const std::string &path);

// Joins a request- or manifest-relative path onto root and resolves it.
// Throws PathEscapeError if the result is not root or inside it.
fs::path safe_join(const fs::path &root, const std::string &relative);

// Decodes %XX escapes; malformed escapes are kept literally.
std::string percent_decode(const std::string &value);

// Turns a request target into a normalised absolute path without query.
std::string normalize_http_path(const std::string &target);

std::string join_base_path(const std::string &base_path,
                           const std::string &route_path);

// Assumes request_path is base_path itself or lies below it.
std::string relative_to_base(const std::string &request_path,
                             const std::string &base_path);

bool starts_with(const std::string &str, const std::string &prefix);
bool ends_with(const std::string &str, const std::string &suffix);
std::string trim(const std::string &value);

#endif
