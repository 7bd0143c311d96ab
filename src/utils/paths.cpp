#include "paths.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

bool starts_with(const std::string &str, const std::string &prefix) {
  if (prefix.size() > str.size())
    return false;
  return str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &str, const std::string &suffix) {
  if (suffix.size() > str.size())
    return false;
  return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string &value) {
  auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
                return std::isspace(c);
              }).base();
  if (first >= last)
    return "";
  return std::string(first, last);
}

std::string normalize_posix_path(const std::string &path) {
  if (path.empty())
    return ".";

  bool absolute = path.front() == '/';
  std::vector<std::string> parts;

  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos)
      next = path.size();

    std::string segment = path.substr(pos, next - pos);
    pos = next + 1;

    if (segment.empty() || segment == ".")
      continue;

    if (segment == "..") {
      if (!parts.empty() && parts.back() != "..") {
        parts.pop_back();
      } else if (!absolute) {
        parts.push_back(segment);
      }
      continue;
    }

    parts.push_back(segment);
  }

  std::string result = absolute ? "/" : "";
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += "/";
    result += parts[i];
  }

  if (result.empty())
    return ".";
  return result;
}

static fs::path resolve(const fs::path &path) {
  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec) {
    return fs::absolute(path).lexically_normal();
  }
  return resolved;
}

static bool is_within(const fs::path &root, const fs::path &candidate) {
  fs::path rel = candidate.lexically_relative(root);
  if (rel.empty())
    return false;
  return *rel.begin() != "..";
}

fs::path safe_join(const fs::path &root, const std::string &relative) {
  std::string rel = trim(relative);
  std::replace(rel.begin(), rel.end(), '\\', '/');
  rel = normalize_posix_path(rel);
  rel.erase(0, rel.find_first_not_of('/'));

  fs::path root_resolved = resolve(root);
  fs::path candidate = resolve(root_resolved / rel);

  if (candidate == root_resolved || is_within(root_resolved, candidate)) {
    return candidate;
  }

  throw PathEscapeError("Path escapes root directory: " + relative);
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string percent_decode(const std::string &value) {
  std::string decoded;
  decoded.reserve(value.size());

  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int high = hex_value(value[i + 1]);
      int low = hex_value(value[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded.push_back(static_cast<char>(high * 16 + low));
        i += 2;
        continue;
      }
    }
    decoded.push_back(value[i]);
  }

  return decoded;
}

std::string normalize_http_path(const std::string &target) {
  std::string path = target;

  size_t cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path = path.substr(0, cut);
  }

  // Rooting first keeps ".." from climbing above "/".
  std::string decoded = percent_decode(path);
  if (!starts_with(decoded, "/")) {
    decoded = "/" + decoded;
  }
  return normalize_posix_path(decoded);
}

std::string join_base_path(const std::string &base_path,
                           const std::string &route_path) {
  std::string base = base_path;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }

  std::string route =
      starts_with(route_path, "/") ? route_path : "/" + route_path;
  return base + route;
}

std::string relative_to_base(const std::string &request_path,
                             const std::string &base_path) {
  if (base_path == "/")
    return request_path;
  if (request_path == base_path)
    return "/";

  std::string rest = request_path.substr(base_path.size() + 1);
  rest.erase(0, rest.find_first_not_of('/'));
  return "/" + rest;
}
