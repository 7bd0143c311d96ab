#ifndef MANIFEST_HPP
#define MANIFEST_HPP

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

inline constexpr const char *MANIFEST_FILE_NAME = "flashless.manifest.json";

struct CachePolicy {
  int max_age_seconds = 0;
  bool etag = true;
  bool gzip = false;
};

struct UiSettings {
  std::string base_path = "/";
  fs::path asset_root;
  std::string entry_file = "index.html";
  std::vector<std::string> routes;
  bool spa_fallback = true;
  CachePolicy cache_policy;
};

enum class ApiMode { Mock, Proxy };

struct ApiMapping {
  std::string method;
  std::string path;
  std::string fixture;
  int status = 200;
  std::vector<std::pair<std::string, std::string>> headers;
};

struct ApiSettings {
  ApiMode mode = ApiMode::Mock;
  fs::path fixtures_dir;
  std::vector<ApiMapping> mappings;
};

struct ValidationSettings {
  std::vector<std::string> required_files;
  bool disallow_extra_routes = false;
};

// Loaded once and only read afterwards.
struct Manifest {
  fs::path source_path;
  std::string version;
  UiSettings ui;
  ApiSettings api;
  ValidationSettings validation;
};

std::string to_string(ApiMode mode);

// Finds the manifest for a project. An override wins and is resolved against
// project_dir when relative; otherwise the well-known locations are tried.
fs::path discover_manifest(const fs::path &project_dir,
                           const std::optional<std::string> &override_path);

// Parses and validates a manifest. Every shape violation throws a
// FlashlessError naming the offending field.
Manifest load_manifest(const fs::path &manifest_path, const fs::path &project_dir,
                       const std::optional<std::string> &fixtures_override =
                           std::nullopt,
                       bool allow_absolute_paths = false);

void validate_manifest_paths(const Manifest &manifest);

std::string normalize_route(const std::string &route);
std::string normalize_base_path(const std::string &value);

// Exact match, or prefix match for patterns ending in "/*".
bool route_matches(const std::string &pattern, const std::string &route);

nlohmann::json manifest_template();
void write_manifest_template(const fs::path &output, bool force);

#endif
