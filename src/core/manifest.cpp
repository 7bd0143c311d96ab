#include "manifest.hpp"
#include "utils/errors.hpp"
#include "utils/paths.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>

using json = nlohmann::json;

namespace {

std::string field_error(const std::string &field, const std::string &what) {
  return "Manifest field '" + field + "' " + what + ".";
}

// Missing keys and explicit nulls are treated the same way.
const json *find_field(const json &object, const std::string &key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

json as_object(const json &raw, const std::string &key,
               const std::string &field, bool required) {
  const json *value = find_field(raw, key);
  if (!value) {
    if (required) {
      throw FlashlessError(field_error(field, "is required"));
    }
    return json::object();
  }
  if (!value->is_object()) {
    throw FlashlessError(field_error(field, "must be an object"));
  }
  return *value;
}

const json &as_array(const json &value, const std::string &field) {
  if (!value.is_array()) {
    throw FlashlessError(field_error(field, "must be an array"));
  }
  return value;
}

std::string as_string(const json &raw, const std::string &key,
                      const std::string &field,
                      const std::optional<std::string> &fallback = std::nullopt) {
  const json *value = find_field(raw, key);
  std::string text;

  if (!value) {
    if (!fallback) {
      throw FlashlessError(field_error(field, "must be a non-empty string"));
    }
    text = *fallback;
  } else if (value->is_string()) {
    text = value->get<std::string>();
  } else {
    throw FlashlessError(field_error(field, "must be a non-empty string"));
  }

  text = trim(text);
  if (text.empty()) {
    throw FlashlessError(field_error(field, "must be a non-empty string"));
  }
  return text;
}

bool as_bool(const json &raw, const std::string &key, const std::string &field,
             bool fallback) {
  const json *value = find_field(raw, key);
  if (!value) {
    return fallback;
  }
  if (!value->is_boolean()) {
    throw FlashlessError(field_error(field, "must be a boolean"));
  }
  return value->get<bool>();
}

int as_int(const json &raw, const std::string &key, const std::string &field,
           int fallback, int minimum, std::optional<int> maximum = std::nullopt) {
  const json *value = find_field(raw, key);
  if (!value) {
    return fallback;
  }
  if (!value->is_number_integer()) {
    throw FlashlessError(field_error(field, "must be an integer"));
  }

  // Non-negative literals are stored unsigned by the parser.
  std::int64_t number = 0;
  if (value->is_number_unsigned()) {
    auto raw_number = value->get<std::uint64_t>();
    if (raw_number > static_cast<std::uint64_t>(
                         std::numeric_limits<std::int64_t>::max())) {
      throw FlashlessError(field_error(field, "is out of range"));
    }
    number = static_cast<std::int64_t>(raw_number);
  } else {
    number = value->get<std::int64_t>();
  }

  if (number < minimum) {
    throw FlashlessError(
        field_error(field, "must be >= " + std::to_string(minimum)));
  }
  if (maximum && number > *maximum) {
    throw FlashlessError(
        field_error(field, "must be <= " + std::to_string(*maximum)));
  }
  if (number > std::numeric_limits<int>::max()) {
    throw FlashlessError(field_error(field, "is out of range"));
  }
  return static_cast<int>(number);
}

std::vector<std::string> as_string_list(const json &value,
                                        const std::string &field) {
  std::vector<std::string> items;
  const json &array = as_array(value, field);

  for (size_t i = 0; i < array.size(); ++i) {
    const json &item = array[i];
    std::string item_field = field + "[" + std::to_string(i) + "]";
    if (!item.is_string() || trim(item.get<std::string>()).empty()) {
      throw FlashlessError(field_error(item_field, "must be a non-empty string"));
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

fs::path resolve_project_path(const fs::path &project_dir,
                              const std::string &value,
                              const std::string &field,
                              bool allow_absolute_paths) {
  fs::path path(value);
  if (path.is_absolute()) {
    if (!allow_absolute_paths) {
      throw FlashlessError(
          "Manifest field '" + field + "' uses an absolute path (" + value +
          "). Use a path relative to the project directory, or pass "
          "'--allow-absolute-paths' to opt in.");
    }
  } else {
    path = project_dir / path;
  }

  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return resolved;
}

std::vector<std::pair<std::string, std::string>>
parse_headers(const json &mapping, const std::string &field) {
  std::vector<std::pair<std::string, std::string>> headers;

  const json *raw = find_field(mapping, "headers");
  if (!raw) {
    return headers;
  }
  if (!raw->is_object()) {
    throw FlashlessError(field_error(field, "must be an object"));
  }

  for (auto it = raw->begin(); it != raw->end(); ++it) {
    const json &value = it.value();
    if (value.is_string()) {
      headers.emplace_back(it.key(), value.get<std::string>());
    } else if (value.is_number() || value.is_boolean()) {
      headers.emplace_back(it.key(), value.dump());
    } else {
      throw FlashlessError(
          field_error(field + "." + it.key(), "must be a string"));
    }
  }
  return headers;
}

ApiMapping parse_mapping(const json &raw, size_t index) {
  std::string field = "api.map[" + std::to_string(index) + "]";
  if (!raw.is_object()) {
    throw FlashlessError(field_error(field, "must be an object"));
  }

  ApiMapping mapping;
  mapping.method = as_string(raw, "method", field + ".method");
  std::transform(mapping.method.begin(), mapping.method.end(),
                 mapping.method.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  mapping.path = normalize_route(as_string(raw, "path", field + ".path"));
  mapping.fixture = as_string(raw, "fixture", field + ".fixture");
  mapping.status = as_int(raw, "status", field + ".status", 200, 100, 999);
  mapping.headers = parse_headers(raw, field + ".headers");
  return mapping;
}

} // namespace

std::string to_string(ApiMode mode) {
  return mode == ApiMode::Proxy ? "proxy" : "mock";
}

fs::path discover_manifest(const fs::path &project_dir,
                           const std::optional<std::string> &override_path) {
  if (override_path) {
    fs::path manifest_path(*override_path);
    if (!manifest_path.is_absolute()) {
      manifest_path = project_dir / manifest_path;
    }
    return manifest_path;
  }

  const fs::path candidates[] = {
      project_dir / MANIFEST_FILE_NAME,
      project_dir / "web" / MANIFEST_FILE_NAME,
  };
  for (const auto &candidate : candidates) {
    if (fs::exists(candidate)) {
      return candidate;
    }
  }

  throw FlashlessError(
      "Missing flashless manifest. Create one at 'flashless.manifest.json' or "
      "'web/flashless.manifest.json', or run 'flashless init-manifest'.");
}

std::string normalize_route(const std::string &route) {
  std::string stripped = trim(route);
  if (stripped == "/") {
    return "/";
  }

  std::string cleaned = stripped;
  cleaned.erase(0, cleaned.find_first_not_of('/'));
  cleaned = "/" + cleaned;

  if (cleaned != "/" && ends_with(cleaned, "/") && !ends_with(cleaned, "/*")) {
    cleaned.pop_back();
  }
  return cleaned;
}

std::string normalize_base_path(const std::string &value) {
  std::string stripped = trim(value);
  if (stripped.empty()) {
    throw FlashlessError(field_error("ui.basePath", "must be a non-empty string"));
  }
  if (stripped == "/") {
    return "/";
  }

  size_t first = stripped.find_first_not_of('/');
  if (first == std::string::npos) {
    return "/";
  }
  size_t last = stripped.find_last_not_of('/');
  return "/" + stripped.substr(first, last - first + 1);
}

bool route_matches(const std::string &pattern, const std::string &route) {
  if (pattern == route) {
    return true;
  }
  if (ends_with(pattern, "/*")) {
    return starts_with(route, pattern.substr(0, pattern.size() - 1));
  }
  return false;
}

Manifest load_manifest(const fs::path &manifest_path, const fs::path &project_dir,
                       const std::optional<std::string> &fixtures_override,
                       bool allow_absolute_paths) {
  if (!fs::exists(manifest_path)) {
    throw FlashlessError("Manifest file not found: " + manifest_path.string());
  }

  std::ifstream file(manifest_path);
  if (!file.is_open()) {
    throw FlashlessError("Cannot open manifest: " + manifest_path.string());
  }

  json raw;
  try {
    raw = json::parse(file);
  } catch (const json::parse_error &e) {
    throw FlashlessError("Manifest is not valid JSON: " +
                         manifest_path.string() + ": " + e.what());
  }

  if (!raw.is_object()) {
    throw FlashlessError("Manifest root must be a JSON object.");
  }

  const json *version = find_field(raw, "version");
  if (!version || !version->is_string() || version->get<std::string>() != "1") {
    throw FlashlessError("Manifest field 'version' must be the string '1'.");
  }

  fs::path project = fs::absolute(project_dir);

  json ui_raw = as_object(raw, "ui", "ui", true);
  json api_raw = as_object(raw, "api", "api", false);
  json validation_raw = as_object(raw, "validation", "validation", false);

  Manifest manifest;
  manifest.source_path = manifest_path;
  manifest.version = "1";

  UiSettings &ui = manifest.ui;
  if (const json *base_path = find_field(ui_raw, "basePath")) {
    if (!base_path->is_string()) {
      throw FlashlessError(
          field_error("ui.basePath", "must be a non-empty string"));
    }
    ui.base_path = normalize_base_path(base_path->get<std::string>());
  }

  ui.asset_root = resolve_project_path(
      project, as_string(ui_raw, "assetRoot", "ui.assetRoot"), "ui.assetRoot",
      allow_absolute_paths);
  ui.entry_file =
      as_string(ui_raw, "entryFile", "ui.entryFile", std::string("index.html"));

  if (const json *routes = find_field(ui_raw, "routes")) {
    for (const auto &route : as_string_list(*routes, "ui.routes")) {
      ui.routes.push_back(normalize_route(route));
    }
  } else {
    ui.routes.push_back("/");
  }

  ui.spa_fallback = as_bool(ui_raw, "spaFallback", "ui.spaFallback", true);

  json cache_raw = as_object(ui_raw, "cachePolicy", "ui.cachePolicy", false);
  ui.cache_policy.max_age_seconds = as_int(
      cache_raw, "maxAgeSeconds", "ui.cachePolicy.maxAgeSeconds", 0, 0);
  ui.cache_policy.etag =
      as_bool(cache_raw, "etag", "ui.cachePolicy.etag", true);
  ui.cache_policy.gzip =
      as_bool(cache_raw, "gzip", "ui.cachePolicy.gzip", false);

  ApiSettings &api = manifest.api;
  api.fixtures_dir = project / "ui-fixtures";
  if (!api_raw.empty()) {
    std::string mode =
        as_string(api_raw, "mode", "api.mode", std::string("mock"));
    std::transform(mode.begin(), mode.end(), mode.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (mode == "mock") {
      api.mode = ApiMode::Mock;
    } else if (mode == "proxy") {
      api.mode = ApiMode::Proxy;
    } else {
      throw FlashlessError(
          field_error("api.mode", "must be either 'mock' or 'proxy'"));
    }

    api.fixtures_dir = resolve_project_path(
        project,
        as_string(api_raw, "fixturesDir", "api.fixturesDir",
                  std::string("ui-fixtures")),
        "api.fixturesDir", allow_absolute_paths);

    if (const json *map = find_field(api_raw, "map")) {
      const json &entries = as_array(*map, "api.map");
      for (size_t i = 0; i < entries.size(); ++i) {
        api.mappings.push_back(parse_mapping(entries[i], i));
      }
    }
  }

  // Overrides come from the caller, not the manifest, so absolute paths are
  // always accepted here.
  if (fixtures_override) {
    api.fixtures_dir =
        resolve_project_path(project, *fixtures_override, "fixtures", true);
  }

  ValidationSettings &validation = manifest.validation;
  validation.required_files = {ui.entry_file};
  if (!validation_raw.empty()) {
    if (const json *required = find_field(validation_raw, "requiredFiles")) {
      validation.required_files =
          as_string_list(*required, "validation.requiredFiles");
    }
    validation.disallow_extra_routes =
        as_bool(validation_raw, "disallowExtraRoutes",
                "validation.disallowExtraRoutes", false);
  }

  validate_manifest_paths(manifest);
  return manifest;
}

void validate_manifest_paths(const Manifest &manifest) {
  const fs::path &asset_root = manifest.ui.asset_root;
  if (!fs::exists(asset_root) || !fs::is_directory(asset_root)) {
    throw FlashlessError("Asset root does not exist or is not a directory: " +
                         asset_root.string() +
                         ". Run your frontend build or update ui.assetRoot "
                         "in the manifest.");
  }
}

json manifest_template() {
  return {
      {"version", "1"},
      {"ui",
       {{"basePath", "/"},
        {"assetRoot", "web/dist"},
        {"entryFile", "index.html"},
        {"routes", {"/"}},
        {"spaFallback", true},
        {"cachePolicy",
         {{"maxAgeSeconds", 0}, {"etag", true}, {"gzip", false}}}}},
      {"api",
       {{"mode", "mock"},
        {"fixturesDir", "ui-fixtures"},
        {"map", json::array({{{"method", "GET"},
                              {"path", "/api/health"},
                              {"fixture", "health.json"},
                              {"status", 200},
                              {"headers",
                               {{"Content-Type", "application/json"}}}}})}}},
      {"validation",
       {{"requiredFiles", {"index.html"}}, {"disallowExtraRoutes", false}}},
  };
}

void write_manifest_template(const fs::path &output, bool force) {
  if (fs::exists(output) && !force) {
    throw FlashlessError("File exists: " + output.string() +
                         ". Use '--force' to overwrite or choose another "
                         "'--output'.");
  }

  std::ofstream file(output);
  if (!file.is_open()) {
    throw FlashlessError("Cannot write file: " + output.string());
  }
  file << manifest_template().dump(2) << "\n";
}
