#include "parity.hpp"
#include "utils/paths.hpp"
#include <set>

namespace {

std::vector<std::string> sorted_unique(const std::set<std::string> &items) {
  return std::vector<std::string>(items.begin(), items.end());
}

} // namespace

std::optional<std::string> route_to_asset_candidate(const std::string &route) {
  if (route.empty() || route == "/") {
    return std::nullopt;
  }

  std::string value = route;
  value.erase(0, value.find_first_not_of('/'));
  if (value.empty()) {
    return std::nullopt;
  }

  size_t slash = value.rfind('/');
  std::string last =
      slash == std::string::npos ? value : value.substr(slash + 1);
  if (last.find('.') != std::string::npos) {
    return value;
  }
  return std::nullopt;
}

ValidationResult validate_parity(const Manifest &manifest) {
  std::set<std::string> missing_required;
  for (const auto &rel : manifest.validation.required_files) {
    if (!fs::exists(safe_join(manifest.ui.asset_root, rel))) {
      missing_required.insert(rel);
    }
  }

  std::set<std::string> missing_fixtures;
  for (const auto &mapping : manifest.api.mappings) {
    if (!fs::exists(safe_join(manifest.api.fixtures_dir, mapping.fixture))) {
      missing_fixtures.insert(mapping.fixture);
    }
  }

  bool entry_exists =
      fs::exists(safe_join(manifest.ui.asset_root, manifest.ui.entry_file));

  std::set<std::string> unresolved;
  for (const auto &route : manifest.ui.routes) {
    if (ends_with(route, "/*")) {
      continue;
    }

    auto candidate = route_to_asset_candidate(route);
    if (candidate && fs::exists(safe_join(manifest.ui.asset_root, *candidate))) {
      continue;
    }
    if (manifest.ui.spa_fallback && entry_exists) {
      continue;
    }
    unresolved.insert(route);
  }

  ValidationResult result;
  result.missing_required_files = sorted_unique(missing_required);
  result.missing_fixture_files = sorted_unique(missing_fixtures);
  result.unresolved_routes = sorted_unique(unresolved);
  return result;
}
