#include "request_router.hpp"
#include "live_reload.hpp"
#include "utils/errors.hpp"
#include "utils/paths.hpp"
#include <algorithm>
#include <system_error>

RequestRouter::RequestRouter(Manifest manifest, bool live_reload)
    : manifest_(std::move(manifest)), live_reload_(live_reload),
      reload_path_(join_base_path(manifest_.ui.base_path, LIVE_RELOAD_ENDPOINT)) {
  // Later mappings win for a repeated (method, path).
  for (const auto &mapping : manifest_.api.mappings) {
    api_map_[{mapping.method, mapping.path}] = &mapping;
  }
}

std::optional<fs::path>
RequestRouter::existing_file(const fs::path &root,
                             const std::string &relative) const {
  try {
    fs::path candidate = safe_join(root, relative);
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
  } catch (const PathEscapeError &) {
    // Escapes surface to clients as a plain miss.
  }
  return std::nullopt;
}

std::optional<fs::path>
RequestRouter::resolve_static_candidate(const std::string &rel_route) const {
  const fs::path &asset_root = manifest_.ui.asset_root;

  if (rel_route.empty() || rel_route == "/") {
    return existing_file(asset_root, manifest_.ui.entry_file);
  }

  std::string normalized = rel_route;
  normalized.erase(0, normalized.find_first_not_of('/'));

  if (auto file = existing_file(asset_root, normalized)) {
    return file;
  }

  if (fs::path(normalized).extension().empty()) {
    return existing_file(asset_root, normalized + ".html");
  }
  return std::nullopt;
}

bool RequestRouter::is_declared_route(const std::string &rel_route) const {
  const auto &routes = manifest_.ui.routes;
  return std::any_of(routes.begin(), routes.end(),
                     [&](const std::string &pattern) {
                       return route_matches(pattern, rel_route);
                     });
}

RouteDecision RequestRouter::route(const std::string &method,
                                   const std::string &request_path) const {
  RouteDecision decision;
  decision.path = request_path;

  if (live_reload_ && method == "GET" && request_path == reload_path_) {
    decision.kind = RouteKind::ReloadStream;
    return decision;
  }

  auto mapped = api_map_.find({method, request_path});
  if (mapped != api_map_.end()) {
    const ApiMapping *mapping = mapped->second;
    try {
      decision.file = safe_join(manifest_.api.fixtures_dir, mapping->fixture);
    } catch (const PathEscapeError &) {
      return decision;
    }
    decision.kind = RouteKind::Fixture;
    decision.mapping = mapping;
    return decision;
  }

  const std::string &base_path = manifest_.ui.base_path;
  if (base_path != "/" && request_path != base_path &&
      !starts_with(request_path, base_path + "/")) {
    return decision;
  }

  std::string rel_route = relative_to_base(request_path, base_path);

  if (auto file = resolve_static_candidate(rel_route)) {
    decision.kind = RouteKind::StaticFile;
    decision.file = *file;
    return decision;
  }

  bool fallback_allowed = manifest_.ui.spa_fallback &&
                          !manifest_.validation.disallow_extra_routes;
  if (is_declared_route(rel_route) || fallback_allowed) {
    if (auto entry = existing_file(manifest_.ui.asset_root,
                                   manifest_.ui.entry_file)) {
      decision.kind = RouteKind::StaticFile;
      decision.file = *entry;
      return decision;
    }
  }

  return decision;
}
