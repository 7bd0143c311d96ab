#ifndef REQUEST_ROUTER_HPP
#define REQUEST_ROUTER_HPP

#include "core/manifest.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class RouteKind { ReloadStream, Fixture, StaticFile, NotFound };

struct RouteDecision {
  RouteKind kind = RouteKind::NotFound;
  // Normalised request path, echoed in 404 bodies.
  std::string path;
  // Resolved file for StaticFile and Fixture.
  fs::path file;
  const ApiMapping *mapping = nullptr;
};

// Built once per server from the manifest and shared read-only by all
// connection workers.
class RequestRouter {
public:
  RequestRouter(Manifest manifest, bool live_reload);

  RequestRouter(const RequestRouter &) = delete;
  RequestRouter &operator=(const RequestRouter &) = delete;

  // Dispatch order: reload stream, API mapping, base path guard, static
  // asset, declared route or SPA fallback, not found.
  RouteDecision route(const std::string &method,
                      const std::string &request_path) const;

  // File that serves rel_route directly, if any.
  std::optional<fs::path>
  resolve_static_candidate(const std::string &rel_route) const;

  bool is_declared_route(const std::string &rel_route) const;

  const Manifest &manifest() const { return manifest_; }
  const std::string &reload_path() const { return reload_path_; }
  bool live_reload() const { return live_reload_; }

private:
  std::optional<fs::path> existing_file(const fs::path &root,
                                        const std::string &relative) const;

  Manifest manifest_;
  bool live_reload_;
  std::string reload_path_;
  std::map<std::pair<std::string, std::string>, const ApiMapping *> api_map_;
};

#endif
