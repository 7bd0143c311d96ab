#ifndef PARITY_HPP
#define PARITY_HPP

#include "manifest.hpp"
#include <optional>
#include <string>
#include <vector>

// Each list is sorted and free of duplicates.
struct ValidationResult {
  std::vector<std::string> missing_required_files;
  std::vector<std::string> missing_fixture_files;
  std::vector<std::string> unresolved_routes;

  bool has_errors() const {
    return !missing_required_files.empty() || !missing_fixture_files.empty() ||
           !unresolved_routes.empty();
  }
};

// Cross-checks what the manifest promises against the files on disk.
ValidationResult validate_parity(const Manifest &manifest);

// Asset path a route names directly, when its last segment looks like a file.
std::optional<std::string> route_to_asset_candidate(const std::string &route);

#endif
