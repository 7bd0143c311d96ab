#include "report.hpp"
#include "utils/errors.hpp"
#include <fstream>
#include <system_error>

using json = nlohmann::json;

json build_report(const Manifest &manifest, const ValidationResult &validation,
                  const std::string &host, unsigned short port,
                  const std::string &mode) {
  std::error_code ec;
  auto manifest_size = fs::file_size(manifest.source_path, ec);

  json data;
  data["manifest"] = {
      {"path", manifest.source_path.string()},
      {"version", manifest.version},
      {"sizeBytes", ec ? json(nullptr) : json(manifest_size)},
  };
  data["server"] = {
      {"host", host},
      {"port", port},
      {"mode", mode},
      {"basePath", manifest.ui.base_path},
      {"assetRoot", manifest.ui.asset_root.string()},
  };
  data["validation"] = {
      {"missingRequiredFiles", validation.missing_required_files},
      {"missingFixtures", validation.missing_fixture_files},
      {"unresolvedRoutes", validation.unresolved_routes},
      {"hasErrors", validation.has_errors()},
  };
  data["routes"] = manifest.ui.routes;
  data["api"] = {
      {"mode", to_string(manifest.api.mode)},
      {"fixturesDir", manifest.api.fixtures_dir.string()},
      {"mappingCount", manifest.api.mappings.size()},
  };
  return data;
}

fs::path write_report(const fs::path &build_dir, const Manifest &manifest,
                      const ValidationResult &validation,
                      const std::string &host, unsigned short port,
                      const std::string &mode) {
  fs::path report_dir = build_dir / "flashless";
  std::error_code ec;
  fs::create_directories(report_dir, ec);
  if (ec) {
    throw FlashlessError("Cannot create report directory " +
                         report_dir.string() + ": " + ec.message());
  }

  fs::path report_path = report_dir / "report.json";
  std::ofstream file(report_path);
  if (!file.is_open()) {
    throw FlashlessError("Cannot write file: " + report_path.string());
  }

  file << build_report(manifest, validation, host, port, mode).dump(2) << "\n";
  return report_path;
}
