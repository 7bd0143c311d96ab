#ifndef REPORT_HPP
#define REPORT_HPP

#include "manifest.hpp"
#include "parity.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

nlohmann::json build_report(const Manifest &manifest,
                            const ValidationResult &validation,
                            const std::string &host, unsigned short port,
                            const std::string &mode);

// Writes <build_dir>/flashless/report.json and returns its path.
fs::path write_report(const fs::path &build_dir, const Manifest &manifest,
                      const ValidationResult &validation,
                      const std::string &host, unsigned short port,
                      const std::string &mode);

#endif
