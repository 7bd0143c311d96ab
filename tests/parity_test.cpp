#include "core/parity.hpp"
#include "test_support.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>

using json = nlohmann::json;
using test_support::TempProject;

namespace {

class ParityTest : public ::testing::Test {
protected:
  void SetUp() override {
    project.write("web/dist/index.html", "<html>index</html>");
    project.write("web/dist/assets/app.js", "console.log('ok')");
    project.write("web/dist/logo.png", "png");
    project.write("ui-fixtures/health.json", "{\"ok\": true}");
  }

  json manifest_json() const {
    return {{"version", "1"},
            {"ui",
             {{"assetRoot", "web/dist"},
              {"routes", {"/", "/settings", "/wifi/*"}},
              {"spaFallback", true}}},
            {"api",
             {{"fixturesDir", "ui-fixtures"},
              {"map",
               {{{"method", "GET"},
                 {"path", "/api/health"},
                 {"fixture", "health.json"}}}}}},
            {"validation",
             {{"requiredFiles", {"index.html", "assets/app.js"}}}}};
  }

  TempProject project;
};

} // namespace

TEST_F(ParityTest, CleanProjectHasNoErrors) {
  ValidationResult result = validate_parity(project.load(manifest_json()));

  EXPECT_FALSE(result.has_errors());
  EXPECT_TRUE(result.missing_required_files.empty());
  EXPECT_TRUE(result.missing_fixture_files.empty());
  EXPECT_TRUE(result.unresolved_routes.empty());
}

TEST_F(ParityTest, ReportsMissingRequiredFilesSorted) {
  json raw = manifest_json();
  raw["validation"]["requiredFiles"] = {"z.css", "index.html", "a.css",
                                        "z.css"};

  ValidationResult result = validate_parity(project.load(raw));

  EXPECT_TRUE(result.has_errors());
  EXPECT_EQ(result.missing_required_files,
            (std::vector<std::string>{"a.css", "z.css"}));
}

TEST_F(ParityTest, ReportsMissingFixturesOnce) {
  json raw = manifest_json();
  raw["api"]["map"] = {
      {{"method", "GET"}, {"path", "/api/a"}, {"fixture", "gone.json"}},
      {{"method", "POST"}, {"path", "/api/a"}, {"fixture", "gone.json"}},
      {{"method", "GET"}, {"path", "/api/health"}, {"fixture", "health.json"}},
      {{"method", "GET"}, {"path", "/api/b"}, {"fixture", "also-gone.json"}}};

  ValidationResult result = validate_parity(project.load(raw));

  EXPECT_EQ(result.missing_fixture_files,
            (std::vector<std::string>{"also-gone.json", "gone.json"}));
  EXPECT_TRUE(result.missing_required_files.empty());
}

TEST_F(ParityTest, MissingFixturesDirectoryIsNotFatal) {
  json raw = manifest_json();
  raw["api"]["fixturesDir"] = "nowhere";

  ValidationResult result = validate_parity(project.load(raw));
  EXPECT_EQ(result.missing_fixture_files,
            std::vector<std::string>{"health.json"});
}

TEST_F(ParityTest, RoutesNeedAssetOrSpaFallback) {
  json raw = manifest_json();
  raw["ui"]["spaFallback"] = false;
  raw["ui"]["routes"] = {"/", "/settings", "/logo.png", "/missing.png",
                         "/wifi/*"};

  ValidationResult result = validate_parity(project.load(raw));

  EXPECT_EQ(result.unresolved_routes,
            (std::vector<std::string>{"/", "/missing.png", "/settings"}));
}

TEST_F(ParityTest, SpaFallbackNeedsEntryFile) {
  fs::remove(project.root() / "web" / "dist" / "index.html");

  ValidationResult result = validate_parity(project.load(manifest_json()));

  EXPECT_EQ(result.missing_required_files,
            std::vector<std::string>{"index.html"});
  EXPECT_EQ(result.unresolved_routes,
            (std::vector<std::string>{"/", "/settings"}));
}

TEST_F(ParityTest, EscapingRequiredFileIsAHardError) {
  json raw = manifest_json();
  raw["validation"]["requiredFiles"] = {"../../flashless.manifest.json"};

  Manifest manifest = project.load(raw);
  EXPECT_THROW(validate_parity(manifest), PathEscapeError);
}

TEST(RouteToAssetCandidateTest, OnlyFileLikeRoutes) {
  EXPECT_EQ(route_to_asset_candidate("/"), std::nullopt);
  EXPECT_EQ(route_to_asset_candidate("/settings"), std::nullopt);
  EXPECT_EQ(route_to_asset_candidate("/v1.2/settings"), std::nullopt);
  EXPECT_EQ(route_to_asset_candidate("/logo.png"), "logo.png");
  EXPECT_EQ(route_to_asset_candidate("/assets/app.js"), "assets/app.js");
}
