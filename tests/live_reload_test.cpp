#include "server/live_reload.hpp"
#include <gtest/gtest.h>

TEST(LiveReloadTest, ScriptOpensEventSourceOnReloadPath) {
  std::string script = live_reload_script("/app/__flashless/reload");

  EXPECT_EQ(script.find("<script>"), 1u);
  EXPECT_NE(script.find("new EventSource('/app/__flashless/reload')"),
            std::string::npos);
  EXPECT_NE(script.find("window.location.reload()"), std::string::npos);
  EXPECT_EQ(script.find("{{"), std::string::npos);
}

TEST(LiveReloadTest, ScriptKeepsDollarSigns) {
  std::string script = live_reload_script("/a$1b/__flashless/reload");
  EXPECT_NE(script.find("'/a$1b/__flashless/reload'"), std::string::npos);
}

TEST(LiveReloadTest, InjectAppendsScript) {
  std::string html = "<html><body>index</body></html>";
  std::string injected = inject_live_reload(html, LIVE_RELOAD_ENDPOINT);

  EXPECT_EQ(injected.rfind(html, 0), 0u);
  EXPECT_EQ(injected.substr(html.size()),
            live_reload_script(LIVE_RELOAD_ENDPOINT));
}

TEST(LiveReloadTest, EventFrames) {
  EXPECT_EQ(sse_data_frame(0), "data: 0\n\n");
  EXPECT_EQ(sse_data_frame(42), "data: 42\n\n");
  EXPECT_EQ(sse_keepalive_frame(), ": keepalive\n\n");
}
