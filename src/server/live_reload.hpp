#ifndef LIVE_RELOAD_HPP
#define LIVE_RELOAD_HPP

#include <chrono>
#include <cstdint>
#include <string>

inline constexpr const char *LIVE_RELOAD_ENDPOINT = "/__flashless/reload";
inline constexpr std::chrono::seconds LIVE_RELOAD_KEEPALIVE{15};

// Inline script that reloads the page once the stream reports a newer
// version than the first one it saw.
std::string live_reload_script(const std::string &reload_path);

std::string inject_live_reload(const std::string &html,
                               const std::string &reload_path);

std::string sse_data_frame(uint64_t version);
std::string sse_keepalive_frame();

#endif
