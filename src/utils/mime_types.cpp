#include "mime_types.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

std::string get_mime_type(const std::filesystem::path &path) {
  static const std::unordered_map<std::string, std::string> types = {
      {".html", "text/html"},
      {".htm", "text/html"},
      {".css", "text/css"},
      {".js", "application/javascript"},
      {".mjs", "application/javascript"},
      {".json", "application/json"},
      {".map", "application/json"},
      {".webmanifest", "application/manifest+json"},
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".gif", "image/gif"},
      {".webp", "image/webp"},
      {".svg", "image/svg+xml"},
      {".ico", "image/x-icon"},
      {".woff", "font/woff"},
      {".woff2", "font/woff2"},
      {".ttf", "font/ttf"},
      {".otf", "font/otf"},
      {".wasm", "application/wasm"},
      {".pdf", "application/pdf"},
      {".xml", "application/xml"},
      {".txt", "text/plain"},
      {".csv", "text/csv"},
      {".gz", "application/gzip"},
  };

  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto it = types.find(ext);
  if (it != types.end()) {
    return it->second;
  }
  return "application/octet-stream";
}

bool is_html_type(const std::string &content_type) {
  return content_type.rfind("text/html", 0) == 0;
}
