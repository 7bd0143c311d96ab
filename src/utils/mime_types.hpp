#ifndef MIME_TYPES_HPP
#define MIME_TYPES_HPP

#include <filesystem>
#include <string>

// Guesses a Content-Type from the file extension, case-insensitively.
// Unknown extensions map to application/octet-stream.
std::string get_mime_type(const std::filesystem::path &path);

bool is_html_type(const std::string &content_type);

#endif
