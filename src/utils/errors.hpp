#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Configuration or validation failure with a message fit for the user.
class FlashlessError : public std::runtime_error {
public:
  explicit FlashlessError(const std::string &message)
      : std::runtime_error(message) {}
};

// A path derived from a request or manifest tried to leave its root.
class PathEscapeError : public FlashlessError {
public:
  explicit PathEscapeError(const std::string &message)
      : FlashlessError(message) {}
};

#endif
