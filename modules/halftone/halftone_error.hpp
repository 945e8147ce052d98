#ifndef LABEL_HALFTONE_HALFTONE_ERROR_HPP
#define LABEL_HALFTONE_HALFTONE_ERROR_HPP

#include <stdexcept>
#include <string>

// Bad input or settings. Always thrown before any pixel is touched.
class ConfigurationError : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message)
      : std::runtime_error(message) {}
};

// Internal consistency check failed. Not recoverable.
class InvariantViolation : public std::logic_error {
  public:
    explicit InvariantViolation(const std::string& message)
      : std::logic_error(message) {}
};

#endif
