#pragma once

#include <stdexcept>
#include <string>

namespace intra_core {

/**
 * @brief Base class for every error raised by the intra42 core.
 */
class IntraError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Configuration file is absent where it is expected.
class ConfigurationMissing : public IntraError {
 public:
  using IntraError::IntraError;
};

// Configuration file exists but cannot be used.
class ConfigurationInvalid : public IntraError {
 public:
  using IntraError::IntraError;
};

class FileSystemError : public IntraError {
 public:
  using IntraError::IntraError;
};

/**
 * @brief Authentication or transport failure talking to the API.
 *
 * status_code() is the HTTP status when a response was received, 0 otherwise.
 */
class SessionError : public IntraError {
 public:
  explicit SessionError(const std::string &message, long status_code = 0)
      : IntraError(message), status_code_(status_code) {}

  long status_code() const noexcept {
    return status_code_;
  }

 private:
  long status_code_;
};

class UrlConstructionError : public IntraError {
 public:
  using IntraError::IntraError;
};

class DeserializationError : public IntraError {
 public:
  using IntraError::IntraError;
};

class TimestampParseError : public IntraError {
 public:
  using IntraError::IntraError;
};

class UserNotFound : public IntraError {
 public:
  using IntraError::IntraError;
};

class CursusNotFound : public IntraError {
 public:
  using IntraError::IntraError;
};

}  // namespace intra_core
