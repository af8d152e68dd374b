#pragma once

#include <string>

namespace intra_core {

/**
 * @brief Authenticated access to the intra API.
 *
 * Implementations hold whatever token they need; callers only see raw bodies.
 */
class Session {
 public:
  virtual ~Session() = default;

  // GET `url` and return the response body. Throws SessionError.
  virtual std::string call(const std::string &url) = 0;

  virtual const std::string &get_client_id() const = 0;
  virtual const std::string &get_login() const = 0;
};

}  // namespace intra_core
