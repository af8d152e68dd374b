#pragma once

#include <string>

#include "intra_core/http/session.hpp"
#include "intra_core/http/url.hpp"
#include "intra_core/types/user.hpp"

namespace intra_core {

// Everything a command may need about the configured user
struct ResolvedUser {
  UserSummary summary;
  UserProfile profile;
};

/**
 * @brief Looks up the session's login and loads the full profile.
 *
 * Both lookups go through Session::call; errors from the session, URL
 * construction and JSON decoding are propagated unchanged.
 */
class UserResolver {
 public:
  explicit UserResolver(Session &session, std::string api_base_url = kApiBaseUrl);
  virtual ~UserResolver() = default;

  // Login lookup followed by the id lookup
  virtual ResolvedUser resolve();

  // Throws UserNotFound when the filtered list is empty
  UserSummary find_by_login();
  UserProfile fetch_profile(int64_t id);

 private:
  Session &session_;
  std::string api_base_url_;
};

}  // namespace intra_core
