#include "intra_core/services/user_resolver.hpp"

#include "intra_core/errors.hpp"

namespace intra_core {

UserResolver::UserResolver(Session &session, std::string api_base_url)
    : session_(session), api_base_url_(std::move(api_base_url)) {}

ResolvedUser UserResolver::resolve() {
  ResolvedUser user;
  user.summary = find_by_login();
  user.profile = fetch_profile(user.summary.id);
  return user;
}

UserSummary UserResolver::find_by_login() {
  std::string url = build_url(api_base_url_ + "/v2/users",
                              {{"client_id", session_.get_client_id()},
                               {"filter[login]", session_.get_login()}});

  std::vector<UserSummary> users = parse_user_summaries(session_.call(url));
  if (users.empty()) {
    throw UserNotFound("No intra user with login '" + session_.get_login() + "'");
  }
  return users.front();
}

UserProfile UserResolver::fetch_profile(int64_t id) {
  std::string url = build_url(api_base_url_ + "/v2/users/" + std::to_string(id),
                              {{"client_id", session_.get_client_id()}});
  return parse_user_profile(session_.call(url));
}

}  // namespace intra_core
