#include "intra_core/types/token.hpp"

#include "intra_core/errors.hpp"

namespace intra_core {

void from_json(const nlohmann::json &j, TokenInfo &token) {
  j.at("access_token").get_to(token.access_token);
  token.token_type = j.value("token_type", std::string("bearer"));
  token.expires_in = j.value("expires_in", int64_t{0});
  token.scope = j.value("scope", std::string());
  token.created_at = j.value("created_at", int64_t{0});
}

TokenInfo parse_token_info(const std::string &body) {
  try {
    return nlohmann::json::parse(body).get<TokenInfo>();
  } catch (const nlohmann::json::exception &e) {
    throw DeserializationError("Failed to decode token response: " + std::string(e.what()));
  }
}

}  // namespace intra_core
