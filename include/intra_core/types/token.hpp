#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace intra_core {

// Response of POST /oauth/token
struct TokenInfo {
  std::string access_token;
  std::string token_type;
  int64_t expires_in = 0;
  std::string scope;
  int64_t created_at = 0;
};

void from_json(const nlohmann::json &j, TokenInfo &token);

/**
 * @brief Decodes the token endpoint response.
 * @throws DeserializationError when the body is not JSON or has no access_token.
 */
TokenInfo parse_token_info(const std::string &body);

}  // namespace intra_core
