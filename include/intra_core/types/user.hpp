#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace intra_core {

// One element of GET /v2/users?filter[login]=...
struct UserSummary {
  int64_t id = 0;
  std::string login;
};

struct Title {
  int64_t id = 0;
  std::string name;
};

struct Cursus {
  int64_t id = 0;
  std::string name;
  std::string slug;
};

struct CursusUser {
  Cursus cursus;
  std::optional<std::string> grade;
  double level = 0.0;
  std::optional<std::string> begin_at;
  std::optional<std::string> blackholed_at;
};

// GET /v2/users/{id}
struct UserProfile {
  int64_t id = 0;
  std::string displayname;
  std::string login;
  std::string email;
  int64_t wallet = 0;
  int64_t correction_point = 0;
  std::vector<Title> titles;
  std::vector<CursusUser> cursus_users;
};

void from_json(const nlohmann::json &j, UserSummary &summary);
void from_json(const nlohmann::json &j, Title &title);
void from_json(const nlohmann::json &j, Cursus &cursus);
void from_json(const nlohmann::json &j, CursusUser &cursus_user);
void from_json(const nlohmann::json &j, UserProfile &profile);

/**
 * @brief Decodes a raw response body of the users collection.
 * @throws DeserializationError on malformed JSON or a schema mismatch.
 */
std::vector<UserSummary> parse_user_summaries(const std::string &body);

/**
 * @brief Decodes a raw response body of a single user.
 * @throws DeserializationError on malformed JSON or a schema mismatch.
 */
UserProfile parse_user_profile(const std::string &body);

}  // namespace intra_core
