#include "intra_core/types/user.hpp"

#include "intra_core/errors.hpp"

namespace intra_core {

namespace {

// The API sends null for unset strings; map both null and absent to nullopt
std::optional<std::string> optional_string(const nlohmann::json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string string_or_empty(const nlohmann::json &j, const char *key) {
  return optional_string(j, key).value_or("");
}

}  // namespace

void from_json(const nlohmann::json &j, UserSummary &summary) {
  j.at("id").get_to(summary.id);
  summary.login = string_or_empty(j, "login");
}

void from_json(const nlohmann::json &j, Title &title) {
  title.id = j.value("id", int64_t{0});
  j.at("name").get_to(title.name);
}

void from_json(const nlohmann::json &j, Cursus &cursus) {
  cursus.id = j.value("id", int64_t{0});
  j.at("name").get_to(cursus.name);
  cursus.slug = string_or_empty(j, "slug");
}

void from_json(const nlohmann::json &j, CursusUser &cursus_user) {
  j.at("cursus").get_to(cursus_user.cursus);
  cursus_user.grade = optional_string(j, "grade");
  auto level = j.find("level");
  cursus_user.level = (level != j.end() && level->is_number()) ? level->get<double>() : 0.0;
  cursus_user.begin_at = optional_string(j, "begin_at");
  cursus_user.blackholed_at = optional_string(j, "blackholed_at");
}

void from_json(const nlohmann::json &j, UserProfile &profile) {
  j.at("id").get_to(profile.id);
  j.at("displayname").get_to(profile.displayname);
  j.at("login").get_to(profile.login);
  profile.email = string_or_empty(j, "email");
  j.at("wallet").get_to(profile.wallet);
  j.at("correction_point").get_to(profile.correction_point);

  profile.titles.clear();
  if (j.contains("titles") && !j.at("titles").is_null()) {
    j.at("titles").get_to(profile.titles);
  }
  profile.cursus_users.clear();
  if (j.contains("cursus_users") && !j.at("cursus_users").is_null()) {
    j.at("cursus_users").get_to(profile.cursus_users);
  }
}

std::vector<UserSummary> parse_user_summaries(const std::string &body) {
  try {
    nlohmann::json json_response = nlohmann::json::parse(body);
    if (!json_response.is_array()) {
      throw DeserializationError("Expected a JSON array of users");
    }
    return json_response.get<std::vector<UserSummary>>();
  } catch (const nlohmann::json::exception &e) {
    throw DeserializationError("Failed to decode user list: " + std::string(e.what()));
  }
}

UserProfile parse_user_profile(const std::string &body) {
  try {
    nlohmann::json json_response = nlohmann::json::parse(body);
    if (!json_response.is_object()) {
      throw DeserializationError("Expected a JSON object for the user profile");
    }
    return json_response.get<UserProfile>();
  } catch (const nlohmann::json::exception &e) {
    throw DeserializationError("Failed to decode user profile: " + std::string(e.what()));
  }
}

}  // namespace intra_core
