#include <gtest/gtest.h>

#include "intra_core/errors.hpp"
#include "intra_core/types/token.hpp"
#include "intra_core/types/user.hpp"
#include "utilities_test.hpp"

namespace intra_tests {

using namespace intra_core;

TEST(UserModelsTest, ParseUserProfile_DecodesAllFields) {
  UserProfile profile = parse_user_profile(TestUtilities::create_profile_json().dump());

  EXPECT_EQ(profile.id, 4242);
  EXPECT_EQ(profile.displayname, "Jane Doe");
  EXPECT_EQ(profile.login, "jdoe");
  EXPECT_EQ(profile.email, "jdoe@student.42.fr");
  EXPECT_EQ(profile.wallet, 500);
  EXPECT_EQ(profile.correction_point, 7);
  ASSERT_EQ(profile.titles.size(), 1u);
  EXPECT_EQ(profile.titles[0].name, "Archmage %login");
  ASSERT_EQ(profile.cursus_users.size(), 2u);
  EXPECT_EQ(profile.cursus_users[1].cursus.name, "42cursus");
  EXPECT_EQ(profile.cursus_users[1].cursus.id, 21);
  EXPECT_EQ(profile.cursus_users[1].grade, std::optional<std::string>("Member"));
  EXPECT_EQ(profile.cursus_users[1].blackholed_at,
            std::optional<std::string>("2099-01-01T00:00:00.000Z"));
  EXPECT_DOUBLE_EQ(profile.cursus_users[1].level, 7.42);
}

TEST(UserModelsTest, ParseUserProfile_NullGradeAndBlackholeBecomeEmpty) {
  UserProfile profile = parse_user_profile(TestUtilities::create_profile_json().dump());

  EXPECT_FALSE(profile.cursus_users[0].grade.has_value());
  EXPECT_FALSE(profile.cursus_users[0].blackholed_at.has_value());
}

TEST(UserModelsTest, ParseUserProfile_MissingWalletIsSchemaMismatch) {
  nlohmann::json body = TestUtilities::create_profile_json();
  body.erase("wallet");
  EXPECT_THROW(parse_user_profile(body.dump()), DeserializationError);
}

TEST(UserModelsTest, ParseUserProfile_WrongTypeIsSchemaMismatch) {
  nlohmann::json body = TestUtilities::create_profile_json();
  body["wallet"] = "lots";
  EXPECT_THROW(parse_user_profile(body.dump()), DeserializationError);
}

TEST(UserModelsTest, ParseUserProfile_RejectsNonObject) {
  EXPECT_THROW(parse_user_profile("[]"), DeserializationError);
  EXPECT_THROW(parse_user_profile("{not json"), DeserializationError);
}

TEST(UserModelsTest, ParseUserSummaries_DecodesArray) {
  nlohmann::json body = nlohmann::json::array({TestUtilities::create_user_summary_json(7, "abc")});
  std::vector<UserSummary> users = parse_user_summaries(body.dump());

  ASSERT_EQ(users.size(), 1u);
  EXPECT_EQ(users[0].id, 7);
  EXPECT_EQ(users[0].login, "abc");
}

TEST(UserModelsTest, ParseUserSummaries_RejectsObject) {
  EXPECT_THROW(parse_user_summaries(TestUtilities::create_user_summary_json().dump()),
               DeserializationError);
}

TEST(TokenInfoTest, ParseTokenInfo_DecodesResponse) {
  TokenInfo token = parse_token_info(
      R"({"access_token":"tok","token_type":"bearer","expires_in":7200,"scope":"public","created_at":1700000000})");

  EXPECT_EQ(token.access_token, "tok");
  EXPECT_EQ(token.token_type, "bearer");
  EXPECT_EQ(token.expires_in, 7200);
  EXPECT_EQ(token.scope, "public");
  EXPECT_EQ(token.created_at, 1700000000);
}

TEST(TokenInfoTest, ParseTokenInfo_RequiresAccessToken) {
  EXPECT_THROW(parse_token_info(R"({"error":"invalid_client"})"), DeserializationError);
}

}  // namespace intra_tests
