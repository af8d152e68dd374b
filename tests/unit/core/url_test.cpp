#include <gtest/gtest.h>

#include <string>

#include "intra_core/errors.hpp"
#include "intra_core/http/url.hpp"

namespace intra_core {

TEST(BuildUrlTest, AppendsParametersInOrder) {
  std::string url = build_url("https://api.intra.42.fr/v2/users/4242", {{"client_id", "abc123"}});
  EXPECT_EQ(url, "https://api.intra.42.fr/v2/users/4242?client_id=abc123");
}

TEST(BuildUrlTest, EncodesFilterBracketsAndValues) {
  std::string url = build_url("https://api.intra.42.fr/v2/users",
                              {{"client_id", "abc"}, {"filter[login]", "j doe&x"}});

  EXPECT_EQ(url.rfind("https://api.intra.42.fr/v2/users?client_id=abc&", 0), 0u);
  EXPECT_NE(url.find("login%5D="), std::string::npos);
  EXPECT_EQ(url.find(' '), std::string::npos);
  EXPECT_NE(url.find("%26x"), std::string::npos);
}

TEST(BuildUrlTest, NoParametersKeepsBase) {
  EXPECT_EQ(build_url("https://api.intra.42.fr/v2/users", {}), "https://api.intra.42.fr/v2/users");
}

TEST(BuildUrlTest, RejectsRelativeBase) {
  EXPECT_THROW(build_url("not a url", {{"a", "b"}}), UrlConstructionError);
}

TEST(BuildUrlTest, RejectsEmptyParameterName) {
  EXPECT_THROW(build_url("https://api.intra.42.fr/v2/users", {{"", "b"}}), UrlConstructionError);
}

}  // namespace intra_core
