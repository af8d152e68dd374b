#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "intra_core/config_store.hpp"
#include "intra_core/errors.hpp"
#include "utilities_test.hpp"

namespace intra_tests {

using namespace intra_core;

class ConfigStoreTest : public TempConfigDirTestBase {
 protected:
  void write_config(const std::string& client_id, const std::string& client_secret,
                    const std::string& login = "jdoe") {
    TestUtilities::write_file(config_file(), "client_id=\"" + client_id + "\"\nclient_secret=\"" +
                                                 client_secret + "\"\nlogin=\"" + login + "\"\n");
  }
};

TEST_F(ConfigStoreTest, Exists_FalseWhenFileIsMissing) {
  ConfigStore store(config_dir_);
  EXPECT_FALSE(store.exists());
}

TEST_F(ConfigStoreTest, Exists_FalseWhenDirectoryIsMissing) {
  ConfigStore store(config_dir_ / "does" / "not" / "exist");
  EXPECT_FALSE(store.exists());
}

TEST_F(ConfigStoreTest, Exists_TrueOnceFileIsWritten) {
  write_config("abc", "secret");
  ConfigStore store(config_dir_);
  EXPECT_TRUE(store.exists());
  ASSERT_TRUE(store.config_path().has_value());
  EXPECT_EQ(*store.config_path(), config_file());
}

TEST_F(ConfigStoreTest, CreateInteractive_WritesAnswersAndReadsBack) {
  ConfigStore store(config_dir_);
  std::istringstream in("abc\nsecret\njdoe\n");
  std::ostringstream out;

  store.create_interactive(in, out);

  EXPECT_EQ(TestUtilities::read_file(config_file()),
            "client_id=\"abc\"\nclient_secret=\"secret\"\nlogin=\"jdoe\"\n");

  Credentials credentials = store.load();
  EXPECT_EQ(credentials.client_id, "abc");
  EXPECT_EQ(credentials.client_secret, "secret");
  EXPECT_EQ(credentials.login, "jdoe");
  EXPECT_FALSE(credentials.cursus.has_value());
  EXPECT_TRUE(store.validate());
}

TEST_F(ConfigStoreTest, CreateInteractive_PrintsRegistrationInstructionsAndPrompts) {
  ConfigStore store(config_dir_);
  std::istringstream in("abc\nsecret\njdoe\n");
  std::ostringstream out;

  store.create_interactive(in, out);

  const std::string text = out.str();
  EXPECT_NE(text.find("https://profile.intra.42.fr/oauth/applications/new"), std::string::npos);
  EXPECT_NE(text.find("http://localhost:8080"), std::string::npos);
  EXPECT_NE(text.find("Enter client id: "), std::string::npos);
  EXPECT_NE(text.find("Enter client secret: "), std::string::npos);
  EXPECT_NE(text.find("Enter intra login: "), std::string::npos);
}

TEST_F(ConfigStoreTest, CreateInteractive_TrimsWhitespaceAndCarriageReturns) {
  ConfigStore store(config_dir_);
  std::istringstream in("  abc \r\n\tsecret\r\njdoe  \n");
  std::ostringstream out;

  store.create_interactive(in, out);

  Credentials credentials = store.load();
  EXPECT_EQ(credentials.client_id, "abc");
  EXPECT_EQ(credentials.client_secret, "secret");
  EXPECT_EQ(credentials.login, "jdoe");
}

TEST_F(ConfigStoreTest, CreateInteractive_CreatesMissingDirectory) {
  ConfigStore store(config_dir_ / "nested");
  std::istringstream in("abc\nsecret\njdoe\n");
  std::ostringstream out;

  store.create_interactive(in, out);

  EXPECT_TRUE(store.exists());
}

TEST_F(ConfigStoreTest, CreateInteractive_ThrowsWhenInputEndsEarly) {
  ConfigStore store(config_dir_);
  std::istringstream in("abc\n");
  std::ostringstream out;

  EXPECT_THROW(store.create_interactive(in, out), ConfigurationInvalid);
  EXPECT_FALSE(store.exists());
  EXPECT_FALSE(std::filesystem::exists(config_file()));
}

TEST_F(ConfigStoreTest, CreateInteractive_EarlyEndKeepsFirstRunAvailable) {
  ConfigStore store(config_dir_);
  std::istringstream truncated("abc\nsecret\n");
  std::ostringstream out;
  EXPECT_THROW(store.create_interactive(truncated, out), ConfigurationInvalid);
  ASSERT_FALSE(store.exists());

  std::istringstream complete("abc\nsecret\njdoe\n");
  store.create_interactive(complete, out);
  EXPECT_TRUE(store.validate());
}

TEST_F(ConfigStoreTest, CreateInteractive_RestrictsFileToOwner) {
  ConfigStore store(config_dir_);
  std::istringstream in("abc\nsecret\njdoe\n");
  std::ostringstream out;

  store.create_interactive(in, out);

  using std::filesystem::perms;
  perms mode = std::filesystem::status(config_file()).permissions();
  EXPECT_EQ(mode & (perms::group_all | perms::others_all), perms::none);
  EXPECT_EQ(mode & (perms::owner_read | perms::owner_write),
            perms::owner_read | perms::owner_write);
}

TEST_F(ConfigStoreTest, CreateInteractive_EscapesQuotesInAnswers) {
  ConfigStore store(config_dir_);
  std::istringstream in("a\"b\nse\\cret\njdoe\n");
  std::ostringstream out;

  store.create_interactive(in, out);

  Credentials credentials = store.load();
  EXPECT_EQ(credentials.client_id, "a\"b");
  EXPECT_EQ(credentials.client_secret, "se\\cret");
}

TEST_F(ConfigStoreTest, Validate_TrueForWellFormedCredentials) {
  write_config("abc", "secret");
  EXPECT_TRUE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_AcceptsFieldsOfExactlyMaxLength) {
  write_config(std::string(256, 'i'), std::string(256, 's'));
  EXPECT_TRUE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseForEmptyClientId) {
  write_config("", "secret");
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseForEmptyClientSecret) {
  write_config("abc", "");
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseForOverlongClientId) {
  write_config(std::string(257, 'i'), "secret");
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseForOverlongClientSecret) {
  write_config("abc", std::string(257, 's'));
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseWhenFileIsMissing) {
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseWhenFileIsMalformed) {
  TestUtilities::write_file(config_file(), "client_id abc\n");
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Validate_FalseWhenLoginIsMissing) {
  TestUtilities::write_file(config_file(), "client_id=\"abc\"\nclient_secret=\"secret\"\n");
  EXPECT_FALSE(ConfigStore(config_dir_).validate());
}

TEST_F(ConfigStoreTest, Load_ThrowsConfigurationMissingWithoutFile) {
  EXPECT_THROW(ConfigStore(config_dir_).load(), ConfigurationMissing);
}

TEST(ParseCredentialsTest, AcceptsCommentsSpacingSingleQuotesAndCursus) {
  Credentials credentials = parse_credentials(
      "# intra42\n"
      "\n"
      "client_id = \"abc\"\n"
      "client_secret='secret'\n"
      "login=\"jdoe\"\n"
      "cursus=\"42cursus\"\n"
      "unused=\"ignored\"\n");

  EXPECT_EQ(credentials.client_id, "abc");
  EXPECT_EQ(credentials.client_secret, "secret");
  EXPECT_EQ(credentials.login, "jdoe");
  ASSERT_TRUE(credentials.cursus.has_value());
  EXPECT_EQ(*credentials.cursus, "42cursus");
}

TEST(ParseCredentialsTest, AcceptsTrailingComments) {
  Credentials credentials = parse_credentials(
      "client_id=\"abc\"   # app uid\n"
      "client_secret='s#cret' #secret\n"
      "login=\"jdoe\"#me\n");

  EXPECT_EQ(credentials.client_id, "abc");
  EXPECT_EQ(credentials.client_secret, "s#cret");
  EXPECT_EQ(credentials.login, "jdoe");
}

TEST(ParseCredentialsTest, DecodesBasicStringEscapes) {
  Credentials credentials = parse_credentials(
      "client_id=\"a\\tb\\nc\"\n"
      "client_secret=\"caf\\u00e9\\U0001F600\"\n"
      "login=\"q\\\"\\\\\"\n");

  EXPECT_EQ(credentials.client_id, "a\tb\nc");
  EXPECT_EQ(credentials.client_secret, "caf\xC3\xA9\xF0\x9F\x98\x80");
  EXPECT_EQ(credentials.login, "q\"\\");
}

TEST(ParseCredentialsTest, LiteralStringsKeepBackslashes) {
  Credentials credentials =
      parse_credentials("client_id='a\\tb'\nclient_secret=\"s\"\nlogin=\"l\"\n");
  EXPECT_EQ(credentials.client_id, "a\\tb");
}

TEST(ParseCredentialsTest, RejectsTextAfterValue) {
  EXPECT_THROW(parse_credentials("client_id=\"abc\" junk\nclient_secret=\"s\"\nlogin=\"l\"\n"),
               ConfigurationInvalid);
}

TEST(ParseCredentialsTest, RejectsUnknownEscapeAndBadUnicode) {
  EXPECT_THROW(parse_credentials("client_id=\"a\\qb\"\nclient_secret=\"s\"\nlogin=\"l\"\n"),
               ConfigurationInvalid);
  EXPECT_THROW(parse_credentials("client_id=\"\\uD800\"\nclient_secret=\"s\"\nlogin=\"l\"\n"),
               ConfigurationInvalid);
  EXPECT_THROW(parse_credentials("client_id=\"\\u12\"\nclient_secret=\"s\"\nlogin=\"l\"\n"),
               ConfigurationInvalid);
}

TEST(ParseCredentialsTest, RejectsUnterminatedString) {
  EXPECT_THROW(parse_credentials("client_id=\"abc\nclient_secret=\"s\"\nlogin=\"l\"\n"),
               ConfigurationInvalid);
}

TEST(ParseCredentialsTest, RejectsUnquotedValue) {
  EXPECT_THROW(parse_credentials("client_id=abc\nclient_secret=\"s\"\nlogin=\"l\"\n"),
               ConfigurationInvalid);
}

TEST(ParseCredentialsTest, RejectsMissingClientSecret) {
  EXPECT_THROW(parse_credentials("client_id=\"abc\"\nlogin=\"l\"\n"), ConfigurationInvalid);
}

TEST(CheckClientTest, EnforcesLengthBounds) {
  Credentials credentials{"abc", "secret", "jdoe", std::nullopt};
  EXPECT_TRUE(check_client(credentials));

  credentials.client_id = std::string(kMaxClientFieldLength + 1, 'x');
  EXPECT_FALSE(check_client(credentials));

  credentials.client_id = "abc";
  credentials.client_secret.clear();
  EXPECT_FALSE(check_client(credentials));
}

}  // namespace intra_tests
