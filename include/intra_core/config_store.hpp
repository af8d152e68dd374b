#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace intra_core {

inline constexpr size_t kMaxClientFieldLength = 256;
inline constexpr const char *kConfigFileName = "config.toml";
inline constexpr const char *kRedirectUrl = "http://localhost:8080";
inline constexpr const char *kRegisterApplicationUrl =
    "https://profile.intra.42.fr/oauth/applications/new";

// Contents of config.toml
struct Credentials {
  std::string client_id;
  std::string client_secret;
  std::string login;
  // Cursus name, slug or id used by the cursus and blackhole renderers
  std::optional<std::string> cursus;
};

/**
 * @brief Parses `key="value"` lines into Credentials.
 *
 * Values are TOML basic ("...", with \\ \" \b \t \n \f \r \uXXXX \UXXXXXXXX
 * escapes) or literal ('...') strings, optionally followed by a `#` comment.
 * Blank lines and comment lines are skipped, unknown keys are ignored.
 * @throws ConfigurationInvalid on a malformed line or a missing required key.
 */
Credentials parse_credentials(std::string_view text);

// Non-empty and at most kMaxClientFieldLength characters for client_id and client_secret
bool check_client(const Credentials &credentials);

/**
 * @brief Owns the location of the per-user configuration file.
 */
class ConfigStore {
 public:
  // $XDG_CONFIG_HOME, falling back to $HOME/.config
  ConfigStore();
  explicit ConfigStore(std::filesystem::path config_dir);
  virtual ~ConfigStore() = default;

  // Empty when no config directory could be resolved
  const std::optional<std::filesystem::path> &config_path() const {
    return config_path_;
  }

  virtual bool exists() const;

  /**
   * @brief First-run setup: prints registration instructions to `out` and reads
   *        client id, client secret and login from `in`, one line each.
   *
   * The file is written only after all three answers are read, and is made
   * readable by the owner only.
   *
   * @throws FileSystemError if the directory cannot be resolved or created, or
   *         the file cannot be written.
   * @throws ConfigurationInvalid if `in` ends before the three answers are read.
   */
  virtual void create_interactive(std::istream &in, std::ostream &out) const;

  /**
   * @brief Reads and checks the file. Every failure is reported on std::cerr
   *        and yields false.
   */
  virtual bool validate() const;

  /**
   * @throws ConfigurationMissing if the file does not exist.
   * @throws FileSystemError if it cannot be read.
   * @throws ConfigurationInvalid if it cannot be parsed.
   */
  virtual Credentials load() const;

  static std::optional<std::filesystem::path> default_config_dir();

 private:
  std::optional<std::filesystem::path> config_path_;

  std::string read_file() const;
};

}  // namespace intra_core
