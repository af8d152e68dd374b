#include "intra_core/config_store.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include "intra_core/errors.hpp"

namespace intra_core {

namespace {

std::string trim(std::string_view text) {
  const char *ws = " \t\r\n";
  size_t begin = text.find_first_not_of(ws);
  if (begin == std::string_view::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(ws);
  return std::string(text.substr(begin, end - begin + 1));
}

std::string escape_value(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    if (c == '"' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

[[noreturn]] void fail_line(size_t line_no, const std::string &what) {
  throw ConfigurationInvalid("config line " + std::to_string(line_no) + ": " + what);
}

void append_utf8(std::string &out, uint32_t cp, size_t line_no) {
  if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
    fail_line(line_no, "invalid unicode escape");
  }
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

uint32_t read_hex(std::string_view raw, size_t &i, size_t digits, size_t line_no) {
  if (i + digits > raw.size()) {
    fail_line(line_no, "truncated unicode escape");
  }
  uint32_t cp = 0;
  for (size_t n = 0; n < digits; ++n) {
    char h = raw[i++];
    cp <<= 4;
    if (h >= '0' && h <= '9') {
      cp |= static_cast<uint32_t>(h - '0');
    } else if (h >= 'a' && h <= 'f') {
      cp |= static_cast<uint32_t>(h - 'a' + 10);
    } else if (h >= 'A' && h <= 'F') {
      cp |= static_cast<uint32_t>(h - 'A' + 10);
    } else {
      fail_line(line_no, "invalid hex digit in unicode escape");
    }
  }
  return cp;
}

// Parses a basic ("...") or literal ('...') string. Anything after the closing
// quote must be whitespace or a # comment.
std::string parse_value(std::string_view raw, size_t line_no) {
  if (raw.empty() || (raw.front() != '"' && raw.front() != '\'')) {
    fail_line(line_no, "value must be quoted");
  }
  const char quote = raw.front();
  std::string value;
  size_t i = 1;
  bool closed = false;
  while (i < raw.size()) {
    char c = raw[i++];
    if (c == quote) {
      closed = true;
      break;
    }
    if (quote == '"' && c == '\\') {
      if (i >= raw.size()) {
        fail_line(line_no, "dangling escape");
      }
      char e = raw[i++];
      switch (e) {
        case '"': value += '"'; break;
        case '\\': value += '\\'; break;
        case 'b': value += '\b'; break;
        case 't': value += '\t'; break;
        case 'n': value += '\n'; break;
        case 'f': value += '\f'; break;
        case 'r': value += '\r'; break;
        case 'u': append_utf8(value, read_hex(raw, i, 4, line_no), line_no); break;
        case 'U': append_utf8(value, read_hex(raw, i, 8, line_no), line_no); break;
        default:
          fail_line(line_no, "unsupported escape \\" + std::string(1, e));
      }
      continue;
    }
    value += c;
  }
  if (!closed) {
    fail_line(line_no, "unterminated string");
  }

  std::string rest = trim(raw.substr(i));
  if (!rest.empty() && rest.front() != '#') {
    fail_line(line_no, "unexpected text after value");
  }
  return value;
}

}  // namespace

Credentials parse_credentials(std::string_view text) {
  Credentials credentials;
  bool has_id = false;
  bool has_secret = false;
  bool has_login = false;

  std::istringstream stream{std::string(text)};
  std::string line;
  size_t line_no = 0;
  while (std::getline(stream, line)) {
    ++line_no;
    std::string content = trim(line);
    if (content.empty() || content.front() == '#') {
      continue;
    }
    size_t eq = content.find('=');
    if (eq == std::string::npos) {
      throw ConfigurationInvalid("config line " + std::to_string(line_no) + ": expected key=\"value\"");
    }
    std::string key = trim(std::string_view(content).substr(0, eq));
    std::string value = parse_value(trim(std::string_view(content).substr(eq + 1)), line_no);

    if (key == "client_id") {
      credentials.client_id = value;
      has_id = true;
    } else if (key == "client_secret") {
      credentials.client_secret = value;
      has_secret = true;
    } else if (key == "login") {
      credentials.login = value;
      has_login = true;
    } else if (key == "cursus") {
      credentials.cursus = value;
    }
  }

  if (!has_id) {
    throw ConfigurationInvalid("config is missing client_id");
  }
  if (!has_secret) {
    throw ConfigurationInvalid("config is missing client_secret");
  }
  if (!has_login) {
    throw ConfigurationInvalid("config is missing login");
  }
  return credentials;
}

bool check_client(const Credentials &credentials) {
  if (credentials.client_id.empty() || credentials.client_secret.empty()) {
    return false;
  }
  if (credentials.client_id.size() > kMaxClientFieldLength ||
      credentials.client_secret.size() > kMaxClientFieldLength) {
    return false;
  }
  return true;
}

ConfigStore::ConfigStore() {
  auto dir = default_config_dir();
  if (dir) {
    config_path_ = *dir / kConfigFileName;
  }
}

ConfigStore::ConfigStore(std::filesystem::path config_dir)
    : config_path_(std::move(config_dir) / kConfigFileName) {}

std::optional<std::filesystem::path> ConfigStore::default_config_dir() {
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) {
    return std::filesystem::path(xdg);
  }
  const char *home = std::getenv("HOME");
  if (home && *home) {
    return std::filesystem::path(home) / ".config";
  }
  return std::nullopt;
}

bool ConfigStore::exists() const {
  if (!config_path_) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(*config_path_, ec);
}

void ConfigStore::create_interactive(std::istream &in, std::ostream &out) const {
  if (!config_path_) {
    throw FileSystemError("Cannot resolve the user config directory (HOME is not set)");
  }

  out << "Browse to: " << kRegisterApplicationUrl << std::endl;
  out << "Create new Application" << std::endl;
  out << "Set redirect_url to \"" << kRedirectUrl << "\"" << std::endl;

  const std::pair<const char *, const char *> prompts[] = {
      {"client_id", "Enter client id: "},
      {"client_secret", "Enter client secret: "},
      {"login", "Enter intra login: "},
  };
  // Nothing touches the disk until every answer is in
  std::ostringstream content;
  for (const auto &[key, prompt] : prompts) {
    out << prompt << std::endl;
    std::string line;
    if (!std::getline(in, line)) {
      throw ConfigurationInvalid(std::string("Input ended before ") + key + " was entered");
    }
    content << key << "=\"" << escape_value(trim(line)) << "\"\n";
  }

  std::error_code ec;
  std::filesystem::create_directories(config_path_->parent_path(), ec);
  if (ec) {
    throw FileSystemError("Failed to create config directory " +
                          config_path_->parent_path().string() + ": " + ec.message());
  }

  std::ofstream file(*config_path_, std::ios::trunc);
  if (!file.is_open()) {
    throw FileSystemError("Failed to create " + config_path_->string() + ": " +
                          std::strerror(errno));
  }

  // The file holds client_secret
  std::filesystem::permissions(
      *config_path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
      std::filesystem::perm_options::replace, ec);
  if (ec) {
    file.close();
    std::filesystem::remove(*config_path_, ec);
    throw FileSystemError("Failed to restrict permissions on " + config_path_->string());
  }

  file << content.str();
  file.flush();
  if (!file) {
    file.close();
    std::filesystem::remove(*config_path_, ec);
    throw FileSystemError("Failed to write " + config_path_->string());
  }
}

std::string ConfigStore::read_file() const {
  if (!config_path_ || !exists()) {
    throw ConfigurationMissing(std::string(kConfigFileName) + " not found");
  }
  std::ifstream file(*config_path_);
  if (!file.is_open()) {
    throw FileSystemError(std::string(kConfigFileName) + " not readable: " + std::strerror(errno));
  }
  std::ostringstream content;
  content << file.rdbuf();
  if (file.bad()) {
    throw FileSystemError(std::string(kConfigFileName) + " read failed");
  }
  return content.str();
}

bool ConfigStore::validate() const {
  try {
    Credentials credentials = parse_credentials(read_file());
    if (!check_client(credentials)) {
      std::cerr << "[config] client_id and client_secret must be 1 to " << kMaxClientFieldLength
                << " characters" << std::endl;
      return false;
    }
    return true;
  } catch (const IntraError &e) {
    std::cerr << "[config] " << e.what() << std::endl;
    return false;
  }
}

Credentials ConfigStore::load() const {
  return parse_credentials(read_file());
}

}  // namespace intra_core
