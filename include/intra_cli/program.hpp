#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "intra_cli/command.hpp"
#include "intra_cli/command_dispatcher.hpp"
#include "intra_core/config_store.hpp"
#include "intra_core/http/session.hpp"
#include "intra_core/services/user_resolver.hpp"

namespace intra_cli {

using SessionFactory =
    std::function<std::unique_ptr<intra_core::Session>(const intra_core::Credentials &)>;
using ResolverFactory =
    std::function<std::unique_ptr<intra_core::UserResolver>(intra_core::Session &)>;

// Builds a CurlSession, which performs the token exchange
std::unique_ptr<intra_core::Session> make_curl_session(const intra_core::Credentials &credentials);

/**
 * @brief Bootstraps configuration and the session, then runs one command.
 *
 * `in` and `out` are the streams used by first-run setup; `out` also
 * receives command output.
 */
class Program {
 public:
  Program(intra_core::ConfigStore &store, SessionFactory session_factory, std::istream &in,
          std::ostream &out, Clock now = std::chrono::system_clock::now);

  // Disable copy constructor and assignment
  Program(const Program &) = delete;
  Program &operator=(const Program &) = delete;

  /**
   * @brief Runs first-run setup if no config exists, validates it, and opens
   *        the session.
   * @throws intra_core::ConfigurationInvalid when validation fails.
   * @throws intra_core::SessionError and anything else the session factory throws.
   */
  void initialize();

  // Resolves the user and prints `command`. Requires initialize().
  void run(Command command);

  // Replaces the default UserResolver
  void set_resolver_factory(ResolverFactory factory);

  intra_core::Session *session() const {
    return session_.get();
  }

 private:
  intra_core::ConfigStore &store_;
  SessionFactory session_factory_;
  ResolverFactory resolver_factory_;
  std::istream &in_;
  std::ostream &out_;
  Clock now_;

  std::unique_ptr<intra_core::Session> session_;
  std::optional<std::string> cursus_;
};

}  // namespace intra_cli
