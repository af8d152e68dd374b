#include "intra_cli/program.hpp"

#include <stdexcept>

#include "intra_core/errors.hpp"
#include "intra_core/http/curl_session.hpp"

namespace intra_cli {

std::unique_ptr<intra_core::Session> make_curl_session(const intra_core::Credentials &credentials) {
  return std::make_unique<intra_core::CurlSession>(credentials);
}

Program::Program(intra_core::ConfigStore &store, SessionFactory session_factory, std::istream &in,
                 std::ostream &out, Clock now)
    : store_(store),
      session_factory_(std::move(session_factory)),
      resolver_factory_([](intra_core::Session &session) {
        return std::make_unique<intra_core::UserResolver>(session);
      }),
      in_(in),
      out_(out),
      now_(std::move(now)) {}

void Program::initialize() {
  if (!store_.exists()) {
    store_.create_interactive(in_, out_);
  }

  if (!store_.validate()) {
    std::string where = store_.config_path() ? store_.config_path()->string()
                                              : std::string(intra_core::kConfigFileName);
    throw intra_core::ConfigurationInvalid("Invalid configuration in " + where +
                                           "; fix or delete it and run again");
  }

  intra_core::Credentials credentials = store_.load();
  cursus_ = credentials.cursus;
  session_ = session_factory_(credentials);
  if (!session_) {
    throw intra_core::SessionError("Session factory returned no session");
  }
}

void Program::run(Command command) {
  if (!session_) {
    throw std::logic_error("Program::run called before initialize");
  }

  std::unique_ptr<intra_core::UserResolver> resolver = resolver_factory_(*session_);
  intra_core::ResolvedUser user = resolver->resolve();

  CommandDispatcher dispatcher(out_, now_, cursus_);
  dispatcher.dispatch(command, user);
}

void Program::set_resolver_factory(ResolverFactory factory) {
  resolver_factory_ = std::move(factory);
}

}  // namespace intra_cli
