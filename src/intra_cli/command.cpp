#include "intra_cli/command.hpp"

#include <unordered_map>

#include "intra_cli/cli_handler.hpp"

namespace intra_cli {

Command parse_command(const std::string &name) {
  static const std::unordered_map<std::string, Command> kCommands = {
      {"id", Command::Id},
      {"me", Command::Me},
      {"email", Command::Email},
      {"login", Command::Login},
      {"correction_point", Command::CorrectionPoint},
      {"correction-point", Command::CorrectionPoint},
      {"wallet", Command::Wallet},
      {"blackhole", Command::Blackhole},
  };

  auto it = kCommands.find(name);
  if (it == kCommands.end()) {
    throw CliError("Unknown command: " + name);
  }
  return it->second;
}

std::string command_name(Command command) {
  switch (command) {
    case Command::Id: return "id";
    case Command::Me: return "me";
    case Command::Email: return "email";
    case Command::Login: return "login";
    case Command::CorrectionPoint: return "correction_point";
    case Command::Wallet: return "wallet";
    case Command::Blackhole: return "blackhole";
  }
  return "unknown";
}

}  // namespace intra_cli
