#pragma once

#include <string>

namespace intra_cli {

enum class Command { Id, Me, Email, Login, CorrectionPoint, Wallet, Blackhole };

// Throws CliError("Unknown command: ...") for anything outside the enumeration
Command parse_command(const std::string &name);

std::string command_name(Command command);

}  // namespace intra_cli
