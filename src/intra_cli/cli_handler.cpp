#include "intra_cli/cli_handler.hpp"

#include <ostream>

#ifndef INTRA42_VERSION
#define INTRA42_VERSION "0.0.0"
#endif

namespace intra_cli {

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  std::string command;
  bool have_command = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--version" || arg == "-V") {
      options.version = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw CliError("Unknown option: " + arg);
    } else if (have_command) {
      throw CliError("Unexpected argument: " + arg + ". Usage: " + kProgramName + " [command]");
    } else {
      command = arg;
      have_command = true;
    }
  }

  if (options.help || options.version) {
    return options;
  }
  options.command = parse_command(have_command ? command : kDefaultCommand);
  return options;
}

void CliHandler::print_help(std::ostream &out) {
  out << kProgramName << " " << INTRA42_VERSION << "\n"
      << "Print fields of your 42 intra profile\n\n"
      << "USAGE:\n"
      << "  " << kProgramName << " [command]\n\n"
      << "ARGS:\n"
      << "  <command>    Command to run [default: " << kDefaultCommand << "]\n\n"
      << "COMMANDS:\n"
      << "  id                Numeric user id\n"
      << "  me                Profile summary\n"
      << "  email             Email address\n"
      << "  login             Intra login\n"
      << "  correction_point  Correction points\n"
      << "  wallet            Wallet balance\n"
      << "  blackhole         Days left before the blackhole\n\n"
      << "OPTIONS:\n"
      << "  -h, --help        Print help information\n"
      << "  -V, --version     Print version information\n";
}

void CliHandler::print_version(std::ostream &out) {
  out << kProgramName << " " << INTRA42_VERSION << std::endl;
}

}  // namespace intra_cli
