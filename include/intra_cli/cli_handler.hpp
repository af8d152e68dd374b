#pragma once

#include <iosfwd>
#include <stdexcept>
#include <string>

#include "intra_cli/command.hpp"

namespace intra_cli {

inline constexpr const char *kProgramName = "intra42";
inline constexpr const char *kDefaultCommand = "login";

struct CliOptions {
  Command command = Command::Login;
  bool help = false;
  bool version = false;
};

class CliError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class CliHandler {
 public:
  // Parse command line arguments. Throws CliError on unknown commands or flags.
  static CliOptions parse_arguments(int argc, char *argv[]);

  static void print_help(std::ostream &out);
  static void print_version(std::ostream &out);
};

}  // namespace intra_cli
