#include <cstdlib>
#include <iostream>

#include "intra_cli/cli_handler.hpp"
#include "intra_cli/program.hpp"
#include "intra_core/config_store.hpp"

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    intra_cli::CliOptions options = intra_cli::CliHandler::parse_arguments(argc, argv);
    if (options.help) {
      intra_cli::CliHandler::print_help(std::cout);
      return 0;
    }
    if (options.version) {
      intra_cli::CliHandler::print_version(std::cout);
      return 0;
    }

    intra_core::ConfigStore store;
    intra_cli::Program program(store, intra_cli::make_curl_session, std::cin, std::cout);
    program.initialize();
    program.run(options.command);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
