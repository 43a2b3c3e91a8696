#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  branchscope::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    branchscope::cli::print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  if (cmd == "-h" || cmd == "--help" || cmd == "help") {
    branchscope::cli::print_usage(std::cout);
    return 0;
  }

  const auto fn = branchscope::cli::find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    branchscope::cli::print_usage();
    return 2;
  }
  // Pass everything after the subcommand to the handler
  return fn(argc - 1, argv + 1);
}
