#pragma once
#include <iostream>
#include <string>
#include "cli/command.hpp"

namespace branchscope::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
// Command list, default config file and exit-status convention
void print_usage(std::ostream& out = std::cerr);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace branchscope::cli
