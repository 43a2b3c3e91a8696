#pragma once

namespace branchscope::cli {

// Subcommand entry point: argv[0] is the subcommand name
using command_fn = int (*)(int argc, char **argv);

} // namespace branchscope::cli
