#include "cli/registry.hpp"

int cmd_resolve(int argc, char **argv);
int cmd_sanitize(int argc, char **argv);
int cmd_classify(int, char **);
int cmd_key(int, char **);

namespace branchscope::cli {

void register_all_commands() {
  register_command("resolve", ::cmd_resolve,
                   "Show write/read branches: branchscope resolve [--config <file>] "
                   "[--deployment <file>] [--branch <b>] [--metaflow-branch <b>] [--user <u>]");
  register_command("sanitize", ::cmd_sanitize,
                   "Sanitize branch names: branchscope sanitize <name>...");
  register_command("classify", ::cmd_classify,
                   "Classify branch labels: branchscope classify <branch>...");
  register_command("key", ::cmd_key,
                   "Storage key of an asset: branchscope key <data|model> <id> [--read] "
                   "[resolve options]");
}

} // namespace branchscope::cli
