#include "cli/registry.hpp"

#include "branchscope/consts.hpp"

#include <iostream>
#include <map>

namespace branchscope::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage(std::ostream &out) {
  out << "usage: branchscope <command> [args]\n\n";
  out << "commands:\n";
  for (auto &[name, e] : table()) {
    out << "  " << name << "  " << e.help << "\n";
  }
  out << "\nproject config defaults to ./" << consts::kDefaultConfigFile
      << "; without --deployment/--branch/--metaflow-branch the run is local\n";
  out << "exit status: 0 ok, 1 invalid config/deployment/branch, 2 usage error\n";
}

} // namespace branchscope::cli
