#include "branchscope/asset_scope.hpp"
#include "cli/scope_options.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int cmd_key(int argc, char **argv) {
  using namespace branchscope;

  cli::ScopeOptions opts;
  Access access = Access::Write;
  std::vector<std::string> positional;
  try {
    for (int i = 1; i < argc; ++i) {
      if (std::string a = argv[i]; a == "--read") {
        access = Access::Read;
      } else if (!cli::take_scope_option(argc, argv, i, opts)) {
        positional.emplace_back(argv[i]);
      }
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << "key: " << e.what() << "\n";
    return 2;
  }

  if (positional.size() != 2 || (positional[0] != "data" && positional[0] != "model")) {
    std::cerr << "usage: branchscope key <data|model> <asset_id> [--read] [resolve options]\n";
    return 2;
  }
  const AssetKind kind = positional[0] == "model" ? AssetKind::Model : AssetKind::Data;

  try {
    const auto in = cli::load_scope_inputs(opts);
    const AssetScope scope = make_asset_scope(in.config, in.deployment, in.user);
    std::cout << scope.key(kind, positional[1], access) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "key: " << e.what() << "\n";
    return 1;
  }
}
