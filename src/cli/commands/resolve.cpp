#include "branchscope/asset_scope.hpp"
#include "branchscope/consts.hpp"
#include "cli/scope_options.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

int cmd_resolve(int argc, char **argv) {
  using namespace branchscope;

  cli::ScopeOptions opts;
  try {
    for (int i = 1; i < argc; ++i) {
      if (!cli::take_scope_option(argc, argv, i, opts)) {
        std::cerr << "resolve: unknown option: " << argv[i] << "\n";
        return 2;
      }
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << "resolve: " << e.what() << "\n";
    return 2;
  }

  try {
    const auto in = cli::load_scope_inputs(opts);
    const AssetScope scope = make_asset_scope(in.config, in.deployment, in.user);

    if (opts.verbose) {
      std::cerr << "resolve: effective branch "
                << (in.deployment ? effective_branch(*in.deployment) : std::string("(none)"))
                << " (" << to_string(scope.kind) << ")\n";
      if (scope.kind == ScopeKind::Production) {
        if (in.config.dev_assets_branch)
          std::cerr << "resolve: production run, [dev-assets] ignored\n";
      } else if (scope.read_branch) {
        std::cerr << "resolve: reading from [dev-assets] branch " << *scope.read_branch << "\n";
      }
    }

    const std::string none(consts::kNoneMarker);
    std::cout << "project: " << scope.project << "\n";
    std::cout << "kind: " << to_string(scope.kind) << "\n";
    std::cout << "write_branch: " << scope.write_branch << "\n";
    std::cout << "read_branch: " << scope.read_branch.value_or(none) << "\n";
    std::cout << "write_key_branch: " << scope.sanitized_write_branch << "\n";
    std::cout << "read_key_branch: " << scope.sanitized_read_branch << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "resolve: " << e.what() << "\n";
    return 1;
  }
}
