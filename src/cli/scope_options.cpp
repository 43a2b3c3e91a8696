#include "cli/scope_options.hpp"

#include "branchscope/config.hpp"
#include "branchscope/consts.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace branchscope::cli {

bool take_scope_option(int argc, char **argv, int &i, ScopeOptions &opts) {
  const std::string a = argv[i];
  auto value = [&]() -> std::string {
    if (i + 1 >= argc)
      throw std::invalid_argument("missing value for " + a);
    return argv[++i];
  };

  if (a == "--config" || a == "-c") {
    opts.config_path = value();
  } else if (a == "--deployment" || a == "-d") {
    opts.deployment_path = value();
  } else if (a == "--branch") {
    opts.branch = value();
  } else if (a == "--metaflow-branch") {
    opts.metaflow_branch = value();
  } else if (a == "--user") {
    opts.user = value();
  } else if (a == "--verbose" || a == "-v") {
    opts.verbose = true;
  } else {
    return false;
  }
  return true;
}

ScopeInputs load_scope_inputs(const ScopeOptions &opts) {
  ScopeInputs in{};
  const std::filesystem::path cfg =
      opts.config_path.empty()
          ? std::filesystem::current_path() / std::string(consts::kDefaultConfigFile)
          : std::filesystem::path(opts.config_path);
  in.config = load_project_config(cfg);

  if (opts.deployment_path)
    in.deployment = load_deployment_spec(*opts.deployment_path);
  if (opts.branch || opts.metaflow_branch) {
    if (!in.deployment)
      in.deployment = DeploymentSpec{};
    if (opts.branch)
      in.deployment->branch = *opts.branch;
    if (opts.metaflow_branch)
      in.deployment->annotations[std::string(consts::kMetaflowBranchKey)] = *opts.metaflow_branch;
  }

  if (opts.user) {
    in.user = *opts.user;
  } else if (const char *env_user = std::getenv("USER"); env_user != nullptr) {
    in.user = env_user;
  }
  return in;
}

} // namespace branchscope::cli
