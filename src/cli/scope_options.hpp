#pragma once
#include "branchscope/scope.hpp"

#include <optional>
#include <string>

namespace branchscope::cli {

// Options shared by `resolve` and `key`
struct ScopeOptions {
  std::string config_path;                    // default: ./obproject.toml
  std::optional<std::string> deployment_path;
  std::optional<std::string> branch;
  std::optional<std::string> metaflow_branch;
  std::optional<std::string> user;            // default: $USER
  bool verbose = false;
};

// Consume argv[i] (and its value) if it is a scope option; advances i.
// Returns false if argv[i] is not a scope option. Throws std::invalid_argument
// when an option is missing its value.
bool take_scope_option(int argc, char **argv, int &i, ScopeOptions &opts);

struct ScopeInputs {
  ProjectConfig config;
  std::optional<DeploymentSpec> deployment;
  std::string user;
};

// Load the config file and build the deployment from file and/or flags.
ScopeInputs load_scope_inputs(const ScopeOptions &opts);

} // namespace branchscope::cli
