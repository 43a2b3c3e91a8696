#include "branchscope/scope.hpp"

#include <iostream>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

using branchscope::ScopeKind;

int main() {
  const std::vector<std::pair<std::string_view, ScopeKind>> cases = {
      {"prod", ScopeKind::Production},       {"prod.v2", ScopeKind::Production},
      {"prod.anything", ScopeKind::Production}, {"prod.", ScopeKind::Production},
      {"production", ScopeKind::Other},      {"Prod", ScopeKind::Other},
      {"prodx", ScopeKind::Other},           {"test.feature", ScopeKind::Test},
      {"user.alice", ScopeKind::User},       {"main", ScopeKind::Other},
      {"test", ScopeKind::Other},            {"", ScopeKind::Other},
  };

  for (const auto &[branch, want] : cases) {
    if (const auto got = branchscope::classify_branch(branch); got != want) {
      std::cerr << "classify_branch(\"" << branch << "\") = " << branchscope::to_string(got)
                << ", expected " << branchscope::to_string(want) << "\n";
      return 1;
    }
  }

  if (branchscope::classify(std::nullopt) != ScopeKind::Local) {
    std::cerr << "no deployment should classify as local\n";
    return 1;
  }
  branchscope::DeploymentSpec d{.branch = "main", .annotations = {{"metaflow_branch", "user.bob"}}};
  if (branchscope::classify(d) != ScopeKind::User) {
    std::cerr << "deployment classify ignored metaflow_branch\n";
    return 1;
  }

  std::cout << "classify OK\n";
  return 0;
}
