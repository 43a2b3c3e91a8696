#include "branchscope/scope.hpp"

#include "branchscope/consts.hpp"
#include "branchscope/errors.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace branchscope {

auto DeploymentSpec::metaflow_branch() const -> std::string {
  const auto it = annotations.find(std::string(consts::kMetaflowBranchKey));
  return it == annotations.end() ? std::string{} : it->second;
}

std::string_view to_string(ScopeKind kind) {
  switch (kind) {
  case ScopeKind::Production:
    return "production";
  case ScopeKind::Test:
    return "test";
  case ScopeKind::User:
    return "user";
  case ScopeKind::Local:
    return "local";
  case ScopeKind::Other:
    return "other";
  }
  return "other";
}

std::string effective_branch(const DeploymentSpec &deployment) {
  if (auto mf = deployment.metaflow_branch(); !mf.empty())
    return mf;
  if (deployment.branch.empty()) {
    throw InvalidDeploymentSpec(
        "deployment has neither a metaflow_branch annotation nor a branch");
  }
  return deployment.branch; // legacy fallback
}

ScopeKind classify_branch(std::string_view effective) {
  if (effective == consts::kProdBranch || effective.starts_with(consts::kProdPrefix))
    return ScopeKind::Production;
  if (effective.starts_with(consts::kTestPrefix))
    return ScopeKind::Test;
  if (effective.starts_with(consts::kUserPrefix))
    return ScopeKind::User;
  return ScopeKind::Other;
}

ScopeKind classify(const std::optional<DeploymentSpec> &deployment) {
  if (!deployment)
    return ScopeKind::Local;
  return classify_branch(effective_branch(*deployment));
}

ScopeResult resolve_scope(const ProjectConfig &config,
                          const std::optional<DeploymentSpec> &deployment) {
  if (config.project_name.empty())
    throw InvalidConfiguration("project configuration has no project name");

  ScopeResult out{.project = config.project_name, .read_branch = std::nullopt};

  if (deployment) {
    std::string effective = effective_branch(*deployment);
    if (classify_branch(effective) == ScopeKind::Production) {
      // production reads what it writes, whatever [dev-assets] says
      out.read_branch = std::move(effective);
      return out;
    }
  }

  if (config.dev_assets_branch)
    out.read_branch = *config.dev_assets_branch;
  return out;
}

std::string write_branch(const std::optional<DeploymentSpec> &deployment,
                         std::string_view local_user) {
  if (deployment)
    return effective_branch(*deployment);
  if (local_user.empty())
    throw InvalidConfiguration("local run without a user name: cannot derive write branch");
  return std::string(consts::kUserPrefix) + std::string(local_user);
}

} // namespace branchscope
