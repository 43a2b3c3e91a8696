#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace branchscope {

struct ProjectConfig {
  std::string project_name;
  // [dev-assets] branch; when set, non-production runs read from it
  std::optional<std::string> dev_assets_branch;
};

struct DeploymentSpec {
  std::string branch;                              // legacy deployment branch
  std::map<std::string, std::string> annotations; // may hold "metaflow_branch"

  // Value of the metaflow_branch annotation ("" if absent)
  [[nodiscard]] auto metaflow_branch() const -> std::string;
};

enum class ScopeKind { Production, Test, User, Local, Other };

struct ScopeResult {
  std::string project;
  std::optional<std::string> read_branch; // nullopt: read from the write branch
};

[[nodiscard]] auto to_string(ScopeKind kind) -> std::string_view;

// metaflow_branch if non-empty, else the legacy branch.
// Throws InvalidDeploymentSpec when both are empty.
[[nodiscard]] auto effective_branch(const DeploymentSpec &deployment) -> std::string;

// "prod" / "prod.*" -> Production, "test.*" -> Test, "user.*" -> User,
// anything else -> Other. Case-sensitive.
[[nodiscard]] auto classify_branch(std::string_view effective) -> ScopeKind;

// Kind of a run: Local when there is no deployment.
[[nodiscard]] auto classify(const std::optional<DeploymentSpec> &deployment) -> ScopeKind;

// Decide which branch a run reads assets from.
// - Production runs always read what they write; [dev-assets] is ignored.
// - Every other run reads the [dev-assets] branch if configured, otherwise
//   its own write branch (read_branch == nullopt).
// Throws InvalidConfiguration on an empty project name and
// InvalidDeploymentSpec on a deployment without branch information.
[[nodiscard]] auto resolve_scope(const ProjectConfig &config,
                                 const std::optional<DeploymentSpec> &deployment)
    -> ScopeResult;

// Branch a run writes to: the effective branch when deployed, otherwise the
// per-user branch "user.<local_user>".
[[nodiscard]] auto write_branch(const std::optional<DeploymentSpec> &deployment,
                                std::string_view local_user) -> std::string;

} // namespace branchscope
