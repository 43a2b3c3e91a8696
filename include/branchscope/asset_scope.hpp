#pragma once
#include "branchscope/scope.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace branchscope {

enum class AssetKind { Data, Model };
enum class Access { Read, Write };

// Branch-scoped namespace of one run, as handed to an asset-store client.
struct AssetScope {
  std::string project;
  ScopeKind kind{ScopeKind::Local};
  std::string write_branch;
  std::optional<std::string> read_branch; // nullopt: same as write_branch
  std::string sanitized_write_branch;
  std::string sanitized_read_branch;      // always set (falls back to write)

  [[nodiscard]] auto read_branch_or_write() const -> const std::string & {
    return read_branch ? *read_branch : write_branch;
  }

  // "<project>/<sanitized branch>/<data|models>/<asset_id>"
  // Throws InvalidAssetId for an empty id or one containing '/'.
  [[nodiscard]] auto key(AssetKind asset_kind, std::string_view asset_id, Access access) const
      -> std::string;
};

[[nodiscard]] auto to_string(AssetKind kind) -> std::string_view;

// resolve_scope + write_branch + sanitize_branch_name in one step
[[nodiscard]] auto make_asset_scope(const ProjectConfig &config,
                                    const std::optional<DeploymentSpec> &deployment,
                                    std::string_view local_user) -> AssetScope;

} // namespace branchscope
