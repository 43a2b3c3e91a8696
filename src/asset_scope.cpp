#include "branchscope/asset_scope.hpp"

#include "branchscope/consts.hpp"
#include "branchscope/errors.hpp"
#include "branchscope/sanitize.hpp"

#include <string>
#include <utility>

namespace branchscope {

std::string_view to_string(AssetKind kind) {
  return kind == AssetKind::Model ? consts::kModelDir : consts::kDataDir;
}

auto AssetScope::key(AssetKind asset_kind, std::string_view asset_id, Access access) const
    -> std::string {
  if (asset_id.empty())
    throw InvalidAssetId("asset id is empty");
  if (asset_id.find(consts::kKeySeparator) != std::string_view::npos)
    throw InvalidAssetId("asset id must not contain '/': " + std::string(asset_id));

  const std::string &branch =
      access == Access::Write ? sanitized_write_branch : sanitized_read_branch;
  std::string out = project;
  out += consts::kKeySeparator;
  out += branch;
  out += consts::kKeySeparator;
  out += to_string(asset_kind);
  out += consts::kKeySeparator;
  out += asset_id;
  return out;
}

AssetScope make_asset_scope(const ProjectConfig &config,
                            const std::optional<DeploymentSpec> &deployment,
                            std::string_view local_user) {
  ScopeResult resolved = resolve_scope(config, deployment);

  AssetScope out{};
  out.project = std::move(resolved.project);
  out.kind = classify(deployment);
  out.write_branch = write_branch(deployment, local_user);
  out.read_branch = std::move(resolved.read_branch);
  out.sanitized_write_branch = sanitize_branch_name(out.write_branch);
  out.sanitized_read_branch = sanitize_branch_name(out.read_branch_or_write());
  return out;
}

} // namespace branchscope
