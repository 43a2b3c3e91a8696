#pragma once
#include <string_view>

namespace branchscope::consts {

// Scope labels carried by metaflow_branch
inline constexpr std::string_view kProdBranch = "prod";
inline constexpr std::string_view kProdPrefix = "prod.";
inline constexpr std::string_view kTestPrefix = "test.";
inline constexpr std::string_view kUserPrefix = "user.";

// Project configuration keys
inline constexpr std::string_view kDefaultConfigFile = "obproject.toml";
inline constexpr std::string_view kProjectKey        = "project";
inline constexpr std::string_view kDevAssetsBranch   = "dev-assets.branch";

// Deployment descriptor keys
inline constexpr std::string_view kBranchKey         = "branch";
inline constexpr std::string_view kSpecSection       = "spec";
inline constexpr std::string_view kMetaflowBranchKey = "metaflow_branch";

// ——— Sanitizer ———
inline constexpr std::string_view kAtReplacement = "_at_";
inline constexpr char kSafeReplacement = '_';

// ——— Storage key layout ———
inline constexpr char kKeySeparator = '/';
inline constexpr std::string_view kDataDir  = "data";
inline constexpr std::string_view kModelDir = "models";

// Printed for "no read branch" (use the write branch)
inline constexpr std::string_view kNoneMarker = "-";

} // namespace branchscope::consts
