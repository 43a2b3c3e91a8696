#pragma once
#include <string>
#include <string_view>

namespace branchscope {

// Map a raw branch label to a storage-safe key fragment over [a-z0-9_-]:
//   '@' -> "_at_", '.' and '/' -> '_', lowercase, anything else -> '_'.
// Leading/trailing whitespace is trimmed first; throws InvalidBranchName if
// nothing remains. Distinct inputs may collide.
[[nodiscard]] auto sanitize_branch_name(std::string_view raw) -> std::string;

// True if every character is in [a-z0-9_-] and the string is non-empty.
[[nodiscard]] auto is_sanitized(std::string_view name) -> bool;

} // namespace branchscope
