#include "branchscope/sanitize.hpp"

#include "branchscope/consts.hpp"
#include "branchscope/errors.hpp"
#include "branchscope/util.hpp"

#include <algorithm>
#include <string>

namespace branchscope {

namespace {

bool is_safe(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

} // namespace

std::string sanitize_branch_name(std::string_view raw) {
  const std::string trimmed = strutil::trim(raw);
  if (trimmed.empty())
    throw InvalidBranchName("branch name is empty");

  // '@' first: its replacement contains '_' which later steps leave alone
  std::string out;
  out.reserve(trimmed.size() + 8);
  for (const char c : trimmed) {
    if (c == '@')
      out += consts::kAtReplacement;
    else
      out.push_back(c);
  }

  for (char &c : out) {
    if (c == '.' || c == '/')
      c = consts::kSafeReplacement;
    else if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
    if (!is_safe(c))
      c = consts::kSafeReplacement;
  }
  return out;
}

bool is_sanitized(std::string_view name) {
  return !name.empty() && std::ranges::all_of(name, is_safe);
}

} // namespace branchscope
