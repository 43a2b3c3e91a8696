// Small string helpers shared by the loaders and the sanitizer
#include "branchscope/util.hpp"

namespace branchscope::strutil {

namespace {
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
} // namespace

std::string trim(std::string_view sv) {
  while (!sv.empty() && is_space(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_space(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace branchscope::strutil
