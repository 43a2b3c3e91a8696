#pragma once
#include <string>
#include <string_view>

namespace branchscope {

// String helpers
namespace strutil {
  // Strip leading/trailing spaces, tabs, CR and LF
  auto trim(std::string_view sv) -> std::string;
}

}
