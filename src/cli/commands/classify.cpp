#include "branchscope/scope.hpp"

#include <iostream>

int cmd_classify(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: branchscope classify <branch>...\n";
    return 2;
  }
  for (int i = 1; i < argc; ++i) {
    const auto kind = branchscope::classify_branch(argv[i]);
    std::cout << argv[i] << ": " << branchscope::to_string(kind) << "\n";
  }
  return 0;
}
