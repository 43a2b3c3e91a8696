#include "branchscope/sanitize.hpp"

#include <iostream>

int cmd_sanitize(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: branchscope sanitize <name>...\n";
    return 2;
  }

  int rc = 0;
  for (int i = 1; i < argc; ++i) {
    try {
      std::cout << branchscope::sanitize_branch_name(argv[i]) << "\n";
    } catch (const std::exception &e) {
      std::cerr << "sanitize: " << e.what() << "\n";
      rc = 1;
    }
  }
  return rc;
}
