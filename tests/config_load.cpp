#include "branchscope/config.hpp"
#include "branchscope/errors.hpp"
#include "branchscope/scope.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("branchscope_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // project config with [dev-assets]
    write_file(root / "obproject.toml", "# project settings\n"
                                        "project = \"my_project\"\n"
                                        "title = \"ignored\"\n"
                                        "\n"
                                        "[dev-assets]\n"
                                        "branch = \"prod\"\n");
    const auto cfg = branchscope::load_project_config(root / "obproject.toml");
    if (cfg.project_name != "my_project" || cfg.dev_assets_branch != "prod") {
      std::cerr << "project config mismatch: " << cfg.project_name << "\n";
      return 1;
    }

    // without [dev-assets], unquoted value
    write_file(root / "plain.toml", "project = plain_project\r\n");
    const auto plain = branchscope::load_project_config(root / "plain.toml");
    if (plain.project_name != "plain_project" || plain.dev_assets_branch) {
      std::cerr << "plain config mismatch\n";
      return 1;
    }

    // deployment descriptor
    write_file(root / "deploy.toml", "branch = \"feature\"\n"
                                     "[spec]\n"
                                     "metaflow_branch = \"test.feature\"\n"
                                     "owner = \"alice\"\n");
    const auto dep = branchscope::load_deployment_spec(root / "deploy.toml");
    if (dep.branch != "feature" || dep.metaflow_branch() != "test.feature" ||
        dep.annotations.size() != 2) {
      std::cerr << "deployment mismatch: " << dep.branch << " / " << dep.metaflow_branch()
                << "\n";
      return 1;
    }
    const auto scope = branchscope::resolve_scope(cfg, dep);
    if (scope.read_branch != "prod") {
      std::cerr << "loaded inputs resolved to " << scope.read_branch.value_or("(none)") << "\n";
      return 1;
    }

    // legacy descriptor: no [spec] section
    write_file(root / "legacy.toml", "branch = main\n");
    const auto legacy = branchscope::load_deployment_spec(root / "legacy.toml");
    if (!legacy.metaflow_branch().empty() || branchscope::effective_branch(legacy) != "main") {
      std::cerr << "legacy descriptor mismatch\n";
      return 1;
    }

    // missing project name
    write_file(root / "noproject.toml", "[dev-assets]\nbranch = \"prod\"\n");
    bool threw = false;
    try {
      (void)branchscope::load_project_config(root / "noproject.toml");
    } catch (const branchscope::InvalidConfiguration &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "config without project did not throw\n";
      return 1;
    }

    // descriptor without branch info
    write_file(root / "empty.toml", "# nothing\n[spec]\n");
    threw = false;
    try {
      (void)branchscope::load_deployment_spec(root / "empty.toml");
    } catch (const branchscope::InvalidDeploymentSpec &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "empty descriptor did not throw\n";
      return 1;
    }

    // inline comments after bare and quoted values, literal strings
    {
      const auto s = branchscope::parse_settings("project = my_project  # the project\n"
                                                 "[dev-assets] # reads\n"
                                                 "branch = prod # read prod\n"
                                                 "[spec]\n"
                                                 "metaflow_branch = \"test.a#b\" # quoted hash\n"
                                                 "owner = 'alice' # literal\n"
                                                 "empty = \"\"\n");
      const auto cfg = branchscope::project_config_from(s);
      if (cfg.project_name != "my_project" || cfg.dev_assets_branch != "prod") {
        std::cerr << "inline comment kept: [" << cfg.project_name << "] ["
                  << cfg.dev_assets_branch.value_or("(none)") << "]\n";
        return 1;
      }
      if (s.at("spec.metaflow_branch") != "test.a#b" || s.at("spec.owner") != "alice" ||
          !s.at("spec.empty").empty()) {
        std::cerr << "quoted values mismatch: [" << s.at("spec.metaflow_branch") << "] ["
                  << s.at("spec.owner") << "]\n";
        return 1;
      }
      const auto quoted = branchscope::parse_settings("project = \"my_project\" # c\n");
      if (quoted.at("project") != "my_project") {
        std::cerr << "quoted value with comment mismatch\n";
        return 1;
      }
    }

    // malformed lines report their position
    for (const char *bad : {"project = \"x\"\nnot a setting\n", "[dev-assets\n",
                            "project = \"x\n", "= value\n", "[]\n",
                            "project = \"x\" y\n", "branch = 'prod\n",
                            "[spec] trailing\n"}) {
      threw = false;
      try {
        (void)branchscope::parse_settings(bad, "bad.toml");
      } catch (const branchscope::ConfigParseError &e) {
        threw = std::string(e.what()).rfind("bad.toml:", 0) == 0 && e.line() >= 1;
      }
      if (!threw) {
        std::cerr << "malformed settings accepted: " << bad << "\n";
        return 1;
      }
    }

    // missing file
    threw = false;
    try {
      (void)branchscope::load_project_config(root / "missing.toml");
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "missing file did not throw\n";
      return 1;
    }

    std::cout << "config load OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
