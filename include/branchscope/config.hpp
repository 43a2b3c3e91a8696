#pragma once
#include "branchscope/scope.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace branchscope {

// Flat view of a TOML-subset file: keys inside [section] become "section.key".
using Settings = std::map<std::string, std::string>;

// Parse settings text. `origin` names the source in ConfigParseError messages.
auto parse_settings(std::string_view text, const std::string &origin = "<string>") -> Settings;

// Read and parse a settings file (throws std::runtime_error if unreadable)
auto load_settings(const std::filesystem::path &path) -> Settings;

// project = "...", [dev-assets] branch = "..."
auto project_config_from(const Settings &settings) -> ProjectConfig;
auto load_project_config(const std::filesystem::path &path) -> ProjectConfig;

// branch = "...", [spec] metaflow_branch = "..." (every [spec] key is an annotation)
auto deployment_spec_from(const Settings &settings) -> DeploymentSpec;
auto load_deployment_spec(const std::filesystem::path &path) -> DeploymentSpec;

} // namespace branchscope
