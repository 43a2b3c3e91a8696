#include "branchscope/config.hpp"

#include "branchscope/consts.hpp"
#include "branchscope/errors.hpp"
#include "branchscope/fs.hpp"
#include "branchscope/util.hpp"

#include <sstream>
#include <string_view>

namespace branchscope {

namespace {

std::string lookup(const Settings &settings, std::string_view key) {
  const auto it = settings.find(std::string(key));
  return it == settings.end() ? std::string{} : it->second;
}

// Only whitespace or a '#' comment may follow a value or section header
bool only_comment(std::string_view rest) {
  const std::string tail = strutil::trim(rest);
  return tail.empty() || tail.front() == '#';
}

// Value after '=': "basic" or 'literal' string up to its closing quote,
// otherwise the bare text up to an inline '#' comment.
std::string parse_value(std::string_view raw, const std::string &origin, std::size_t lineno) {
  if (!raw.empty() && (raw.front() == '"' || raw.front() == '\'')) {
    const char quote = raw.front();
    const auto close = raw.find(quote, 1);
    if (close == std::string_view::npos)
      throw ConfigParseError(origin, lineno, "unterminated string");
    if (!only_comment(raw.substr(close + 1)))
      throw ConfigParseError(origin, lineno, "unexpected text after string");
    return std::string(raw.substr(1, close - 1));
  }
  return strutil::trim(raw.substr(0, raw.find('#')));
}

} // namespace

auto parse_settings(std::string_view text, const std::string &origin) -> Settings {
  Settings out;
  std::istringstream iss{std::string(text)};

  std::string section;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string sv = strutil::trim(line);
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments

    if (sv.front() == '[') {
      const auto close = sv.find(']');
      if (close == std::string::npos)
        throw ConfigParseError(origin, lineno, "unterminated section header");
      if (!only_comment(std::string_view(sv).substr(close + 1)))
        throw ConfigParseError(origin, lineno, "unexpected text after section header");
      section = strutil::trim(std::string_view(sv).substr(1, close - 1));
      if (section.empty())
        throw ConfigParseError(origin, lineno, "empty section name");
      continue;
    }

    const auto eq = sv.find('=');
    if (eq == std::string::npos)
      throw ConfigParseError(origin, lineno, "expected 'key = value'");
    const std::string key = strutil::trim(std::string_view(sv).substr(0, eq));
    if (key.empty())
      throw ConfigParseError(origin, lineno, "missing key before '='");
    const std::string raw_value = strutil::trim(std::string_view(sv).substr(eq + 1));
    out[section.empty() ? key : section + "." + key] = parse_value(raw_value, origin, lineno);
  }
  return out;
}

auto load_settings(const std::filesystem::path &path) -> Settings {
  if (!fs::exists(path))
    throw std::runtime_error("no such file: " + path.string());
  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  return parse_settings(text, path.string());
}

auto project_config_from(const Settings &settings) -> ProjectConfig {
  ProjectConfig cfg{};
  cfg.project_name = lookup(settings, consts::kProjectKey);
  if (cfg.project_name.empty())
    throw InvalidConfiguration("missing 'project' in project configuration");
  if (auto dev = lookup(settings, consts::kDevAssetsBranch); !dev.empty())
    cfg.dev_assets_branch = std::move(dev);
  return cfg;
}

auto load_project_config(const std::filesystem::path &path) -> ProjectConfig {
  return project_config_from(load_settings(path));
}

auto deployment_spec_from(const Settings &settings) -> DeploymentSpec {
  DeploymentSpec spec{};
  spec.branch = lookup(settings, consts::kBranchKey);

  const std::string prefix = std::string(consts::kSpecSection) + ".";
  for (const auto &[key, value] : settings) {
    if (key.starts_with(prefix))
      spec.annotations[key.substr(prefix.size())] = value;
  }
  if (spec.branch.empty() && spec.metaflow_branch().empty())
    throw InvalidDeploymentSpec("deployment descriptor carries no branch information");
  return spec;
}

auto load_deployment_spec(const std::filesystem::path &path) -> DeploymentSpec {
  return deployment_spec_from(load_settings(path));
}

} // namespace branchscope
