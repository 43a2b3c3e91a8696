#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace branchscope {

// Base of every error raised by branchscope itself.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Project configuration carries no project identity.
class InvalidConfiguration : public Error {
public:
  using Error::Error;
};

// Deployment context present but without any branch information.
class InvalidDeploymentSpec : public Error {
public:
  using Error::Error;
};

// Sanitizer input empty or whitespace-only.
class InvalidBranchName : public Error {
public:
  using Error::Error;
};

class InvalidAssetId : public Error {
public:
  using Error::Error;
};

// Malformed line in a configuration or deployment file.
class ConfigParseError : public Error {
public:
  ConfigParseError(const std::string &file, std::size_t line, const std::string &what)
      : Error(file + ":" + std::to_string(line) + ": " + what), line_(line) {}

  [[nodiscard]] std::size_t line() const { return line_; }

private:
  std::size_t line_;
};

} // namespace branchscope
