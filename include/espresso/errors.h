#pragma once

#include <stdexcept>
#include <string>

namespace espresso {

class BuildError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ParseError : public BuildError {
public:
  using BuildError::BuildError;
};

class MalformedPathError : public BuildError {
public:
  using BuildError::BuildError;
};

class RouteNotFoundError : public BuildError {
public:
  explicit RouteNotFoundError(const std::string &path)
      : BuildError("Route not found: '" + path + "'"), path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

class UnresolvedLinkError : public BuildError {
public:
  using BuildError::BuildError;
};

} // namespace espresso
