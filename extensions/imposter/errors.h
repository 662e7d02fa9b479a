#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace Imposter {

// Thrown while compiling a predicate definition (bad regex, unknown
// predicate type, malformed selector). Never thrown while matching.
class PredicateError : public std::runtime_error {
public:
  explicit PredicateError(const std::string& what) : std::runtime_error(what) {}
};

// Thrown by the imposter loader. Wraps PredicateError with the stub position.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what, std::optional<size_t> stub_index = {})
      : std::runtime_error(stub_index ? "stub " + std::to_string(*stub_index) + ": " + what : what),
        stub_index_(stub_index) {}

  const std::optional<size_t>& stubIndex() const { return stub_index_; }

private:
  std::optional<size_t> stub_index_;
};

} // namespace Imposter
