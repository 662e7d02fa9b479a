#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "re2/re2.h"

#include "extensions/imposter/fields.h"
#include "extensions/imposter/selectors.h"

namespace Imposter {

enum class PredicateType {
  Equals,
  DeepEquals,
  Contains,
  StartsWith,
  EndsWith,
  Matches,
  Exists,
  And,
  Or,
  Not,
};

std::optional<PredicateType> predicateTypeFromKey(std::string_view key);
std::string_view predicateTypeName(PredicateType type);

inline bool isCombinator(PredicateType type) {
  return type == PredicateType::And || type == PredicateType::Or || type == PredicateType::Not;
}

// Modifiers belong to exactly one predicate object. Combinators carry their
// own set, which their children never see.
struct Modifiers {
  bool case_sensitive = true;
  std::shared_ptr<const re2::RE2> except;
  std::shared_ptr<const JsonPath> jsonpath;
  std::shared_ptr<const XPathSelector> xpath;

  bool hasExcept() const { return except != nullptr; }
  bool hasSelector() const { return jsonpath != nullptr || xpath != nullptr; }
};

struct Predicate;
using PredicatePtr = std::shared_ptr<const Predicate>;
using PredicateList = std::vector<PredicatePtr>;

// One predicate object from a stub definition.
//
// Leaves keep their expected values as an ordered field -> value mapping.
// Combinators keep their children. Type keys that follow the active one in
// the same object are parsed into `shadowed` and never evaluated.
struct Predicate {
  PredicateType type;
  Json fields = Json::object();
  PredicateList children;
  Modifiers modifiers;
  PredicateList shadowed;

  // `matches` patterns found anywhere in `fields`, compiled with this
  // object's case sensitivity.
  std::unordered_map<std::string, std::shared_ptr<const re2::RE2>> patterns;

  const re2::RE2* pattern(const std::string& source) const;
};

// RE2 options every user-supplied pattern compiles with.
re2::RE2::Options regexOptions(bool case_sensitive);

// Parses one predicate object. Throws PredicateError.
PredicatePtr parsePredicate(const Json& object);

// Parses a stub's predicate array, or a {"predicates": [...]} wrapper.
PredicateList parsePredicates(const Json& definition);

} // namespace Imposter
