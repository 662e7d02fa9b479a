#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "re2/re2.h"
#include "re2/set.h"

#include "extensions/imposter/fields.h"
#include "extensions/imposter/predicate.h"

namespace Imposter {

class StringMatcher {
public:
  virtual ~StringMatcher() = default;
  virtual bool matches(std::string_view s) const = 0;
};
using StringMatcherPtr = std::unique_ptr<StringMatcher>;

// Literal matcher for equals, startsWith, endsWith or contains. A
// case-insensitive matcher folds ASCII letters of the input on the fly.
StringMatcherPtr newMatcher(PredicateType type, const std::string& target, bool case_sensitive);

// All `matches` patterns of one field, searched in a single pass.
class RegexSetMatcher {
public:
  RegexSetMatcher();

  // Throws PredicateError if the pattern does not compile.
  void add(const std::string& pattern, bool case_sensitive);
  void compile();

  size_t size() const { return patterns_.size(); }

  // Marks every pattern that matches somewhere in `text`.
  void collect(std::string_view text, std::vector<bool>& matched) const;

private:
  re2::RE2::Set set_;
  // Used one by one when the set's DFA runs out of memory.
  std::vector<std::unique_ptr<const re2::RE2>> patterns_;
};

// Identifies a request field, or one entry of a mapping field. An entry name
// may be empty ("?=x" has one).
struct FieldKey {
  std::string field;
  std::optional<std::string> key;

  std::string toString() const { return key ? field + "." + *key : field; }
  bool operator==(const FieldKey& other) const {
    return field == other.field && key == other.key;
  }
};

// Every batchable target the leaves of one stub put on a single field.
class FieldGroup {
public:
  enum class AddResult {
    Added,
    // Identical to a target already present.
    Folded,
    // No value can satisfy both targets.
    Conflict,
    // Cannot be merged; the caller evaluates the leaf itself.
    Deferred,
  };

  explicit FieldGroup(FieldKey key);

  AddResult add(PredicateType type, const std::string& target, bool case_sensitive);

  // Builds the regex set. Must be called once after the last add().
  void compile();

  const FieldKey& key() const { return key_; }
  bool active() const;
  size_t cost() const;

  bool matches(const Request& request) const;
  bool matches(const FieldValue& value) const;

private:
  struct Literal {
    std::string target;
    bool case_sensitive;
    StringMatcherPtr matcher;
  };

  AddResult addSingle(std::optional<Literal>& slot, PredicateType type, const std::string& target,
                      bool case_sensitive);
  static bool anyValue(const std::vector<std::string>& values, const StringMatcher& matcher);

  FieldKey key_;
  bool multi_valued_;
  std::optional<Literal> equals_;
  std::optional<Literal> starts_with_;
  std::optional<Literal> ends_with_;
  std::vector<Literal> contains_;
  std::vector<std::pair<std::string, bool>> patterns_;
  std::unique_ptr<RegexSetMatcher> regex_set_;
};

} // namespace Imposter
