#include "extensions/imposter/matcher.h"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "extensions/imposter/errors.h"

namespace Imposter {

namespace {

inline char foldChar(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// `lowered` is already folded.
bool foldedEquals(std::string_view text, std::string_view lowered) {
  if (text.size() != lowered.size()) {
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    if (foldChar(text[i]) != lowered[i]) {
      return false;
    }
  }
  return true;
}

class ExactMatcher : public StringMatcher {
public:
  ExactMatcher(const std::string& exact, bool case_sensitive)
      : exact_(case_sensitive ? exact : toLower(exact)), case_sensitive_(case_sensitive) {}

  bool matches(std::string_view text) const override {
    return case_sensitive_ ? exact_ == text : foldedEquals(text, exact_);
  }

private:
  std::string exact_;
  bool case_sensitive_;
};

class PrefixMatcher : public StringMatcher {
public:
  PrefixMatcher(const std::string& prefix, bool case_sensitive)
      : prefix_(case_sensitive ? prefix : toLower(prefix)), case_sensitive_(case_sensitive) {}

  bool matches(std::string_view text) const override {
    if (text.size() < prefix_.size()) {
      return false;
    }
    std::string_view head = text.substr(0, prefix_.size());
    return case_sensitive_ ? memcmp(head.data(), prefix_.data(), prefix_.size()) == 0
                           : foldedEquals(head, prefix_);
  }

private:
  std::string prefix_;
  bool case_sensitive_;
};

class SuffixMatcher : public StringMatcher {
public:
  SuffixMatcher(const std::string& suffix, bool case_sensitive)
      : suffix_(case_sensitive ? suffix : toLower(suffix)), case_sensitive_(case_sensitive) {}

  bool matches(std::string_view text) const override {
    if (text.size() < suffix_.size()) {
      return false;
    }
    std::string_view tail = text.substr(text.size() - suffix_.size());
    return case_sensitive_ ? memcmp(tail.data(), suffix_.data(), suffix_.size()) == 0
                           : foldedEquals(tail, suffix_);
  }

private:
  std::string suffix_;
  bool case_sensitive_;
};

class ContainsMatcher : public StringMatcher {
public:
  ContainsMatcher(const std::string& needle, bool case_sensitive)
      : needle_(case_sensitive ? needle : toLower(needle)), case_sensitive_(case_sensitive) {}

  bool matches(std::string_view text) const override {
    if (case_sensitive_) {
      return text.find(needle_) != std::string_view::npos;
    }
    return std::search(text.begin(), text.end(), needle_.begin(), needle_.end(),
                       [](char a, char b) { return foldChar(a) == b; }) != text.end() ||
           needle_.empty();
  }

private:
  std::string needle_;
  bool case_sensitive_;
};

bool isIdentical(const std::string& target, bool case_sensitive, const std::string& other_target,
                 bool other_case_sensitive) {
  return case_sensitive == other_case_sensitive && target == other_target;
}

} // namespace

StringMatcherPtr newMatcher(PredicateType type, const std::string& target, bool case_sensitive) {
  switch (type) {
  case PredicateType::Equals:
    return std::make_unique<ExactMatcher>(target, case_sensitive);
  case PredicateType::StartsWith:
    return std::make_unique<PrefixMatcher>(target, case_sensitive);
  case PredicateType::EndsWith:
    return std::make_unique<SuffixMatcher>(target, case_sensitive);
  case PredicateType::Contains:
    return std::make_unique<ContainsMatcher>(target, case_sensitive);
  default:
    throw PredicateError("no literal matcher for " + std::string(predicateTypeName(type)));
  }
}

RegexSetMatcher::RegexSetMatcher() : set_(regexOptions(true), re2::RE2::UNANCHORED) {}

void RegexSetMatcher::add(const std::string& pattern, bool case_sensitive) {
  std::string error;
  std::string source = case_sensitive ? pattern : "(?i:" + pattern + ")";
  if (set_.Add(re2::StringPiece(source.data(), source.size()), &error) < 0) {
    throw PredicateError("invalid regex '" + pattern + "': " + error);
  }
  patterns_.push_back(std::make_unique<const re2::RE2>(pattern, regexOptions(case_sensitive)));
}

void RegexSetMatcher::compile() {
  if (!set_.Compile()) {
    throw PredicateError("regex set does not fit in memory");
  }
}

void RegexSetMatcher::collect(std::string_view text, std::vector<bool>& matched) const {
  re2::StringPiece input(text.data(), text.size());
  std::vector<int> hits;
  re2::RE2::Set::ErrorInfo error_info{re2::RE2::Set::kNoError};
  if (set_.Match(input, &hits, &error_info)) {
    for (int hit : hits) {
      matched[static_cast<size_t>(hit)] = true;
    }
    return;
  }
  if (error_info.kind == re2::RE2::Set::kNoError) {
    return;
  }
  for (size_t i = 0; i < patterns_.size(); ++i) {
    if (!matched[i] && re2::RE2::PartialMatch(input, *patterns_[i])) {
      matched[i] = true;
    }
  }
}

FieldGroup::FieldGroup(FieldKey key)
    : key_(std::move(key)), multi_valued_(key_.key || !isScalarField(key_.field)) {}

FieldGroup::AddResult FieldGroup::addSingle(std::optional<Literal>& slot, PredicateType type,
                                            const std::string& target, bool case_sensitive) {
  if (!slot) {
    slot = Literal{target, case_sensitive, newMatcher(type, target, case_sensitive)};
    return AddResult::Added;
  }
  if (isIdentical(slot->target, slot->case_sensitive, target, case_sensitive)) {
    return AddResult::Folded;
  }
  // Only a single-valued field can never equal two different strings.
  if (type == PredicateType::Equals && !multi_valued_ && slot->case_sensitive && case_sensitive) {
    return AddResult::Conflict;
  }
  return AddResult::Deferred;
}

FieldGroup::AddResult FieldGroup::add(PredicateType type, const std::string& target,
                                      bool case_sensitive) {
  switch (type) {
  case PredicateType::Equals:
    return addSingle(equals_, type, target, case_sensitive);
  case PredicateType::StartsWith:
    return addSingle(starts_with_, type, target, case_sensitive);
  case PredicateType::EndsWith:
    return addSingle(ends_with_, type, target, case_sensitive);
  case PredicateType::Contains:
    for (const auto& literal : contains_) {
      if (isIdentical(literal.target, literal.case_sensitive, target, case_sensitive)) {
        return AddResult::Folded;
      }
    }
    contains_.push_back(Literal{target, case_sensitive, newMatcher(type, target, case_sensitive)});
    return AddResult::Added;
  case PredicateType::Matches:
    for (const auto& pattern : patterns_) {
      if (isIdentical(pattern.first, pattern.second, target, case_sensitive)) {
        return AddResult::Folded;
      }
    }
    patterns_.emplace_back(target, case_sensitive);
    return AddResult::Added;
  default:
    return AddResult::Deferred;
  }
}

void FieldGroup::compile() {
  if (patterns_.empty()) {
    regex_set_.reset();
    return;
  }
  auto regex_set = std::make_unique<RegexSetMatcher>();
  for (const auto& pattern : patterns_) {
    regex_set->add(pattern.first, pattern.second);
  }
  regex_set->compile();
  regex_set_ = std::move(regex_set);
}

bool FieldGroup::active() const {
  return equals_ || starts_with_ || ends_with_ || !contains_.empty() || !patterns_.empty();
}

size_t FieldGroup::cost() const {
  size_t cost = (equals_ ? 1 : 0) + (starts_with_ ? 1 : 0) + (ends_with_ ? 1 : 0);
  cost += 2 * contains_.size();
  if (!patterns_.empty()) {
    cost += 8;
  }
  if (key_.field == kBodyField) {
    cost *= 4;
  }
  return cost;
}

bool FieldGroup::anyValue(const std::vector<std::string>& values, const StringMatcher& matcher) {
  return std::any_of(values.begin(), values.end(),
                     [&](const std::string& value) { return matcher.matches(value); });
}

bool FieldGroup::matches(const Request& request) const {
  if (!key_.key) {
    return matches(request.field(key_.field));
  }
  return matches(request.field(key_.field, *key_.key));
}

bool FieldGroup::matches(const FieldValue& value) const {
  if (!active()) {
    return true;
  }
  if (value.absent()) {
    return false;
  }

  std::vector<std::string> values;
  if (value.kind() == FieldValue::Kind::Sequence) {
    values.reserve(value.json().size());
    for (const auto& element : value.json()) {
      values.push_back(toFieldString(element));
    }
  } else {
    values.push_back(toFieldString(value.json()));
  }

  for (const auto* slot : {&equals_, &starts_with_, &ends_with_}) {
    if (*slot && !anyValue(values, *(*slot)->matcher)) {
      return false;
    }
  }
  for (const auto& literal : contains_) {
    if (!anyValue(values, *literal.matcher)) {
      return false;
    }
  }

  if (regex_set_) {
    std::vector<bool> matched(regex_set_->size(), false);
    for (const auto& text : values) {
      regex_set_->collect(text, matched);
    }
    return std::all_of(matched.begin(), matched.end(), [](bool hit) { return hit; });
  }
  return true;
}

} // namespace Imposter
