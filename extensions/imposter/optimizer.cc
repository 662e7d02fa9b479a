#include "extensions/imposter/optimizer.h"

#include <algorithm>

#include "extensions/imposter/evaluator.h"

namespace Imposter {

namespace {

struct Target {
  FieldKey key;
  std::string value;
};

bool isBatchableType(PredicateType type) {
  switch (type) {
  case PredicateType::Equals:
  case PredicateType::Contains:
  case PredicateType::StartsWith:
  case PredicateType::EndsWith:
  case PredicateType::Matches:
    return true;
  default:
    return false;
  }
}

bool isScalarJson(const Json& value) { return !value.is_object() && !value.is_array(); }

void flatten(const PredicateList& predicates, PredicateList& leaves) {
  for (const auto& predicate : predicates) {
    if (predicate->type == PredicateType::And) {
      flatten(predicate->children, leaves);
    } else {
      leaves.push_back(predicate);
    }
  }
}

// Splits a leaf into one target per field, or returns false when any part
// of it has to be interpreted.
bool collectTargets(const Predicate& leaf, std::vector<Target>& targets) {
  if (!isBatchableType(leaf.type) || leaf.modifiers.hasExcept() || leaf.modifiers.hasSelector()) {
    return false;
  }
  for (auto it = leaf.fields.begin(); it != leaf.fields.end(); ++it) {
    const std::string& field = it.key();
    const Json& expected = *it;
    if (isScalarField(field)) {
      if (!isScalarJson(expected)) {
        return false;
      }
      targets.push_back({FieldKey{field}, toFieldString(expected)});
    } else if (isMappingField(field)) {
      // An empty mapping still requires the field itself to be present.
      if (!expected.is_object() || expected.empty()) {
        return false;
      }
      for (auto entry = expected.begin(); entry != expected.end(); ++entry) {
        if (!isScalarJson(*entry)) {
          return false;
        }
        targets.push_back({FieldKey{field, toLower(entry.key())}, toFieldString(*entry)});
      }
    } else {
      return false;
    }
  }
  return true;
}

FieldGroup& groupFor(std::vector<FieldGroup>& groups, const FieldKey& key) {
  auto it = std::find_if(groups.begin(), groups.end(),
                         [&](const FieldGroup& group) { return group.key() == key; });
  if (it != groups.end()) {
    return *it;
  }
  groups.emplace_back(key);
  return groups.back();
}

} // namespace

CompiledPredicate compile(PredicateList predicates) {
  CompiledPredicate compiled;
  compiled.source_ = std::move(predicates);

  PredicateList leaves;
  flatten(compiled.source_, leaves);

  for (const auto& leaf : leaves) {
    std::vector<Target> targets;
    if (!collectTargets(*leaf, targets)) {
      compiled.residual_.push_back(leaf);
      continue;
    }

    bool deferred = false;
    for (const auto& target : targets) {
      auto& group = groupFor(compiled.groups_, target.key);
      switch (group.add(leaf->type, target.value, leaf->modifiers.case_sensitive)) {
      case FieldGroup::AddResult::Conflict:
        compiled.unsatisfiable_ = true;
        break;
      case FieldGroup::AddResult::Deferred:
        deferred = true;
        break;
      default:
        break;
      }
    }
    if (deferred) {
      compiled.residual_.push_back(leaf);
    }
  }

  for (auto& group : compiled.groups_) {
    group.compile();
  }
  std::stable_sort(compiled.groups_.begin(), compiled.groups_.end(),
                   [](const FieldGroup& a, const FieldGroup& b) { return a.cost() < b.cost(); });
  return compiled;
}

CompiledPredicate compilePredicates(const Json& definition) {
  return compile(parsePredicates(definition));
}

bool CompiledPredicate::matches(const Request& request) const {
  if (unsatisfiable_) {
    return false;
  }
  for (const auto& group : groups_) {
    if (group.active() && !group.matches(request)) {
      return false;
    }
  }
  return std::all_of(residual_.begin(), residual_.end(),
                     [&](const PredicatePtr& node) { return evaluate(*node, request); });
}

bool CompiledPredicate::matchesReference(const Request& request) const {
  return evaluateAll(source_, request);
}

} // namespace Imposter
