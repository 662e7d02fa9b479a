#pragma once

#include <vector>

#include "extensions/imposter/fields.h"
#include "extensions/imposter/matcher.h"
#include "extensions/imposter/predicate.h"

namespace Imposter {

// A stub's predicate array after optimization.
//
// Batchable leaves of the top-level implicit AND are merged into per-field
// groups; everything else stays a residual node for the reference
// evaluator. A request matches when every active group and every residual
// node accepts it, which is exactly when the source predicates accept it.
class CompiledPredicate {
public:
  CompiledPredicate() = default;
  CompiledPredicate(CompiledPredicate&&) = default;
  CompiledPredicate& operator=(CompiledPredicate&&) = default;

  const PredicateList& source() const { return source_; }
  const std::vector<FieldGroup>& groups() const { return groups_; }
  const PredicateList& residual() const { return residual_; }
  bool unsatisfiable() const { return unsatisfiable_; }

  bool matches(const Request& request) const;
  // Ignores the groups and interprets the source predicates directly.
  bool matchesReference(const Request& request) const;

private:
  friend CompiledPredicate compile(PredicateList predicates);

  PredicateList source_;
  std::vector<FieldGroup> groups_;
  PredicateList residual_;
  bool unsatisfiable_ = false;
};

// Throws PredicateError if a regex cannot be added to a field's set.
CompiledPredicate compile(PredicateList predicates);

// parsePredicates() followed by compile().
CompiledPredicate compilePredicates(const Json& definition);

} // namespace Imposter
