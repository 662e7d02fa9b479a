#pragma once

#include "extensions/imposter/fields.h"
#include "extensions/imposter/predicate.h"

namespace Imposter {

// Direct interpreter of a predicate tree. It is slow but always right, and
// the optimizer is checked against it. Never throws: anything that cannot be
// evaluated (missing fields, bodies that do not parse, failed selectors)
// makes the predicate false.
bool evaluate(const Predicate& predicate, const Request& request);

// Implicit AND over a stub's predicate array.
bool evaluateAll(const PredicateList& predicates, const Request& request);

// Canonical form used by deepEquals: scalars become (optionally lower-cased)
// strings, arrays are sorted by their canonical text, object keys are
// lower-cased when fold_keys is set.
nlohmann::json canonicalize(const Json& value, bool case_sensitive, bool fold_keys);

} // namespace Imposter
