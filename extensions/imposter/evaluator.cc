#include "extensions/imposter/evaluator.h"

#include <algorithm>

namespace Imposter {

namespace {

struct Comparison {
  const Predicate& predicate;
  bool fold_values;
  bool fold_keys;
};

// The request-side value a leaf compares against, after except and
// selector processing.
struct Actual {
  bool failed = false;
  std::optional<Json> owned;
  const Json* value = nullptr;

  void own(Json json) {
    owned = std::move(json);
    value = &*owned;
  }
};

std::string fold(std::string value, bool lower) { return lower ? toLower(value) : value; }

bool isTruthy(const Json& value) {
  switch (value.type()) {
  case Json::value_t::boolean:
    return value.get<bool>();
  case Json::value_t::string:
    return !value.get_ref<const std::string&>().empty();
  case Json::value_t::number_integer:
  case Json::value_t::number_unsigned:
  case Json::value_t::number_float:
    return value.get<double>() != 0;
  case Json::value_t::null:
    return false;
  default:
    return true;
  }
}

bool isEmptyValue(const Json& value) {
  if (value.is_null()) {
    return true;
  }
  if (value.is_string()) {
    return value.get_ref<const std::string&>().empty();
  }
  if (value.is_array() || value.is_object()) {
    return value.empty();
  }
  return false;
}

const Json* findKey(const Json& mapping, const std::string& key, bool fold_keys) {
  if (!fold_keys) {
    auto it = mapping.find(key);
    return it == mapping.end() ? nullptr : &*it;
  }
  std::string wanted = toLower(key);
  for (auto it = mapping.begin(); it != mapping.end(); ++it) {
    if (toLower(it.key()) == wanted) {
      return &*it;
    }
  }
  return nullptr;
}

void stripAll(Json& value, const re2::RE2& except) {
  if (value.is_string()) {
    re2::RE2::GlobalReplace(&value.get_ref<std::string&>(), except, "");
  } else if (value.is_array() || value.is_object()) {
    for (auto& child : value) {
      stripAll(child, except);
    }
  }
}

void resolve(const Predicate& predicate, const std::string& field, const Json& expected,
             const Request& request, Actual& actual) {
  const Modifiers& modifiers = predicate.modifiers;

  if (field == kBodyField) {
    std::string text = request.body();
    if (modifiers.hasExcept()) {
      re2::RE2::GlobalReplace(&text, *modifiers.except, "");
    }

    // jsonpath wins outright; a failed jsonpath never falls back to xpath
    if (modifiers.jsonpath || modifiers.xpath) {
      auto selected =
          modifiers.jsonpath ? modifiers.jsonpath->selectText(text) : modifiers.xpath->select(text);
      if (!selected) {
        actual.failed = true;
        return;
      }
      actual.own(std::move(*selected));
      return;
    }

    if (expected.is_object() || expected.is_array()) {
      if (!modifiers.hasExcept()) {
        if (request.jsonBody()) {
          actual.value = &*request.jsonBody();
        }
        return;
      }
      Json parsed = Json::parse(text, nullptr, false);
      if (!parsed.is_discarded()) {
        actual.own(std::move(parsed));
      }
      return;
    }

    actual.own(Json(std::move(text)));
    return;
  }

  FieldValue value = request.field(field);
  if (value.absent()) {
    return;
  }
  if (!modifiers.hasExcept()) {
    actual.value = value.get();
    return;
  }
  Json stripped = value.json();
  stripAll(stripped, *modifiers.except);
  actual.own(std::move(stripped));
}

bool compareStrings(PredicateType type, const std::string& expected, const std::string& actual,
                    const Comparison& cmp) {
  if (type == PredicateType::Matches) {
    const re2::RE2* regex = cmp.predicate.pattern(expected);
    return regex != nullptr && re2::RE2::PartialMatch(actual, *regex);
  }

  std::string want = fold(expected, cmp.fold_values);
  std::string have = fold(actual, cmp.fold_values);
  switch (type) {
  case PredicateType::Equals:
    return have == want;
  case PredicateType::Contains:
    return have.find(want) != std::string::npos;
  case PredicateType::StartsWith:
    return have.size() >= want.size() && have.compare(0, want.size(), want) == 0;
  case PredicateType::EndsWith:
    return have.size() >= want.size() &&
           have.compare(have.size() - want.size(), want.size(), want) == 0;
  default:
    return false;
  }
}

bool compare(PredicateType type, const Json& expected, const Json* actual, const Comparison& cmp) {
  if (actual == nullptr) {
    return false;
  }

  if (expected.is_object()) {
    if (!actual->is_object()) {
      return false;
    }
    for (auto it = expected.begin(); it != expected.end(); ++it) {
      if (!compare(type, *it, findKey(*actual, it.key(), cmp.fold_keys), cmp)) {
        return false;
      }
    }
    return true;
  }

  if (expected.is_array()) {
    for (const auto& wanted : expected) {
      bool found = false;
      if (actual->is_array()) {
        found = std::any_of(actual->begin(), actual->end(),
                            [&](const Json& have) { return compare(type, wanted, &have, cmp); });
      } else {
        found = compare(type, wanted, actual, cmp);
      }
      if (!found) {
        return false;
      }
    }
    return true;
  }

  if (actual->is_array()) {
    return std::any_of(actual->begin(), actual->end(),
                       [&](const Json& have) { return compare(type, expected, &have, cmp); });
  }
  return compareStrings(type, toFieldString(expected), toFieldString(*actual), cmp);
}

bool exists(const Json& expected, const Json* actual, const Comparison& cmp) {
  if (expected.is_object()) {
    bool mapping = actual != nullptr && actual->is_object();
    for (auto it = expected.begin(); it != expected.end(); ++it) {
      const Json* child = mapping ? findKey(*actual, it.key(), cmp.fold_keys) : nullptr;
      if (!exists(*it, child, cmp)) {
        return false;
      }
    }
    return true;
  }

  // An empty string is the same as a missing field.
  bool present = actual != nullptr && !isEmptyValue(*actual);
  return isTruthy(expected) == present;
}

bool deepEquals(const Json& expected, const Json* actual, const Comparison& cmp) {
  if (actual == nullptr) {
    return false;
  }
  bool case_sensitive = !cmp.fold_values;
  return canonicalize(expected, case_sensitive, cmp.fold_keys) ==
         canonicalize(*actual, case_sensitive, cmp.fold_keys);
}

bool evaluateLeaf(const Predicate& predicate, const Request& request) {
  for (auto it = predicate.fields.begin(); it != predicate.fields.end(); ++it) {
    const std::string& field = it.key();
    bool case_sensitive = predicate.modifiers.case_sensitive;
    Comparison cmp{predicate, !case_sensitive, isMappingField(field) || !case_sensitive};

    Actual actual;
    resolve(predicate, field, *it, request, actual);
    if (actual.failed) {
      return false;
    }

    bool matched = false;
    switch (predicate.type) {
    case PredicateType::Exists:
      matched = exists(*it, actual.value, cmp);
      break;
    case PredicateType::DeepEquals:
      matched = deepEquals(*it, actual.value, cmp);
      break;
    default:
      matched = compare(predicate.type, *it, actual.value, cmp);
      break;
    }
    if (!matched) {
      return false;
    }
  }
  return true;
}

} // namespace

nlohmann::json canonicalize(const Json& value, bool case_sensitive, bool fold_keys) {
  if (value.is_object()) {
    nlohmann::json canonical = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      canonical[fold_keys ? toLower(it.key()) : it.key()] =
          canonicalize(*it, case_sensitive, fold_keys);
    }
    return canonical;
  }
  if (value.is_array()) {
    std::vector<std::pair<std::string, nlohmann::json>> items;
    items.reserve(value.size());
    for (const auto& item : value) {
      nlohmann::json canonical = canonicalize(item, case_sensitive, fold_keys);
      std::string key = canonical.is_string()
                            ? canonical.get<std::string>()
                            : canonical.dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace);
      items.emplace_back(std::move(key), std::move(canonical));
    }
    std::stable_sort(items.begin(), items.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });
    nlohmann::json canonical = nlohmann::json::array();
    for (auto& item : items) {
      canonical.push_back(std::move(item.second));
    }
    return canonical;
  }
  return fold(toFieldString(value), !case_sensitive);
}

bool evaluate(const Predicate& predicate, const Request& request) {
  switch (predicate.type) {
  case PredicateType::And:
    return std::all_of(predicate.children.begin(), predicate.children.end(),
                       [&](const PredicatePtr& child) { return evaluate(*child, request); });
  case PredicateType::Or:
    return std::any_of(predicate.children.begin(), predicate.children.end(),
                       [&](const PredicatePtr& child) { return evaluate(*child, request); });
  case PredicateType::Not:
    return !predicate.children.empty() && !evaluate(*predicate.children.front(), request);
  default:
    return evaluateLeaf(predicate, request);
  }
}

bool evaluateAll(const PredicateList& predicates, const Request& request) {
  return std::all_of(predicates.begin(), predicates.end(),
                     [&](const PredicatePtr& predicate) { return evaluate(*predicate, request); });
}

} // namespace Imposter
