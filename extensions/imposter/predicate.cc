#include "extensions/imposter/predicate.h"

#include <utility>

#include "extensions/imposter/errors.h"

namespace Imposter {

namespace {

struct TypeName {
  PredicateType type;
  std::string_view name;
};

constexpr TypeName kTypeNames[] = {
    {PredicateType::Equals, "equals"},         {PredicateType::DeepEquals, "deepEquals"},
    {PredicateType::Contains, "contains"},     {PredicateType::StartsWith, "startsWith"},
    {PredicateType::EndsWith, "endsWith"},     {PredicateType::Matches, "matches"},
    {PredicateType::Exists, "exists"},         {PredicateType::And, "and"},
    {PredicateType::Or, "or"},                 {PredicateType::Not, "not"},
};

std::shared_ptr<const re2::RE2> compileRegex(const std::string& source, bool case_sensitive,
                                             std::string_view context) {
  auto regex = std::make_shared<const re2::RE2>(source, regexOptions(case_sensitive));
  if (!regex->ok()) {
    throw PredicateError("invalid regex '" + source + "' in " + std::string(context) + ": " +
                         regex->error());
  }
  return regex;
}

void collectPatterns(const Json& value, Predicate& predicate) {
  if (value.is_object() || value.is_array()) {
    for (const auto& child : value) {
      collectPatterns(child, predicate);
    }
    return;
  }
  std::string source = toFieldString(value);
  if (predicate.patterns.count(source) == 0) {
    predicate.patterns.emplace(source,
                               compileRegex(source, predicate.modifiers.case_sensitive, "matches"));
  }
}

Modifiers parseModifiers(const Json& object) {
  Modifiers modifiers;

  auto case_sensitive = object.find("caseSensitive");
  if (case_sensitive != object.end()) {
    if (!case_sensitive->is_boolean()) {
      throw PredicateError("caseSensitive must be a boolean");
    }
    modifiers.case_sensitive = case_sensitive->get<bool>();
  }

  auto except = object.find("except");
  if (except != object.end()) {
    if (!except->is_string()) {
      throw PredicateError("except must be a string");
    }
    const auto& pattern = except->get_ref<const std::string&>();
    if (!pattern.empty()) {
      modifiers.except = compileRegex(pattern, modifiers.case_sensitive, "except");
    }
  }

  auto jsonpath = object.find("jsonpath");
  if (jsonpath != object.end()) {
    auto selector = jsonpath->is_object() ? jsonpath->find("selector") : jsonpath->end();
    if (!jsonpath->is_object() || selector == jsonpath->end() || !selector->is_string()) {
      throw PredicateError("jsonpath must be an object with a string selector");
    }
    modifiers.jsonpath = std::make_shared<const JsonPath>(selector->get<std::string>());
  }

  auto xpath = object.find("xpath");
  if (xpath != object.end()) {
    auto selector = xpath->is_object() ? xpath->find("selector") : xpath->end();
    if (!xpath->is_object() || selector == xpath->end() || !selector->is_string()) {
      throw PredicateError("xpath must be an object with a string selector");
    }
    XmlNamespaces namespaces;
    auto ns = xpath->find("ns");
    if (ns != xpath->end()) {
      if (!ns->is_object()) {
        throw PredicateError("xpath ns must map prefixes to namespace URIs");
      }
      for (const auto& entry : ns->items()) {
        if (!entry.value().is_string()) {
          throw PredicateError("xpath namespace '" + entry.key() + "' must be a string");
        }
        namespaces.emplace_back(entry.key(), entry.value().get<std::string>());
      }
    }
    modifiers.xpath =
        std::make_shared<const XPathSelector>(selector->get<std::string>(), std::move(namespaces));
  }

  return modifiers;
}

std::shared_ptr<Predicate> parseTyped(PredicateType type, const Json& value,
                                      const Modifiers& modifiers) {
  auto predicate = std::make_shared<Predicate>();
  predicate->type = type;
  predicate->modifiers = modifiers;

  switch (type) {
  case PredicateType::And:
  case PredicateType::Or:
    if (!value.is_array()) {
      throw PredicateError(std::string(predicateTypeName(type)) + " expects an array of predicates");
    }
    for (const auto& child : value) {
      predicate->children.push_back(parsePredicate(child));
    }
    break;
  case PredicateType::Not:
    if (!value.is_object()) {
      throw PredicateError("not expects a single predicate object");
    }
    predicate->children.push_back(parsePredicate(value));
    break;
  default:
    if (!value.is_object()) {
      throw PredicateError(std::string(predicateTypeName(type)) +
                           " expects an object of request fields");
    }
    predicate->fields = value;
    if (type == PredicateType::Matches) {
      collectPatterns(value, *predicate);
    }
    break;
  }
  return predicate;
}

} // namespace

std::optional<PredicateType> predicateTypeFromKey(std::string_view key) {
  for (const auto& entry : kTypeNames) {
    if (entry.name == key) {
      return entry.type;
    }
  }
  return {};
}

std::string_view predicateTypeName(PredicateType type) {
  for (const auto& entry : kTypeNames) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

re2::RE2::Options regexOptions(bool case_sensitive) {
  re2::RE2::Options options;
  options.set_log_errors(false);
  options.set_case_sensitive(case_sensitive);
  return options;
}

const re2::RE2* Predicate::pattern(const std::string& source) const {
  auto it = patterns.find(source);
  return it == patterns.end() ? nullptr : it->second.get();
}

PredicatePtr parsePredicate(const Json& object) {
  if (!object.is_object()) {
    throw PredicateError("predicate must be an object, got " + object.dump());
  }

  Modifiers modifiers = parseModifiers(object);
  std::shared_ptr<Predicate> active;
  PredicateList shadowed;

  // Only the first type key counts; later ones are still validated.
  for (const auto& item : object.items()) {
    if (item.key() == "inject") {
      throw PredicateError("inject predicates are not supported");
    }
    auto type = predicateTypeFromKey(item.key());
    if (!type) {
      continue;
    }
    auto parsed = parseTyped(*type, item.value(), modifiers);
    if (!active) {
      active = std::move(parsed);
    } else {
      shadowed.push_back(std::move(parsed));
    }
  }

  if (!active) {
    throw PredicateError("missing predicate type in " + object.dump());
  }
  active->shadowed = std::move(shadowed);
  return active;
}

PredicateList parsePredicates(const Json& definition) {
  const Json* predicates = &definition;
  if (definition.is_object()) {
    auto it = definition.find("predicates");
    if (it == definition.end()) {
      return {};
    }
    predicates = &*it;
  }
  if (predicates->is_null()) {
    return {};
  }
  if (!predicates->is_array()) {
    throw PredicateError("predicates must be an array");
  }

  PredicateList parsed;
  parsed.reserve(predicates->size());
  for (const auto& object : *predicates) {
    parsed.push_back(parsePredicate(object));
  }
  return parsed;
}

} // namespace Imposter
