#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "extensions/imposter/fields.h"

struct _xmlXPathCompExpr;

namespace Imposter {

// JsonPath implements the selector subset stubs use in practice:
// $, .name, ['name'], [n], [*], .* and ..name.
class JsonPath {
public:
  // Throws PredicateError on a malformed expression.
  explicit JsonPath(std::string_view expression);

  // One match yields the value itself, several yield an array, none yields
  // nullopt.
  std::optional<Json> select(const Json& document) const;
  // Parses text first; nullopt when it is not JSON.
  std::optional<Json> selectText(std::string_view text) const;

  const std::string& expression() const { return expression_; }

private:
  struct Step {
    enum class Kind { Child, Index, Wildcard, Descendant, DescendantWildcard };
    Kind kind;
    std::string name;
    size_t index = 0;
  };

  std::string expression_;
  std::vector<Step> steps_;
};

using XmlNamespaces = std::vector<std::pair<std::string, std::string>>;

// XPathSelector evaluates an XPath 1.0 expression with libxml2. The
// expression is compiled once; each select() parses its own document.
class XPathSelector {
public:
  // Throws PredicateError when libxml2 rejects the expression.
  XPathSelector(std::string expression, XmlNamespaces namespaces);

  // Node sets yield the string value of each node (one node: a string,
  // several: an array). Strings, numbers and booleans yield a string.
  // Unparseable documents, evaluation errors and empty node sets yield nullopt.
  std::optional<Json> select(std::string_view xml) const;

  const std::string& expression() const { return expression_; }

private:
  struct CompiledDeleter {
    void operator()(_xmlXPathCompExpr* compiled) const;
  };

  std::string expression_;
  XmlNamespaces namespaces_;
  std::unique_ptr<_xmlXPathCompExpr, CompiledDeleter> compiled_;
};

} // namespace Imposter
