#include "extensions/imposter/selectors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <libxml/xpathInternals.h>

#include "extensions/imposter/errors.h"

namespace Imposter {

namespace {

bool isNameChar(char c) { return c != '.' && c != '['; }

// Parses a string of digits, nullopt when it does not fit in a size_t.
std::optional<size_t> parseIndex(const std::string& digits) {
  size_t index = 0;
  for (char c : digits) {
    size_t digit = static_cast<size_t>(c - '0');
    if (index > (std::numeric_limits<size_t>::max() - digit) / 10) {
      return {};
    }
    index = index * 10 + digit;
  }
  return index;
}

// XPath string value of a number.
std::string numberToString(double number) {
  if (std::isnan(number)) {
    return "NaN";
  }
  if (std::isinf(number)) {
    return number > 0 ? "Infinity" : "-Infinity";
  }
  return toFieldString(Json(number));
}

void collectDescendants(const Json& node, const std::string& name, std::vector<const Json*>& out) {
  if (node.is_object()) {
    auto it = node.find(name);
    if (it != node.end()) {
      out.push_back(&*it);
    }
    for (const auto& child : node) {
      collectDescendants(child, name, out);
    }
  } else if (node.is_array()) {
    for (const auto& child : node) {
      collectDescendants(child, name, out);
    }
  }
}

void collectAll(const Json& node, std::vector<const Json*>& out) {
  if (!node.is_object() && !node.is_array()) {
    return;
  }
  for (const auto& child : node) {
    out.push_back(&child);
    collectAll(child, out);
  }
}

struct DocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
struct ContextDeleter {
  void operator()(xmlXPathContext* context) const { xmlXPathFreeContext(context); }
};
struct ObjectDeleter {
  void operator()(xmlXPathObject* object) const { xmlXPathFreeObject(object); }
};

std::string nodeString(xmlNode* node) {
  xmlChar* content = xmlNodeGetContent(node);
  if (content == nullptr) {
    return "";
  }
  std::string value(reinterpret_cast<const char*>(content));
  xmlFree(content);
  return value;
}

} // namespace

JsonPath::JsonPath(std::string_view expression) : expression_(expression) {
  std::string path(expression);
  if (path.empty() || path[0] != '$') {
    path = "$." + path;
  }

  size_t i = 1;
  auto fail = [&](const std::string& why) {
    throw PredicateError("invalid jsonpath selector '" + expression_ + "': " + why);
  };

  while (i < path.size()) {
    if (path.compare(i, 2, "..") == 0) {
      i += 2;
      if (i < path.size() && path[i] == '*') {
        steps_.push_back({Step::Kind::DescendantWildcard, "", 0});
        ++i;
        continue;
      }
      size_t start = i;
      while (i < path.size() && isNameChar(path[i])) {
        ++i;
      }
      if (start == i) {
        fail("expected a name after '..'");
      }
      steps_.push_back({Step::Kind::Descendant, path.substr(start, i - start), 0});
    } else if (path[i] == '.') {
      ++i;
      if (i < path.size() && path[i] == '*') {
        steps_.push_back({Step::Kind::Wildcard, "", 0});
        ++i;
        continue;
      }
      size_t start = i;
      while (i < path.size() && isNameChar(path[i])) {
        ++i;
      }
      if (start == i) {
        fail("expected a name after '.'");
      }
      steps_.push_back({Step::Kind::Child, path.substr(start, i - start), 0});
    } else if (path[i] == '[') {
      size_t close = path.find(']', i);
      if (close == std::string::npos) {
        fail("unterminated '['");
      }
      std::string inner = path.substr(i + 1, close - i - 1);
      if (inner == "*") {
        steps_.push_back({Step::Kind::Wildcard, "", 0});
      } else if (inner.size() >= 2 && (inner.front() == '\'' || inner.front() == '"') &&
                 inner.back() == inner.front()) {
        steps_.push_back({Step::Kind::Child, inner.substr(1, inner.size() - 2), 0});
      } else if (!inner.empty() && std::all_of(inner.begin(), inner.end(), [](unsigned char c) {
                   return std::isdigit(c) != 0;
                 })) {
        auto index = parseIndex(inner);
        if (index) {
          steps_.push_back({Step::Kind::Index, "", *index});
        } else {
          fail("index out of range [" + inner + "]");
        }
      } else {
        fail("unsupported subscript [" + inner + "]");
      }
      i = close + 1;
    } else {
      fail(std::string("unexpected character '") + path[i] + "'");
    }
  }
}

std::optional<Json> JsonPath::select(const Json& document) const {
  std::vector<const Json*> nodes{&document};
  for (const auto& step : steps_) {
    std::vector<const Json*> next;
    for (const Json* node : nodes) {
      switch (step.kind) {
      case Step::Kind::Child:
        if (node->is_object()) {
          auto it = node->find(step.name);
          if (it != node->end()) {
            next.push_back(&*it);
          }
        }
        break;
      case Step::Kind::Index:
        if (node->is_array() && step.index < node->size()) {
          next.push_back(&(*node)[step.index]);
        }
        break;
      case Step::Kind::Wildcard:
        if (node->is_object() || node->is_array()) {
          for (const auto& child : *node) {
            next.push_back(&child);
          }
        }
        break;
      case Step::Kind::Descendant:
        collectDescendants(*node, step.name, next);
        break;
      case Step::Kind::DescendantWildcard:
        collectAll(*node, next);
        break;
      }
    }
    nodes = std::move(next);
    if (nodes.empty()) {
      return {};
    }
  }

  if (nodes.size() == 1) {
    return *nodes.front();
  }
  Json selected = Json::array();
  for (const Json* node : nodes) {
    selected.push_back(*node);
  }
  return selected;
}

std::optional<Json> JsonPath::selectText(std::string_view text) const {
  Json document = Json::parse(text.begin(), text.end(), nullptr, false);
  if (document.is_discarded()) {
    return {};
  }
  return select(document);
}

void XPathSelector::CompiledDeleter::operator()(_xmlXPathCompExpr* compiled) const {
  xmlXPathFreeCompExpr(compiled);
}

XPathSelector::XPathSelector(std::string expression, XmlNamespaces namespaces)
    : expression_(std::move(expression)), namespaces_(std::move(namespaces)) {
  xmlInitParser();
  compiled_.reset(xmlXPathCompile(reinterpret_cast<const xmlChar*>(expression_.c_str())));
  if (!compiled_) {
    throw PredicateError("invalid xpath selector '" + expression_ + "'");
  }
}

std::optional<Json> XPathSelector::select(std::string_view xml) const {
  std::unique_ptr<xmlDoc, DocDeleter> doc(
      xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                    XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc) {
    return {};
  }
  std::unique_ptr<xmlXPathContext, ContextDeleter> context(xmlXPathNewContext(doc.get()));
  if (!context) {
    return {};
  }
  for (const auto& ns : namespaces_) {
    if (xmlXPathRegisterNs(context.get(), reinterpret_cast<const xmlChar*>(ns.first.c_str()),
                           reinterpret_cast<const xmlChar*>(ns.second.c_str())) != 0) {
      return {};
    }
  }

  std::unique_ptr<xmlXPathObject, ObjectDeleter> result(
      xmlXPathCompiledEval(compiled_.get(), context.get()));
  if (!result) {
    return {};
  }

  switch (result->type) {
  case XPATH_NODESET: {
    xmlNodeSet* nodes = result->nodesetval;
    if (nodes == nullptr || nodes->nodeNr == 0) {
      return {};
    }
    if (nodes->nodeNr == 1) {
      return Json(nodeString(nodes->nodeTab[0]));
    }
    Json values = Json::array();
    for (int i = 0; i < nodes->nodeNr; ++i) {
      values.push_back(nodeString(nodes->nodeTab[i]));
    }
    return values;
  }
  case XPATH_STRING:
    return Json(std::string(reinterpret_cast<const char*>(result->stringval)));
  case XPATH_NUMBER:
    return Json(numberToString(result->floatval));
  case XPATH_BOOLEAN:
    return Json(result->boolval ? "true" : "false");
  default:
    return {};
  }
}

} // namespace Imposter
