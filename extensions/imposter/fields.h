#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

namespace Imposter {

// Predicate definitions keep their key order, so every JSON value in the
// engine uses the insertion-ordered flavour.
using Json = nlohmann::ordered_json;

using HeaderPairs = std::vector<std::pair<std::string, std::string>>;

constexpr std::string_view kMethodField = "method";
constexpr std::string_view kPathField = "path";
constexpr std::string_view kQueryField = "query";
constexpr std::string_view kHeadersField = "headers";
constexpr std::string_view kBodyField = "body";
constexpr std::string_view kFormField = "form";
constexpr std::string_view kRequestFromField = "requestFrom";
constexpr std::string_view kIpField = "ip";

constexpr std::string_view kContentTypeHeader = "content-type";
constexpr std::string_view kFormContentType = "application/x-www-form-urlencoded";

// True for fields whose value is a name -> value mapping.
bool isMappingField(std::string_view field);
// True for fields whose value is a single string.
bool isScalarField(std::string_view field);

std::string toLower(std::string_view value);

// Canonical string form of a JSON scalar: strings as-is, integral numbers
// without a fraction, booleans and null as their literal names. Objects and
// arrays become compact JSON text, with invalid UTF-8 replaced by U+FFFD.
std::string toFieldString(const Json& value);

// A read-only view of one request field.
class FieldValue {
public:
  enum class Kind { Absent, Scalar, Sequence, Structured };

  FieldValue() = default;
  explicit FieldValue(const Json* value) : value_(value) {}

  Kind kind() const;
  bool absent() const { return value_ == nullptr; }
  const Json& json() const { return *value_; }
  const Json* get() const { return value_; }

private:
  const Json* value_ = nullptr;
};

// Request is the normalized field model a predicate is evaluated against.
// The query string and form body are parsed here; the JSON body on demand.
class Request {
public:
  Request(std::string method, std::string_view url, const HeaderPairs& headers,
          std::string body, std::string request_from = "");

  const std::string& method() const { return method_.get_ref<const std::string&>(); }
  const std::string& path() const { return path_.get_ref<const std::string&>(); }
  const std::string& body() const { return body_.get_ref<const std::string&>(); }
  const std::string& requestFrom() const { return request_from_.get_ref<const std::string&>(); }
  const std::string& ip() const { return ip_.get_ref<const std::string&>(); }

  const Json& query() const { return query_; }
  const Json& headers() const { return headers_; }
  const std::optional<Json>& form() const { return form_; }

  // Body parsed as JSON, or nullopt when it is not JSON. Parsed on first use.
  const std::optional<Json>& jsonBody() const;

  // Whole field by predicate name (absent for unknown names).
  FieldValue field(std::string_view name) const;
  // One entry of a mapping field. The key must already be lower-cased.
  FieldValue field(std::string_view name, std::string_view key) const;

  // Single header value, first one when repeated.
  std::optional<std::string_view> header(std::string_view name) const;

private:
  Json method_;
  Json path_;
  Json body_;
  Json request_from_;
  Json ip_;
  Json query_;
  Json headers_;
  std::optional<Json> form_;
  mutable bool json_body_parsed_ = false;
  mutable std::optional<Json> json_body_;
};

// Decodes "a=1&b=x%20y&a=2" into {"a": ["1", "2"], "b": "x y"}. Names are
// lower-cased; repeated names collect into an array in arrival order.
Json parseQueryString(std::string_view query);

std::string percentDecode(std::string_view value, bool plus_as_space);

// True when the headers announce a body through a non-zero content-length or a
// transfer-encoding. Any other request ends with its headers, whatever the
// method.
bool expectsBody(const HeaderPairs& headers);

// "10.0.0.1:5000" -> "10.0.0.1", "[::1]:80" -> "::1".
std::string addressFromPeer(std::string_view request_from);

} // namespace Imposter
