#include "extensions/imposter/fields.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace Imposter {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// Adds value under name, turning the entry into an array on repeats.
void appendValue(Json& mapping, const std::string& name, std::string value) {
  auto it = mapping.find(name);
  if (it == mapping.end()) {
    mapping[name] = std::move(value);
    return;
  }
  if (!it->is_array()) {
    Json first = std::move(*it);
    *it = Json::array();
    it->push_back(std::move(first));
  }
  it->push_back(std::move(value));
}

} // namespace

bool isMappingField(std::string_view field) {
  return field == kQueryField || field == kHeadersField || field == kFormField;
}

bool isScalarField(std::string_view field) {
  return field == kMethodField || field == kPathField || field == kBodyField ||
         field == kRequestFromField || field == kIpField;
}

std::string toLower(std::string_view value) {
  std::string lowered(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

std::string toFieldString(const Json& value) {
  switch (value.type()) {
  case Json::value_t::string:
    return value.get<std::string>();
  case Json::value_t::number_float: {
    double number = value.get<double>();
    if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < 1e15) {
      return std::to_string(static_cast<long long>(number));
    }
    return value.dump();
  }
  default:
    // Request bytes are not always valid UTF-8.
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
  }
}

FieldValue::Kind FieldValue::kind() const {
  if (value_ == nullptr) {
    return Kind::Absent;
  }
  if (value_->is_array()) {
    return Kind::Sequence;
  }
  if (value_->is_object()) {
    return Kind::Structured;
  }
  return Kind::Scalar;
}

std::string percentDecode(std::string_view value, bool plus_as_space) {
  std::string decoded;
  decoded.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+' && plus_as_space) {
      decoded.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && hexValue(value[i + 1]) >= 0 &&
               hexValue(value[i + 2]) >= 0) {
      decoded.push_back(static_cast<char>(hexValue(value[i + 1]) * 16 + hexValue(value[i + 2])));
      i += 2;
    } else {
      decoded.push_back(c);
    }
  }
  return decoded;
}

Json parseQueryString(std::string_view query) {
  Json params = Json::object();
  size_t start = 0;
  while (start <= query.size()) {
    size_t end = query.find('&', start);
    if (end == std::string_view::npos) {
      end = query.size();
    }
    std::string_view pair = query.substr(start, end - start);
    if (!pair.empty()) {
      size_t eq = pair.find('=');
      std::string_view name = pair.substr(0, eq);
      std::string_view value = eq == std::string_view::npos ? std::string_view() : pair.substr(eq + 1);
      appendValue(params, toLower(percentDecode(name, true)), percentDecode(value, true));
    }
    start = end + 1;
  }
  return params;
}

std::string addressFromPeer(std::string_view request_from) {
  if (!request_from.empty() && request_from.front() == '[') {
    size_t close = request_from.find(']');
    if (close != std::string_view::npos) {
      return std::string(request_from.substr(1, close - 1));
    }
  }
  size_t colon = request_from.rfind(':');
  // more than one colon and no brackets: a bare IPv6 address
  if (colon == std::string_view::npos || request_from.find(':') != colon) {
    return std::string(request_from);
  }
  return std::string(request_from.substr(0, colon));
}

bool expectsBody(const HeaderPairs& headers) {
  return std::any_of(headers.begin(), headers.end(), [](const auto& header) {
    std::string name = toLower(header.first);
    return (name == "content-length" && header.second != "0") || name == "transfer-encoding";
  });
}

Request::Request(std::string method, std::string_view url, const HeaderPairs& headers,
                 std::string body, std::string request_from)
    : method_(std::move(method)), body_(std::move(body)), query_(Json::object()),
      headers_(Json::object()) {
  size_t question = url.find('?');
  path_ = std::string(url.substr(0, question));
  if (question != std::string_view::npos) {
    size_t fragment = url.find('#', question);
    query_ = parseQueryString(url.substr(question + 1, fragment == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : fragment - question - 1));
  }

  for (const auto& header : headers) {
    appendValue(headers_, toLower(header.first), header.second);
  }

  ip_ = addressFromPeer(request_from);
  request_from_ = std::move(request_from);

  auto content_type = header(kContentTypeHeader);
  if (content_type && toLower(*content_type).find(kFormContentType) != std::string::npos) {
    form_ = parseQueryString(this->body());
  }
}

const std::optional<Json>& Request::jsonBody() const {
  if (!json_body_parsed_) {
    json_body_parsed_ = true;
    if (!body().empty()) {
      Json parsed = Json::parse(body(), nullptr, false);
      if (!parsed.is_discarded()) {
        json_body_ = std::move(parsed);
      }
    }
  }
  return json_body_;
}

FieldValue Request::field(std::string_view name) const {
  if (name == kMethodField) {
    return FieldValue(&method_);
  }
  if (name == kPathField) {
    return FieldValue(&path_);
  }
  if (name == kBodyField) {
    return FieldValue(&body_);
  }
  if (name == kQueryField) {
    return FieldValue(&query_);
  }
  if (name == kHeadersField) {
    return FieldValue(&headers_);
  }
  if (name == kFormField) {
    return form_ ? FieldValue(&*form_) : FieldValue();
  }
  if (name == kRequestFromField) {
    return FieldValue(&request_from_);
  }
  if (name == kIpField) {
    return FieldValue(&ip_);
  }
  return FieldValue();
}

FieldValue Request::field(std::string_view name, std::string_view key) const {
  FieldValue mapping = field(name);
  if (mapping.kind() != FieldValue::Kind::Structured) {
    return FieldValue();
  }
  auto it = mapping.json().find(std::string(key));
  if (it == mapping.json().end()) {
    return FieldValue();
  }
  return FieldValue(&*it);
}

std::optional<std::string_view> Request::header(std::string_view name) const {
  auto it = headers_.find(toLower(name));
  if (it == headers_.end()) {
    return {};
  }
  const Json& value = it->is_array() ? it->front() : *it;
  return std::string_view(value.get_ref<const std::string&>());
}

} // namespace Imposter
