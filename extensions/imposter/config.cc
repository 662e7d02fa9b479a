#include "extensions/imposter/config.h"

#include "google/protobuf/util/json_util.h"

#include "extensions/imposter/errors.h"
#include "extensions/imposter/predicate.h"

namespace Imposter {

namespace {

constexpr uint32_t kDefaultStatusCode = 200;
constexpr std::string_view kJsonContentType = "application/json";

google::protobuf::util::JsonParseOptions responseParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.case_insensitive_enum_parsing = true;
  // Mountebank responses carry keys this engine does not model, such as
  // _behaviors and _mode.
  options.ignore_unknown_fields = true;
  return options;
}

std::string jsonText(const google::protobuf::Value& value) {
  std::string json;
  const auto status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw ConfigError("failed rendering response value: " + status.ToString());
  }
  return json;
}

std::string valueText(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
  case google::protobuf::Value::kStringValue:
    return value.string_value();
  case google::protobuf::Value::kNumberValue:
    return toFieldString(Json(value.number_value()));
  case google::protobuf::Value::kBoolValue:
    return value.bool_value() ? "true" : "false";
  case google::protobuf::Value::kNullValue:
  case google::protobuf::Value::KIND_NOT_SET:
    return "";
  default:
    return jsonText(value);
  }
}

bool isStructured(const google::protobuf::Value& value) {
  return value.kind_case() == google::protobuf::Value::kStructValue ||
         value.kind_case() == google::protobuf::Value::kListValue;
}

std::string optionalString(const Json& document, const char* key, const std::string& fallback) {
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigError(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

uint32_t portOf(const Json& document) {
  auto it = document.find("port");
  if (it == document.end() || it->is_null()) {
    return 0;
  }
  if (!it->is_number_unsigned() || it->get<uint64_t>() > 65535) {
    throw ConfigError("port must be an integer between 0 and 65535");
  }
  return it->get<uint32_t>();
}

} // namespace

IsResponse parseIsResponse(const Json& response) {
  if (!response.is_object()) {
    throw ConfigError("response must be an object, got " + response.dump());
  }
  IsResponse message;
  const auto status =
      google::protobuf::util::JsonStringToMessage(response.dump(), &message, responseParseOptions());
  if (!status.ok()) {
    throw ConfigError("failed parsing response " + response.dump() + ": " + status.ToString());
  }
  return message;
}

StubResponse parseResponse(const Json& response) {
  if (!response.is_object()) {
    throw ConfigError("response must be an object, got " + response.dump());
  }
  for (const char* unsupported : {"proxy", "inject", "fault"}) {
    if (response.contains(unsupported)) {
      throw ConfigError(std::string(unsupported) + " responses are not supported");
    }
  }

  StubResponse message;
  auto is = response.find("is");
  if (is != response.end()) {
    *message.mutable_is() = parseIsResponse(*is);
  }
  return message;
}

StubPtr loadStub(const Json& definition) {
  if (!definition.is_object()) {
    throw ConfigError("stub must be an object");
  }

  auto stub = std::make_shared<Stub>();
  stub->predicate = compilePredicates(definition);

  auto responses = definition.find("responses");
  if (responses != definition.end() && !responses->is_null()) {
    if (!responses->is_array()) {
      throw ConfigError("responses must be an array");
    }
    for (const auto& response : *responses) {
      stub->responses.push_back(parseResponse(response));
    }
  }
  return stub;
}

ImposterInstancePtr loadImposter(std::string_view document) {
  Json imposter = Json::parse(document.begin(), document.end(), nullptr, false);
  if (imposter.is_discarded()) {
    throw ConfigError("imposter definition is not valid JSON");
  }
  if (!imposter.is_object()) {
    throw ConfigError("imposter definition must be an object");
  }

  std::string protocol = optionalString(imposter, "protocol", "http");
  if (protocol != "http" && protocol != "https") {
    throw ConfigError("unsupported protocol " + protocol);
  }

  StubList stubs;
  auto definitions = imposter.find("stubs");
  if (definitions != imposter.end() && !definitions->is_null()) {
    if (!definitions->is_array()) {
      throw ConfigError("stubs must be an array");
    }
    for (size_t i = 0; i < definitions->size(); ++i) {
      try {
        stubs.push_back(loadStub((*definitions)[i]));
      } catch (const PredicateError& e) {
        throw ConfigError(e.what(), i);
      } catch (const ConfigError& e) {
        throw ConfigError(e.what(), i);
      }
    }
  }

  IsResponse default_response;
  auto fallback = imposter.find("defaultResponse");
  if (fallback != imposter.end() && !fallback->is_null()) {
    default_response = parseIsResponse(*fallback);
  }

  return std::make_unique<ImposterInstance>(optionalString(imposter, "name", ""), portOf(imposter),
                                            std::move(protocol), std::move(stubs),
                                            std::move(default_response));
}

LocalReply renderResponse(const IsResponse& response) {
  LocalReply reply;
  reply.status_code = response.status_code() == 0 ? kDefaultStatusCode : response.status_code();

  bool has_content_type = false;
  for (const auto& header : response.headers()) {
    std::string name = toLower(header.first);
    has_content_type = has_content_type || name == kContentTypeHeader;
    if (header.second.kind_case() == google::protobuf::Value::kListValue) {
      for (const auto& value : header.second.list_value().values()) {
        reply.headers.emplace_back(name, valueText(value));
      }
    } else {
      reply.headers.emplace_back(name, valueText(header.second));
    }
  }

  if (response.has_body()) {
    reply.body = valueText(response.body());
    if (isStructured(response.body()) && !has_content_type) {
      reply.headers.emplace_back(std::string(kContentTypeHeader), std::string(kJsonContentType));
    }
  }
  return reply;
}

} // namespace Imposter
