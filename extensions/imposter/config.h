#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "extensions/imposter/fields.h"
#include "extensions/imposter/filter.pb.h"
#include "extensions/imposter/imposter.h"

namespace Imposter {

// What the filter sends back for a matched stub or the default response.
struct LocalReply {
  uint32_t status_code = 200;
  HeaderPairs headers;
  std::string body;
};

// Loads a Mountebank imposter document:
//
//   {"port": 4545, "protocol": "http", "name": "svc",
//    "stubs": [{"predicates": [...], "responses": [{"is": {...}}]}],
//    "defaultResponse": {"statusCode": 404}}
//
// Throws ConfigError; errors inside a stub carry its index.
ImposterInstancePtr loadImposter(std::string_view document);

// Compiles one stub object. Throws PredicateError or ConfigError.
StubPtr loadStub(const Json& definition);

// Decodes one entry of a stub's `responses`. Only `is` responses are
// supported. Throws ConfigError.
StubResponse parseResponse(const Json& response);

// Decodes a bare `is` object, as used for `defaultResponse`.
IsResponse parseIsResponse(const Json& response);

LocalReply renderResponse(const IsResponse& response);

} // namespace Imposter
