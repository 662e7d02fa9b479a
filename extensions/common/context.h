/* Copyright 2019 Istio Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>

#include "proxy_wasm_intrinsics.h"

#include "extensions/imposter/fields.h"

namespace Imposter {
namespace Common {

// Header keys
constexpr StringView kMethodHeaderKey = ":method";
constexpr StringView kPathHeaderKey = ":path";

// RequestInfo represents the information collected from filter stream
// callbacks. This is what the field model is built from.
struct RequestInfo {
  // HTTP method as sent by the client.
  std::string request_method;

  // The :path header, query string included.
  std::string request_url;

  // Request headers without the pseudo headers, in arrival order.
  HeaderPairs request_headers;

  // Downstream peer, "address:port".
  std::string source_address;

  // Request body, filled in once the stream has ended.
  std::string request_body;
};

// populateHTTPRequestInfo populates the RequestInfo struct from the request
// headers. It needs access to the request context.
void populateHTTPRequestInfo(RequestInfo* request_info);

// Copies the buffered request body into the RequestInfo.
void populateHTTPRequestBody(size_t body_size, RequestInfo* request_info);

}  // namespace Common
}  // namespace Imposter
