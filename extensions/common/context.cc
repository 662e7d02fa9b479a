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
#include "extensions/common/context.h"

namespace Imposter {
namespace Common {

namespace {

bool isPseudoHeader(StringView name) { return !name.empty() && name.front() == ':'; }

}  // namespace

void populateHTTPRequestInfo(RequestInfo* request_info) {
  request_info->request_method =
      getHeaderMapValue(HeaderMapType::RequestHeaders, kMethodHeaderKey)
          ->toString();
  request_info->request_url =
      getHeaderMapValue(HeaderMapType::RequestHeaders, kPathHeaderKey)
          ->toString();

  auto result = getRequestHeaderPairs();
  for (const auto& pair : result->pairs()) {
    if (isPseudoHeader(pair.first)) {
      continue;
    }
    request_info->request_headers.emplace_back(std::string(pair.first),
                                               std::string(pair.second));
  }

  // Envoy reports the downstream peer as "address:port".
  getStringValue({"source", "address"}, &request_info->source_address);
}

void populateHTTPRequestBody(size_t body_size, RequestInfo* request_info) {
  if (body_size == 0) {
    return;
  }
  auto body = getBufferBytes(BufferType::HttpRequestBody, 0, body_size);
  request_info->request_body = body->toString();
}

}  // namespace Common
}  // namespace Imposter
