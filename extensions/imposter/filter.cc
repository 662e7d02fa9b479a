// NOLINT(namespace-envoy)
#include "extensions/imposter/filter.h"

#include <string>

#include "extensions/imposter/errors.h"

static RegisterContextFactory register_ImposterContext(CONTEXT_FACTORY(ImposterContext),
                                                       ROOT_FACTORY(ImposterRootContext),
                                                       "imposter_root_id");

bool ImposterRootContext::onConfigure(size_t) {
  auto conf = getConfiguration();

  if (!conf) {
    LOG_INFO("received null config - filter will be disabled");
    return true;
  }

  if (conf->data() == nullptr) {
    LOG_INFO("received null config data - filter will be disabled");
    return true;
  }

  try {
    imposter_ = Imposter::loadImposter(conf->view());
  } catch (std::exception& e) {
    LOG_ERROR(std::string("failed loading imposter: ") + e.what());
    return false;
  }

  LOG_INFO("loaded imposter '" + imposter_->name() + "' with " +
           std::to_string(imposter_->stubs()->size()) + " stubs");
  return true;
}

FilterHeadersStatus ImposterContext::onRequestHeaders(uint32_t) {
  if (!root_->imposter()) {
    return FilterHeadersStatus::Continue;
  }

  Imposter::Common::populateHTTPRequestInfo(&request_info_);
  if (Imposter::expectsBody(request_info_.request_headers)) {
    return FilterHeadersStatus::StopIteration;
  }

  respond();
  return FilterHeadersStatus::StopIteration;
}

FilterDataStatus ImposterContext::onRequestBody(size_t body_buffer_length, bool end_of_stream) {
  if (!root_->imposter() || responded_) {
    return FilterDataStatus::Continue;
  }
  if (!end_of_stream) {
    return FilterDataStatus::StopIterationAndBuffer;
  }

  Imposter::Common::populateHTTPRequestBody(body_buffer_length, &request_info_);
  respond();
  return FilterDataStatus::StopIterationNoBuffer;
}

void ImposterContext::respond() {
  responded_ = true;
  const Imposter::ImposterInstance& imposter = *root_->imposter();

  try {
    Imposter::Request request(request_info_.request_method, request_info_.request_url,
                              request_info_.request_headers,
                              std::move(request_info_.request_body),
                              request_info_.source_address);

    const IsResponse* response = &imposter.defaultResponse();
    auto match = imposter.match(request);
    if (match) {
      LOG_DEBUG(request.method() + " " + request.path() + " matched stub " +
                std::to_string(match->index));
      if (!match->stub->responses.empty()) {
        response = &match->stub->responses.front().is();
      }
    } else {
      LOG_DEBUG(request.method() + " " + request.path() +
                " matched no stub, sending the default response");
    }

    auto reply = Imposter::renderResponse(*response);
    sendLocalResponse(reply.status_code, "imposter", reply.body, reply.headers);
  } catch (std::exception& e) {
    LOG_ERROR(std::string("exception while matching request:") + e.what());
    sendLocalResponse(500, "imposter_error", "", {});
  }
}
