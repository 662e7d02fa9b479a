// NOLINT(namespace-envoy)
#pragma once

#include <string>

#include "proxy_wasm_intrinsics.h"

#include "extensions/common/context.h"
#include "extensions/imposter/config.h"

class ImposterRootContext : public RootContext {
public:
  explicit ImposterRootContext(uint32_t id, StringView root_id) : RootContext(id, root_id) {}
  bool onConfigure(size_t /* configuration_size */) override;

  const Imposter::ImposterInstance* imposter() const { return imposter_.get(); }

private:
  Imposter::ImposterInstancePtr imposter_;
};

class ImposterContext : public Context {
public:
  explicit ImposterContext(uint32_t id, RootContext* root)
      : Context(id, root),
        root_(static_cast<const ImposterRootContext*>(static_cast<const void*>(root))) {}

  FilterHeadersStatus onRequestHeaders(uint32_t headers) override;
  FilterDataStatus onRequestBody(size_t body_buffer_length, bool end_of_stream) override;

private:
  void respond();

  Imposter::Common::RequestInfo request_info_;
  bool responded_ = false;
  const ImposterRootContext* root_;
};
