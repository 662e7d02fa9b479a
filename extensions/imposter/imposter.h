#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "extensions/imposter/fields.h"
#include "extensions/imposter/filter.pb.h"
#include "extensions/imposter/optimizer.h"

namespace Imposter {

struct Stub {
  CompiledPredicate predicate;
  std::vector<StubResponse> responses;
};

using StubPtr = std::shared_ptr<const Stub>;
using StubList = std::vector<StubPtr>;
using StubListPtr = std::shared_ptr<const StubList>;

// Index of the first stub, in declaration order, whose predicates accept
// the request.
std::optional<size_t> findMatch(const StubList& stubs, const Request& request);
// Same walk, using only the reference evaluator.
std::optional<size_t> findMatchReference(const StubList& stubs, const Request& request);

struct MatchResult {
  StubPtr stub;
  size_t index;
};

// One virtual service. Readers match against an immutable snapshot of the
// stub list; writers replace the whole list.
class ImposterInstance {
public:
  ImposterInstance(std::string name, uint32_t port, std::string protocol, StubList stubs,
                   IsResponse default_response);

  const std::string& name() const { return name_; }
  uint32_t port() const { return port_; }
  const std::string& protocol() const { return protocol_; }
  const IsResponse& defaultResponse() const { return default_response_; }

  // The current list. It stays valid and unchanged while the caller holds it.
  StubListPtr stubs() const;

  // Inserts before `index`, or appends when no index is given. An index past
  // the end appends.
  void addStub(StubPtr stub, std::optional<size_t> index = {});
  // Throws std::out_of_range.
  void removeStub(size_t index);
  void replaceStubs(StubList stubs);

  std::optional<MatchResult> match(const Request& request) const;

private:
  void publish(StubList stubs);

  const std::string name_;
  const uint32_t port_;
  const std::string protocol_;
  const IsResponse default_response_;

  StubListPtr stubs_;
  std::mutex writer_mutex_;
};

using ImposterInstancePtr = std::unique_ptr<ImposterInstance>;

} // namespace Imposter
