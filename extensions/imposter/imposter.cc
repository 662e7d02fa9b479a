#include "extensions/imposter/imposter.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace Imposter {

std::optional<size_t> findMatch(const StubList& stubs, const Request& request) {
  for (size_t i = 0; i < stubs.size(); ++i) {
    if (stubs[i]->predicate.matches(request)) {
      return i;
    }
  }
  return {};
}

std::optional<size_t> findMatchReference(const StubList& stubs, const Request& request) {
  for (size_t i = 0; i < stubs.size(); ++i) {
    if (stubs[i]->predicate.matchesReference(request)) {
      return i;
    }
  }
  return {};
}

ImposterInstance::ImposterInstance(std::string name, uint32_t port, std::string protocol,
                                   StubList stubs, IsResponse default_response)
    : name_(std::move(name)), port_(port), protocol_(std::move(protocol)),
      default_response_(std::move(default_response)),
      stubs_(std::make_shared<const StubList>(std::move(stubs))) {}

StubListPtr ImposterInstance::stubs() const { return std::atomic_load(&stubs_); }

void ImposterInstance::publish(StubList stubs) {
  std::atomic_store(&stubs_, StubListPtr(std::make_shared<const StubList>(std::move(stubs))));
}

void ImposterInstance::addStub(StubPtr stub, std::optional<size_t> index) {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  StubList updated = *stubs();
  size_t position = index ? std::min(*index, updated.size()) : updated.size();
  updated.insert(updated.begin() + static_cast<std::ptrdiff_t>(position), std::move(stub));
  publish(std::move(updated));
}

void ImposterInstance::removeStub(size_t index) {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  StubList updated = *stubs();
  if (index >= updated.size()) {
    throw std::out_of_range("no stub at index " + std::to_string(index));
  }
  updated.erase(updated.begin() + static_cast<std::ptrdiff_t>(index));
  publish(std::move(updated));
}

void ImposterInstance::replaceStubs(StubList stubs) {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  publish(std::move(stubs));
}

std::optional<MatchResult> ImposterInstance::match(const Request& request) const {
  StubListPtr snapshot = stubs();
  auto index = findMatch(*snapshot, request);
  if (!index) {
    return {};
  }
  return MatchResult{(*snapshot)[*index], *index};
}

} // namespace Imposter
