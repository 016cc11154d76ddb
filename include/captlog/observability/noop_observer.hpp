#pragma once

#include "captlog/observability/observer.hpp"

namespace captlog::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace captlog::observability
