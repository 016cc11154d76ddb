#pragma once

#include "captlog/observability/observer.hpp"

#include <iosfwd>

namespace captlog::observability {

class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream *out_;
};

} // namespace captlog::observability
