#include "captlog/observability/factory.hpp"

#include "captlog/common/fs.hpp"
#include "captlog/observability/log_observer.hpp"
#include "captlog/observability/noop_observer.hpp"

namespace captlog::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace captlog::observability
