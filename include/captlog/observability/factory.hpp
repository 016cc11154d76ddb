#pragma once

#include "captlog/config/schema.hpp"
#include "captlog/observability/observer.hpp"

#include <memory>

namespace captlog::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace captlog::observability
