#pragma once

#include "couponvault/config/schema.hpp"
#include "couponvault/observability/observer.hpp"

#include <memory>

namespace couponvault::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace couponvault::observability
