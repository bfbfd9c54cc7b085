#pragma once

#include "tickflow/config/engine_config.hpp"
#include "tickflow/provider/i_price_provider.hpp"
#include "tickflow/time/i_time_provider.hpp"

#include <memory>

namespace tickflow {

// Builds the provider variant named by config.type. The time provider must
// outlive the result.
std::unique_ptr<IPriceProvider> make_price_provider(
    const ProviderConfig& config, const ITimeProvider& time_provider);

}  // namespace tickflow
