#include "tickflow/provider/provider_factory.hpp"

#include "tickflow/provider/polled_http_provider.hpp"
#include "tickflow/provider/simulated_provider.hpp"

#include <iostream>

namespace tickflow {

std::unique_ptr<IPriceProvider> make_price_provider(
    const ProviderConfig& config, const ITimeProvider& time_provider) {
  std::cout << "[ProviderFactory] provider=" << to_string(config.type) << "\n";
  switch (config.type) {
    case ProviderType::PolledHttp:
      return std::make_unique<PolledHttpProvider>(config.http, time_provider);
    case ProviderType::Simulated:
      break;
  }
  return std::make_unique<SimulatedProvider>(config.simulated, time_provider);
}

}  // namespace tickflow
