#pragma once

#include "tickflow/events/event_types.hpp"

#include <variant>

namespace tickflow {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by every EventBus and EventLoopThread in the
// engine. Symbol pipelines see MarketDataEvent, ProviderErrorEvent and
// TickProcessedEvent; the broker loop sees BrokerRequestEvent. Handlers
// subscribe to the concrete type they care about through
// EventBus::subscribe<T>() and never inspect the others.
// -----------------------------------------------------------------------------
using Event = std::variant<MarketDataEvent,
                           ProviderErrorEvent,
                           BrokerRequestEvent,
                           TickProcessedEvent>;

}  // namespace tickflow
