#pragma once

#include "tickflow/broadcast/snapshot_store.hpp"
#include "tickflow/domain/account.hpp"
#include "tickflow/domain/indicators.hpp"
#include "tickflow/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace tickflow {
namespace codec {

// -----------------------------------------------------------------------------
// JSON wire format
// -----------------------------------------------------------------------------
//
// Live channel messages (one JSON text frame each):
//
//   {"type":"snapshot","data":<snapshot payload>}
//   {"type":"tick","ts","symbol","price",
//    "indicators":{"ma_short","ma_long","rsi"},
//    "signal","signal_meta":{"reason"},
//    "broker":{"cash","equity","realized_pnl",
//              "positions":[{"symbol","qty","avg_price"}],"last_order"}}
//   {"type":"error","ts","symbol","error"}
//   {"type":"pong","ts"}
//
// Pull payloads:
//
//   snapshot: {"ts","symbols","cash","equity","realized_pnl","positions",
//              "provider_health":{"last_ok_ts":{sym:ts|null},
//                                 "last_error":{sym:str|null},
//                                 "tick_count":{sym:n}},
//              "last":{sym:{"tick":{symbol,ts,price}|null,
//                           "indicators":{...}|null,
//                           "signal":str|null,"reason":str|null}}}
//   health:   {"ts","engine_running","symbols","last_ok_ts","last_error",
//              "tick_count"}
//   clients:  {"clients":n}
//
// Timestamps are ISO-8601 UTC strings; undefined indicators are null.
// -----------------------------------------------------------------------------

nlohmann::json indicators_to_json(const domain::IndicatorSnapshot& indicators);
nlohmann::json account_to_json(const domain::AccountSnapshot& account);
nlohmann::json snapshot_to_json(const SnapshotData& data);
nlohmann::json health_to_json(const SnapshotData& data);
nlohmann::json clients_to_json(std::size_t clients);

// Compact serialization; invalid UTF-8 is replaced, never thrown on.
std::string to_wire(const nlohmann::json& message);

std::string encode_tick(const TickProcessedEvent& composite);
std::string encode_error(const std::string& symbol, const std::string& error,
                         std::int64_t ts_ms);
std::string encode_snapshot(const SnapshotData& data);
std::string encode_pong(std::int64_t ts_ms);

}  // namespace codec
}  // namespace tickflow
