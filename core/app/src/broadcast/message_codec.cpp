#include "tickflow/broadcast/message_codec.hpp"

#include "tickflow/time/time_utils.hpp"

namespace tickflow {
namespace codec {

using nlohmann::json;

// Vendor error text can carry arbitrary bytes; replace invalid UTF-8 rather
// than throw from dump().
std::string to_wire(const json& message) {
  return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace {

json optional_number(const std::optional<double>& value) {
  return value ? json(*value) : json(nullptr);
}

json tick_to_json(const domain::Tick& tick) {
  return json{{"symbol", tick.symbol},
              {"ts", format_iso8601(tick.ts_ms)},
              {"price", tick.price}};
}

json positions_to_json(const domain::AccountSnapshot& account) {
  json positions = json::array();
  for (const auto& [symbol, position] : account.positions) {
    positions.push_back({{"symbol", symbol},
                         {"qty", position.qty},
                         {"avg_price", position.avg_price}});
  }
  return positions;
}

json order_to_json(const std::optional<domain::OrderRecord>& order) {
  if (!order) {
    return nullptr;
  }
  return json{{"id", order->id},
              {"symbol", order->symbol},
              {"side", domain::to_string(order->side)},
              {"qty", order->qty},
              {"price", order->price},
              {"status", domain::to_string(order->status)},
              {"reason", order->reason},
              {"ts", format_iso8601(order->ts_ms)}};
}

}  // namespace

json indicators_to_json(const domain::IndicatorSnapshot& indicators) {
  return json{{"ma_short", optional_number(indicators.ma_short)},
              {"ma_long", optional_number(indicators.ma_long)},
              {"rsi", optional_number(indicators.rsi)}};
}

json account_to_json(const domain::AccountSnapshot& account) {
  return json{{"cash", account.cash},
              {"equity", account.equity},
              {"realized_pnl", account.realized_pnl},
              {"positions", positions_to_json(account)},
              {"last_order", order_to_json(account.last_order)}};
}

// -----------------------------------------------------------------------------
// Per-symbol health maps, shared by the snapshot and health payloads.
// -----------------------------------------------------------------------------
namespace {

void put_health(json& out, const SnapshotData& data) {
  json last_ok = json::object();
  json last_error = json::object();
  json tick_count = json::object();
  for (const auto& symbol : data.symbols) {
    auto it = data.health.find(symbol);
    if (it == data.health.end()) {
      last_ok[symbol] = nullptr;
      last_error[symbol] = nullptr;
      tick_count[symbol] = 0;
      continue;
    }
    const ProviderHealth& h = it->second;
    last_ok[symbol] = h.last_ok_ms ? json(format_iso8601(*h.last_ok_ms))
                                   : json(nullptr);
    last_error[symbol] = h.last_error ? json(*h.last_error) : json(nullptr);
    tick_count[symbol] = h.tick_count;
  }
  out["last_ok_ts"] = std::move(last_ok);
  out["last_error"] = std::move(last_error);
  out["tick_count"] = std::move(tick_count);
}

}  // namespace

json snapshot_to_json(const SnapshotData& data) {
  json out;
  out["ts"] = format_iso8601(data.ts_ms);
  out["symbols"] = data.symbols;
  out["cash"] = data.account.cash;
  out["equity"] = data.account.equity;
  out["realized_pnl"] = data.account.realized_pnl;
  out["positions"] = positions_to_json(data.account);
  out["last_order"] = order_to_json(data.account.last_order);

  json health = json::object();
  put_health(health, data);
  out["provider_health"] = std::move(health);

  json last = json::object();
  for (const auto& symbol : data.symbols) {
    json entry{{"tick", nullptr},
               {"indicators", nullptr},
               {"signal", nullptr},
               {"reason", nullptr}};
    auto it = data.last.find(symbol);
    if (it != data.last.end()) {
      const SymbolSnapshot& s = it->second;
      if (s.tick) entry["tick"] = tick_to_json(*s.tick);
      if (s.indicators) entry["indicators"] = indicators_to_json(*s.indicators);
      if (s.signal) {
        entry["signal"] = domain::to_string(s.signal->kind);
        entry["reason"] = s.signal->reason;
      }
    }
    last[symbol] = std::move(entry);
  }
  out["last"] = std::move(last);
  return out;
}

json health_to_json(const SnapshotData& data) {
  json out;
  out["ts"] = format_iso8601(data.ts_ms);
  out["engine_running"] = data.engine_running;
  out["symbols"] = data.symbols;
  put_health(out, data);
  return out;
}

json clients_to_json(std::size_t clients) { return json{{"clients", clients}}; }

std::string encode_tick(const TickProcessedEvent& composite) {
  json out{{"type", "tick"},
           {"ts", format_iso8601(composite.tick.ts_ms)},
           {"symbol", composite.tick.symbol},
           {"price", composite.tick.price},
           {"indicators", indicators_to_json(composite.indicators)},
           {"signal", domain::to_string(composite.signal.kind)},
           {"signal_meta", {{"reason", composite.signal.reason}}},
           {"broker", account_to_json(composite.account)}};
  return to_wire(out);
}

std::string encode_error(const std::string& symbol, const std::string& error,
                         std::int64_t ts_ms) {
  return to_wire(json{{"type", "error"},
                      {"ts", format_iso8601(ts_ms)},
                      {"symbol", symbol},
                      {"error", error}});
}

std::string encode_snapshot(const SnapshotData& data) {
  return to_wire(json{{"type", "snapshot"}, {"data", snapshot_to_json(data)}});
}

std::string encode_pong(std::int64_t ts_ms) {
  return to_wire(json{{"type", "pong"}, {"ts", format_iso8601(ts_ms)}});
}

}  // namespace codec
}  // namespace tickflow
