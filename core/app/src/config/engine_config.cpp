#include "tickflow/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace tickflow {

namespace {

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::invalid_argument("EngineConfig: " + message);
  }
}

// Copies document[key] into `field` when the key is present.
template <typename T>
void read_into(const nlohmann::json& document, const char* key, T& field) {
  auto it = document.find(key);
  if (it != document.end() && !it->is_null()) {
    field = it->get<T>();
  }
}

template <typename T>
void read_into(const nlohmann::json& document, const char* key,
               std::optional<T>& field) {
  auto it = document.find(key);
  if (it != document.end() && !it->is_null()) {
    field = it->get<T>();
  }
}

// Returns document[key] if it is an object, else an empty object.
const nlohmann::json& section(const nlohmann::json& document, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw std::invalid_argument(std::string("EngineConfig: '") + key +
                                "' must be an object");
  }
  return *it;
}

ProviderType parse_provider_type(const std::string& name) {
  if (name == "simulated") return ProviderType::Simulated;
  if (name == "polled_http" || name == "eastmoney") {
    return ProviderType::PolledHttp;
  }
  throw std::invalid_argument("EngineConfig: unknown provider.type '" + name +
                              "'");
}

StrategyType parse_strategy_type(const std::string& name) {
  if (name == "ma_crossover") return StrategyType::MACrossover;
  if (name == "rsi" || name == "rsi_threshold") {
    return StrategyType::RsiThreshold;
  }
  throw std::invalid_argument("EngineConfig: unknown strategy.type '" + name +
                              "'");
}

SizingPolicy parse_sizing(const std::string& name) {
  if (name == "fraction_of_cash") return SizingPolicy::FractionOfCash;
  if (name == "fixed_quantity") return SizingPolicy::FixedQuantity;
  throw std::invalid_argument("EngineConfig: unknown broker.sizing '" + name +
                              "'");
}

}  // namespace

const char* to_string(ProviderType type) {
  return type == ProviderType::Simulated ? "simulated" : "polled_http";
}

const char* to_string(StrategyType type) {
  return type == StrategyType::MACrossover ? "ma_crossover" : "rsi_threshold";
}

// -----------------------------------------------------------------------------
// validate()
// -----------------------------------------------------------------------------
void EngineConfig::validate() const {
  require(!symbols.empty(), "symbols must not be empty");
  std::set<std::string> seen;
  for (const auto& symbol : symbols) {
    require(!symbol.empty(), "symbols must not contain an empty name");
    require(seen.insert(symbol).second, "duplicate symbol '" + symbol + "'");
  }
  require(interval_ms > 0, "interval_ms must be > 0");

  // provider
  const auto& sim = provider.simulated;
  require(std::isfinite(sim.start_price) && sim.start_price > 0.0,
          "provider.simulated.start_price must be > 0");
  require(std::isfinite(sim.volatility) && sim.volatility >= 0.0,
          "provider.simulated.volatility must be >= 0");
  require(std::isfinite(sim.drift), "provider.simulated.drift must be finite");

  const auto& http = provider.http;
  if (provider.type == ProviderType::PolledHttp) {
    require(!http.base_url.empty(), "provider.http.base_url must be set");
  }
  require(http.timeout_ms > 0, "provider.http.timeout_ms must be > 0");
  require(http.connect_timeout_ms > 0,
          "provider.http.connect_timeout_ms must be > 0");
  require(http.max_retries >= 0, "provider.http.max_retries must be >= 0");
  require(http.retry_backoff_ms >= 0,
          "provider.http.retry_backoff_ms must be >= 0");
  require(http.min_call_spacing_ms >= 0,
          "provider.http.min_call_spacing_ms must be >= 0");

  // strategy
  const auto& ma = strategy.ma_crossover;
  require(ma.short_period >= 1,
          "strategy.ma_crossover.short_period must be >= 1");
  require(ma.long_period > ma.short_period,
          "strategy.ma_crossover.long_period must be > short_period");
  const auto& rsi = strategy.rsi;
  require(rsi.period >= 1, "strategy.rsi.period must be >= 1");
  require(rsi.oversold >= 0.0 && rsi.overbought <= 100.0,
          "strategy.rsi thresholds must lie in [0, 100]");
  require(rsi.oversold < rsi.overbought,
          "strategy.rsi.oversold must be < overbought");

  // broker
  require(std::isfinite(broker.starting_cash) && broker.starting_cash >= 0.0,
          "broker.starting_cash must be >= 0");
  require(broker.cash_fraction > 0.0 && broker.cash_fraction <= 1.0,
          "broker.cash_fraction must be in (0, 1]");
  require(broker.fixed_quantity > 0.0, "broker.fixed_quantity must be > 0");
  require(broker.lot_size > 0.0, "broker.lot_size must be > 0");
  require(broker.reply_timeout_ms > 0, "broker.reply_timeout_ms must be > 0");

  // broadcast
  require(broadcast.queue_capacity > 0,
          "broadcast.queue_capacity must be > 0");
  require(broadcast.keepalive_timeout_ms > 0,
          "broadcast.keepalive_timeout_ms must be > 0");
  require(broadcast.reap_interval_ms > 0,
          "broadcast.reap_interval_ms must be > 0");

  // server / ipc
  if (server.enabled) {
    require(!server.host.empty(), "server.host must be set");
    require(!server.ws_path.empty() && server.ws_path.front() == '/',
            "server.ws_path must start with '/'");
    require(server.shutdown_grace_ms >= 0,
            "server.shutdown_grace_ms must be >= 0");
  }
  if (ipc.enabled) {
    require(!ipc.cmd_endpoint.empty() && !ipc.pub_endpoint.empty(),
            "ipc endpoints must be set");
    require(ipc.cmd_endpoint != ipc.pub_endpoint,
            "ipc.cmd_endpoint and ipc.pub_endpoint must differ");
  }
}

// -----------------------------------------------------------------------------
// fromJson(document)
// -----------------------------------------------------------------------------
// Layout mirrors the struct:
//
//   { "symbols": [...], "interval_ms": 1000,
//     "provider":  { "type": "simulated", "simulated": {...}, "http": {...} },
//     "strategy":  { "type": "ma_crossover", "ma_crossover": {...}, "rsi": {...} },
//     "broker":    { "starting_cash": ..., "sizing": "fraction_of_cash", ... },
//     "broadcast": {...}, "server": {...}, "ipc": {...} }
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromJson(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::invalid_argument("EngineConfig: document must be a JSON object");
  }

  EngineConfig config;
  try {
    read_into(document, "symbols", config.symbols);
    read_into(document, "interval_ms", config.interval_ms);

    const auto& provider = section(document, "provider");
    if (provider.contains("type")) {
      config.provider.type =
          parse_provider_type(provider.at("type").get<std::string>());
    }
    const auto& sim = section(provider, "simulated");
    read_into(sim, "start_price", config.provider.simulated.start_price);
    read_into(sim, "drift", config.provider.simulated.drift);
    read_into(sim, "volatility", config.provider.simulated.volatility);
    read_into(sim, "seed", config.provider.simulated.seed);

    const auto& http = section(provider, "http");
    auto& h = config.provider.http;
    read_into(http, "base_url", h.base_url);
    read_into(http, "timeout_ms", h.timeout_ms);
    read_into(http, "connect_timeout_ms", h.connect_timeout_ms);
    read_into(http, "max_retries", h.max_retries);
    read_into(http, "retry_backoff_ms", h.retry_backoff_ms);
    read_into(http, "min_call_spacing_ms", h.min_call_spacing_ms);
    read_into(http, "proxy", h.proxy);
    read_into(http, "user_agent", h.user_agent);

    const auto& strategy = section(document, "strategy");
    if (strategy.contains("type")) {
      config.strategy.type =
          parse_strategy_type(strategy.at("type").get<std::string>());
    }
    const auto& ma = section(strategy, "ma_crossover");
    read_into(ma, "short_period", config.strategy.ma_crossover.short_period);
    read_into(ma, "long_period", config.strategy.ma_crossover.long_period);
    const auto& rsi = section(strategy, "rsi");
    read_into(rsi, "period", config.strategy.rsi.period);
    read_into(rsi, "oversold", config.strategy.rsi.oversold);
    read_into(rsi, "overbought", config.strategy.rsi.overbought);

    const auto& broker = section(document, "broker");
    auto& b = config.broker;
    read_into(broker, "starting_cash", b.starting_cash);
    if (broker.contains("sizing")) {
      b.sizing = parse_sizing(broker.at("sizing").get<std::string>());
    }
    read_into(broker, "cash_fraction", b.cash_fraction);
    read_into(broker, "fixed_quantity", b.fixed_quantity);
    read_into(broker, "lot_size", b.lot_size);
    read_into(broker, "allow_pyramiding", b.allow_pyramiding);
    read_into(broker, "reply_timeout_ms", b.reply_timeout_ms);

    const auto& broadcast = section(document, "broadcast");
    read_into(broadcast, "queue_capacity", config.broadcast.queue_capacity);
    read_into(broadcast, "keepalive_timeout_ms",
              config.broadcast.keepalive_timeout_ms);
    read_into(broadcast, "reap_interval_ms", config.broadcast.reap_interval_ms);

    const auto& server = section(document, "server");
    read_into(server, "enabled", config.server.enabled);
    read_into(server, "host", config.server.host);
    read_into(server, "port", config.server.port);
    read_into(server, "ws_path", config.server.ws_path);
    read_into(server, "shutdown_grace_ms", config.server.shutdown_grace_ms);

    const auto& ipc = section(document, "ipc");
    read_into(ipc, "enabled", config.ipc.enabled);
    read_into(ipc, "cmd_endpoint", config.ipc.cmd_endpoint);
    read_into(ipc, "pub_endpoint", config.ipc.pub_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("EngineConfig: ") + e.what());
  }
  return config;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("EngineConfig: cannot open '" + path + "'");
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("EngineConfig: '" + path + "' is not valid JSON: " +
                             e.what());
  }
  return fromJson(document);
}

}  // namespace tickflow
