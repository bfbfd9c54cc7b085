#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tickflow {

// -----------------------------------------------------------------------------
// EngineConfig — the validated configuration of one engine session
// -----------------------------------------------------------------------------
//
// @brief  Plain aggregate of every tunable the engine reads, grouped by the
//         component that consumes it.
//
// @details
// The engine never parses files itself. main() builds an EngineConfig from
// defaults or from a JSON document (fromJson / fromFile), calls validate(),
// and hands the result to TradingEngine by value. From then on each
// component receives only its own section, copied into it at construction.
//
// Defaults reproduce the original realtime tool: one second polling, MA
// 10/30, RSI 14 with 30/70 thresholds, 100 000 starting cash.
//
// Thread model:
//   Value type, immutable after validate(). Sections are copied into
//   components; nothing shares a mutable config.
// -----------------------------------------------------------------------------

enum class ProviderType {
  Simulated,
  PolledHttp,
};

enum class StrategyType {
  MACrossover,
  RsiThreshold,
};

enum class SizingPolicy {
  FractionOfCash,
  FixedQuantity,
};

// Geometric random walk: price <- max(0.01, price * exp(N(drift, volatility))).
struct SimulatedProviderConfig {
  double start_price{100.0};
  double drift{0.0};
  double volatility{0.01};
  std::optional<std::uint64_t> seed;  // Unset: seeded from std::random_device
};

// Polled quote endpoint (Eastmoney-style /api/qt/stock/get).
struct HttpProviderConfig {
  std::string base_url{"https://push2.eastmoney.com"};
  long timeout_ms{5000};
  long connect_timeout_ms{3000};
  int max_retries{2};               // Retries after the first attempt
  long retry_backoff_ms{100};       // Doubles after every retry
  long min_call_spacing_ms{200};    // Shared across all symbols
  std::optional<std::string> proxy; // e.g. "http://127.0.0.1:7890"
  std::string user_agent{"Mozilla/5.0 (tickflow/1.0)"};
};

struct ProviderConfig {
  ProviderType type{ProviderType::Simulated};
  SimulatedProviderConfig simulated;
  HttpProviderConfig http;
};

struct MACrossoverConfig {
  int short_period{10};
  int long_period{30};
};

struct RsiConfig {
  int period{14};
  double oversold{30.0};
  double overbought{70.0};
};

struct StrategyConfig {
  StrategyType type{StrategyType::MACrossover};
  MACrossoverConfig ma_crossover;
  RsiConfig rsi;
};

struct BrokerConfig {
  double starting_cash{100000.0};
  SizingPolicy sizing{SizingPolicy::FractionOfCash};
  double cash_fraction{0.5};   // FractionOfCash: share of current cash per BUY
  double fixed_quantity{10.0}; // FixedQuantity: units per BUY
  double lot_size{1.0};        // Quantities are floored to a multiple of this
  bool allow_pyramiding{false};
  long reply_timeout_ms{2000}; // Pipeline wait for the broker's reply
};

struct BroadcastConfig {
  std::size_t queue_capacity{256};  // Per-session outbound messages
  long keepalive_timeout_ms{60000};
  long reap_interval_ms{1000};
};

struct ServerConfig {
  bool enabled{true};
  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};  // 0 binds an ephemeral port
  std::string ws_path{"/ws"};
  long shutdown_grace_ms{500};
};

struct IpcConfig {
  bool enabled{false};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct EngineConfig {
  std::vector<std::string> symbols{"SH600000"};
  long interval_ms{1000};

  ProviderConfig provider;
  StrategyConfig strategy;
  BrokerConfig broker;
  BroadcastConfig broadcast;
  ServerConfig server;
  IpcConfig ipc;

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  //
  // @brief  Checks every invariant the components rely on.
  //
  // @throws std::invalid_argument naming the first offending field, e.g.
  //         "strategy.ma_crossover.long_period must be > short_period".
  //
  // @details
  // Called once before any thread starts. Components assume a validated
  // config and do not re-check.
  // -------------------------------------------------------------------------
  void validate() const;

  // -------------------------------------------------------------------------
  // fromJson(document)
  // -------------------------------------------------------------------------
  //
  // @brief  Builds a config from a JSON object. Absent keys keep their
  //         defaults; present keys must have the right JSON type.
  //
  // @throws std::invalid_argument for unknown enum names ("provider.type",
  //         "strategy.type", "broker.sizing") and for type mismatches.
  //
  // The result is NOT validated; call validate() afterwards.
  // -------------------------------------------------------------------------
  static EngineConfig fromJson(const nlohmann::json& document);

  // Reads and parses `path`, then delegates to fromJson().
  // @throws std::runtime_error if the file cannot be read or is not JSON.
  static EngineConfig fromFile(const std::string& path);
};

const char* to_string(ProviderType type);
const char* to_string(StrategyType type);

}  // namespace tickflow
