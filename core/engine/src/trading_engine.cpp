#include "tickflow/engine/trading_engine.hpp"

#include "tickflow/broadcast/message_codec.hpp"
#include "tickflow/broker/paper_broker.hpp"
#include "tickflow/broker/position_sizer.hpp"
#include "tickflow/provider/provider_factory.hpp"
#include "tickflow/strategy/strategy_factory.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tickflow {

namespace {

EngineConfig validated(EngineConfig config) {
  config.validate();
  return config;
}

std::string upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build components, spawn nothing
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config,
                             const ITimeProvider& time_provider)
    : config_(validated(std::move(config))),
      time_provider_(time_provider),
      provider_(make_price_provider(config_.provider, time_provider_)),
      indicators_(std::make_unique<IndicatorEngine>(
          IndicatorConfig::from(config_.strategy))),
      strategy_(std::make_unique<StrategyEngine>(
          make_strategy(config_.strategy))),
      broker_(std::make_unique<BrokerThread>(std::make_unique<PaperBroker>(
          config_.broker, make_position_sizer(config_.broker)))),
      hub_(std::make_unique<BroadcastHub>(config_.broadcast, time_provider_)),
      symbols_(config_.symbols) {
  std::cout << "[TradingEngine] configured: provider="
            << to_string(config_.provider.type)
            << " strategy=" << strategy_->strategy().name()
            << " symbols=" << symbols_.size()
            << " interval_ms=" << config_.interval_ms << "\n";
}

TradingEngine::~TradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  std::lock_guard lock(mutex_);
  if (running_.load()) {
    return;
  }

  // ---  1) Seed the hub before anything can connect or publish -------------
  hub_->set_account(broker_->idle_snapshot());
  for (const auto& symbol : symbols_) {
    hub_->add_symbol(symbol);
  }
  hub_->set_engine_running(true);
  hub_->start_reaper();

  // ---  2) Broker loop (binds the account's single writer) ------------------
  broker_->start();
  running_.store(true);

  // ---  3) Transports -------------------------------------------------------
  try {
    if (config_.server.enabled) {
      live_server_ =
          std::make_unique<LiveServer>(config_.server, *hub_, time_provider_);
      live_server_->start();
    }
    if (config_.ipc.enabled) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          *hub_, config_.ipc);
      ipc_server_->start();
    }
  } catch (const std::exception& e) {
    std::cerr << "[TradingEngine] start failed: " << e.what() << "\n";
    running_.store(false);
    ipc_server_.reset();
    live_server_.reset();
    broker_->stop();
    hub_->stop_reaper();
    hub_->set_engine_running(false);
    throw;
  }

  // ---  4) Pipelines LAST (ticks begin flowing) ------------------------------
  for (const auto& symbol : symbols_) {
    startPipelineLocked(symbol);
  }

  std::cout << "[TradingEngine] started. Threads: broker, reaper, "
            << pipelines_.size() << " pipeline(s)"
            << (live_server_ ? ", live_server" : "")
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  std::map<std::string, std::unique_ptr<SymbolPipeline>> pipelines;
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
    pipelines.swap(pipelines_);
  }

  // ---  1) Stop tick inflow FIRST -------------------------------------------
  for (auto& [symbol, pipeline] : pipelines) {
    pipeline->stop();
    provider_->forget(symbol);
    indicators_->forget(symbol);
    strategy_->forget(symbol);
  }
  pipelines.clear();

  // ---  2) Transports (IPC joins before executeCommand() can race us) -------
  ipc_server_.reset();
  if (live_server_) {
    live_server_->stop();
    live_server_.reset();
  }

  // ---  3) Hub --------------------------------------------------------------
  hub_->closeAll(CloseReason::ServerShutdown);
  hub_->stop_reaper();
  hub_->set_engine_running(false);
  hub_->clear();

  // ---  4) Broker loop (drains queued requests, joins) ----------------------
  broker_->stop();

  std::cout << "[TradingEngine] stopped. All threads joined. published="
            << hub_->published() << "\n";
}

// -----------------------------------------------------------------------------
// subscribe() / unsubscribe()
// -----------------------------------------------------------------------------
bool TradingEngine::subscribe(const std::string& symbol) {
  if (symbol.empty()) {
    throw std::invalid_argument("TradingEngine: empty symbol");
  }

  std::lock_guard lock(mutex_);
  if (std::find(symbols_.begin(), symbols_.end(), symbol) != symbols_.end()) {
    return false;
  }
  symbols_.push_back(symbol);

  if (running_.load()) {
    hub_->add_symbol(symbol);
    startPipelineLocked(symbol);
  }
  std::cout << "[TradingEngine] subscribed " << symbol << "\n";
  return true;
}

bool TradingEngine::unsubscribe(const std::string& symbol) {
  std::unique_ptr<SymbolPipeline> pipeline;
  {
    std::lock_guard lock(mutex_);
    auto it = std::find(symbols_.begin(), symbols_.end(), symbol);
    if (it == symbols_.end()) {
      return false;
    }
    symbols_.erase(it);

    auto pit = pipelines_.find(symbol);
    if (pit != pipelines_.end()) {
      pipeline = std::move(pit->second);
      pipelines_.erase(pit);
    }
  }

  if (pipeline) {
    pipeline->stop();
  }
  provider_->forget(symbol);
  indicators_->forget(symbol);
  strategy_->forget(symbol);
  hub_->remove_symbol(symbol);

  std::cout << "[TradingEngine] unsubscribed " << symbol << "\n";
  return true;
}

std::vector<std::string> TradingEngine::symbols() const {
  std::lock_guard lock(mutex_);
  return symbols_;
}

SymbolPipeline* TradingEngine::pipeline(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  auto it = pipelines_.find(symbol);
  return it == pipelines_.end() ? nullptr : it->second.get();
}

std::uint16_t TradingEngine::serverPort() const {
  return live_server_ ? live_server_->port() : 0;
}

std::unique_ptr<SymbolPipeline> TradingEngine::makePipeline(
    const std::string& symbol) {
  return std::make_unique<SymbolPipeline>(
      symbol, *provider_, std::chrono::milliseconds(config_.interval_ms),
      *indicators_, *strategy_, *broker_, *hub_,
      std::chrono::milliseconds(config_.broker.reply_timeout_ms));
}

void TradingEngine::startPipelineLocked(const std::string& symbol) {
  auto pipeline = makePipeline(symbol);
  pipeline->start();
  pipelines_.emplace(symbol, std::move(pipeline));
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string argument;
  in >> verb >> argument;
  verb = upper(verb);

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "SNAPSHOT") {
    response["status"] = "ok";
    response["snapshot"] = codec::snapshot_to_json(hub_->snapshot());
  } else if (verb == "HEALTH") {
    response["status"] = "ok";
    response["health"] = hub_->health();
  } else if (verb == "CLIENTS") {
    response["status"] = "ok";
    response["clients"] = hub_->clientCount();
  } else if ((verb == "SUBSCRIBE" || verb == "UNSUBSCRIBE") &&
             !argument.empty()) {
    const bool changed =
        verb == "SUBSCRIBE" ? subscribe(argument) : unsubscribe(argument);
    response["status"] = changed ? "ok" : "error";
    response["symbol"] = argument;
    if (!changed) {
      response["response"] = verb == "SUBSCRIBE" ? "Already subscribed"
                                                 : "Not subscribed";
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return codec::to_wire(response);
}

}  // namespace tickflow
