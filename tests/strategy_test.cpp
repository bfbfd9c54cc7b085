// =============================================================================
// strategy_test.cpp
// =============================================================================
// Unit tests for the edge-triggered strategies and tickflow::StrategyEngine.
//
// Validates:
//   - MACrossover on [10, 10, 10, 12, 14] with periods 2/3:
//     HOLD, HOLD, HOLD, BUY (ma_cross_up), HOLD
//   - A sustained trend never re-signals; the mirror cross sells
//   - Undefined indicators resolve to HOLD (insufficient_data)
//   - RsiThreshold buys on a downward cross of oversold and sells on an
//     upward cross of overbought, once per crossing
//   - Signal.reason names the trigger and the values behind it
//   - StrategyEngine keeps memory per symbol and forget() resets it
// =============================================================================

#include "tickflow/indicators/indicator_engine.hpp"
#include "tickflow/strategy/ma_crossover.hpp"
#include "tickflow/strategy/rsi_threshold.hpp"
#include "tickflow/strategy/strategy_engine.hpp"
#include "tickflow/strategy/strategy_factory.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using tickflow::domain::IndicatorSnapshot;
using tickflow::domain::SignalKind;

namespace {

tickflow::domain::Tick tick(double price, std::int64_t ts = 0,
                            const std::string& symbol = "SH600000") {
  return tickflow::domain::Tick{symbol, price, ts};
}

IndicatorSnapshot rsi(double value) {
  IndicatorSnapshot s;
  s.rsi = value;
  return s;
}

IndicatorSnapshot ma(double short_ma, double long_ma) {
  IndicatorSnapshot s;
  s.ma_short = short_ma;
  s.ma_long = long_ma;
  return s;
}

// Feeds prices through real indicators and an MA(2/3) strategy.
class MaPipeline {
 public:
  MaPipeline()
      : indicators_(tickflow::IndicatorConfig{2, 3, 14}),
        strategy_(std::make_unique<tickflow::MACrossover>(
            tickflow::MACrossoverConfig{2, 3})) {}

  tickflow::domain::Signal feed(double price, std::int64_t ts = 0) {
    const auto t = tick(price, ts);
    return strategy_.evaluate(t, indicators_.update(t));
  }

  tickflow::StrategyEngine& strategy() { return strategy_; }

 private:
  tickflow::IndicatorEngine indicators_;
  tickflow::StrategyEngine strategy_;
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. The documented crossover scenario, tick by tick.
// -----------------------------------------------------------------------------
TEST(MACrossoverTest, BuyExactlyOnTheCrossingTick) {
  MaPipeline pipeline;
  const std::vector<double> prices{10, 10, 10, 12, 14};
  const std::vector<SignalKind> expected{SignalKind::Hold, SignalKind::Hold,
                                         SignalKind::Hold, SignalKind::Buy,
                                         SignalKind::Hold};

  std::vector<tickflow::domain::Signal> signals;
  for (std::size_t i = 0; i < prices.size(); ++i) {
    signals.push_back(pipeline.feed(prices[i], static_cast<std::int64_t>(i + 1)));
    EXPECT_EQ(signals.back().kind, expected[i]) << "tick " << i + 1;
  }

  EXPECT_EQ(signals[0].reason, "insufficient_data");
  EXPECT_EQ(signals[1].reason, "insufficient_data");
  EXPECT_EQ(signals[2].reason.rfind("no_cross", 0), 0u);
  EXPECT_EQ(signals[3].reason, "ma_cross_up ma_short=11.0000 ma_long=10.6667");
  EXPECT_EQ(signals[4].reason.rfind("no_cross", 0), 0u);

  EXPECT_EQ(signals[3].symbol, "SH600000");
  EXPECT_EQ(signals[3].ts_ms, 4);
  EXPECT_EQ(pipeline.strategy().last_emitted("SH600000"), SignalKind::Buy);
}

// -----------------------------------------------------------------------------
// 2. A long uptrend buys once; the turn sells once.
// -----------------------------------------------------------------------------
TEST(MACrossoverTest, SustainedTrendDoesNotFlood) {
  MaPipeline pipeline;
  int buys = 0;
  int sells = 0;
  auto count = [&](const tickflow::domain::Signal& s) {
    buys += s.kind == SignalKind::Buy;
    sells += s.kind == SignalKind::Sell;
  };

  for (double p : {10.0, 10.0, 10.0}) count(pipeline.feed(p));
  for (int i = 1; i <= 20; ++i) count(pipeline.feed(10.0 + i));
  EXPECT_EQ(buys, 1);
  EXPECT_EQ(sells, 0);

  tickflow::domain::Signal sell;
  for (int i = 1; i <= 20; ++i) {
    auto s = pipeline.feed(30.0 - i);
    if (s.kind == SignalKind::Sell) sell = s;
    count(s);
  }
  EXPECT_EQ(buys, 1);
  EXPECT_EQ(sells, 1);
  EXPECT_EQ(sell.reason.rfind("ma_cross_down ma_short=", 0), 0u) << sell.reason;
  EXPECT_EQ(pipeline.strategy().last_emitted("SH600000"), SignalKind::Sell);
}

// -----------------------------------------------------------------------------
// 3. Touching equality is not a cross; leaving equality is.
// -----------------------------------------------------------------------------
TEST(MACrossoverTest, EqualityCounts) {
  tickflow::MACrossover strategy(tickflow::MACrossoverConfig{2, 3});

  EXPECT_EQ(strategy.decide(ma(9, 10), ma(10, 10)).kind, SignalKind::Hold);
  EXPECT_EQ(strategy.decide(ma(10, 10), ma(10.5, 10)).kind, SignalKind::Buy);
  EXPECT_EQ(strategy.decide(ma(10, 10), ma(9.5, 10)).kind, SignalKind::Sell);
  EXPECT_EQ(strategy.decide(ma(11, 10), ma(12, 10)).kind, SignalKind::Hold);
}

// -----------------------------------------------------------------------------
// 4. Undefined now → insufficient_data; undefined before → nothing to cross.
// -----------------------------------------------------------------------------
TEST(MACrossoverTest, UndefinedResolvesToHold) {
  tickflow::MACrossover strategy(tickflow::MACrossoverConfig{2, 3});

  IndicatorSnapshot half;
  half.ma_short = 11.0;
  auto d = strategy.decide(ma(9, 10), half);
  EXPECT_EQ(d.kind, SignalKind::Hold);
  EXPECT_EQ(d.reason, "insufficient_data");

  d = strategy.decide(half, ma(11, 10));
  EXPECT_EQ(d.kind, SignalKind::Hold);
  EXPECT_EQ(d.reason.rfind("no_cross", 0), 0u);

  d = strategy.decide(std::nullopt, ma(11, 10));
  EXPECT_EQ(d.kind, SignalKind::Hold);
}

// -----------------------------------------------------------------------------
// 5. RSI crossings, with the values in the reason.
// -----------------------------------------------------------------------------
TEST(RsiThresholdTest, CrossingsTriggerOnce) {
  tickflow::RsiThreshold strategy(tickflow::RsiConfig{14, 30.0, 70.0});

  auto d = strategy.decide(rsi(31.2), rsi(28.4));
  EXPECT_EQ(d.kind, SignalKind::Buy);
  EXPECT_EQ(d.reason,
            "rsi_cross_below_oversold rsi=28.4000 prev_rsi=31.2000 "
            "oversold=30.0000");

  EXPECT_EQ(strategy.decide(rsi(28.4), rsi(25.0)).kind, SignalKind::Hold);
  EXPECT_EQ(strategy.decide(rsi(30.0), rsi(29.9)).kind, SignalKind::Buy);

  d = strategy.decide(rsi(69.0), rsi(71.5));
  EXPECT_EQ(d.kind, SignalKind::Sell);
  EXPECT_EQ(d.reason,
            "rsi_cross_above_overbought rsi=71.5000 prev_rsi=69.0000 "
            "overbought=70.0000");

  EXPECT_EQ(strategy.decide(rsi(71.5), rsi(80.0)).kind, SignalKind::Hold);
  EXPECT_EQ(strategy.decide(rsi(50.0), rsi(55.0)).kind, SignalKind::Hold);
}

TEST(RsiThresholdTest, UndefinedResolvesToHold) {
  tickflow::RsiThreshold strategy(tickflow::RsiConfig{14, 30.0, 70.0});

  auto d = strategy.decide(rsi(40.0), IndicatorSnapshot{});
  EXPECT_EQ(d.kind, SignalKind::Hold);
  EXPECT_EQ(d.reason, "insufficient_data");

  // First defined RSI below oversold: nothing was crossed.
  d = strategy.decide(IndicatorSnapshot{}, rsi(10.0));
  EXPECT_EQ(d.kind, SignalKind::Hold);
  EXPECT_EQ(d.reason, "no_cross rsi=10.0000");
}

// -----------------------------------------------------------------------------
// 6. Memory is per symbol; forget() drops it.
// -----------------------------------------------------------------------------
TEST(StrategyEngineTest, MemoryPerSymbol) {
  tickflow::StrategyEngine engine(std::make_unique<tickflow::MACrossover>(
      tickflow::MACrossoverConfig{2, 3}));

  engine.evaluate(tick(0, 1, "A"), ma(9, 10));
  engine.evaluate(tick(0, 1, "B"), ma(11, 10));
  EXPECT_EQ(engine.symbol_count(), 2u);

  // A crosses up relative to its own previous tick, not B's.
  auto a = engine.evaluate(tick(0, 2, "A"), ma(11, 10));
  EXPECT_EQ(a.kind, SignalKind::Buy);
  auto b = engine.evaluate(tick(0, 2, "B"), ma(12, 10));
  EXPECT_EQ(b.kind, SignalKind::Hold);

  engine.forget("A");
  EXPECT_EQ(engine.symbol_count(), 1u);
  EXPECT_EQ(engine.last_emitted("A"), SignalKind::Hold);
  EXPECT_EQ(engine.evaluate(tick(0, 3, "A"), ma(12, 10)).kind,
            SignalKind::Hold);
}

TEST(StrategyEngineTest, FactoryBuildsConfiguredVariant) {
  tickflow::StrategyConfig config;
  EXPECT_STREQ(tickflow::make_strategy(config)->name(), "ma_crossover");
  config.type = tickflow::StrategyType::RsiThreshold;
  EXPECT_STREQ(tickflow::make_strategy(config)->name(), "rsi_threshold");
}
