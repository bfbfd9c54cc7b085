// =============================================================================
// indicator_engine_test.cpp
// =============================================================================
// Unit tests for tickflow::IndicatorEngine.
//
// Validates:
//   - Moving averages are undefined until N prices, defined exactly at N,
//     and equal the mean of the last N prices
//   - RSI is undefined until `period` price changes, follows Wilder
//     smoothing, and lies in [0, 100] for arbitrary sequences
//   - Flat, rising-only and falling-only series hit 50, 100 and 0
//   - History is bounded to max(long, rsi) + 1
//   - Symbols are independent; forget() resets one symbol
// =============================================================================

#include "tickflow/indicators/indicator_engine.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <vector>

namespace {

tickflow::domain::Tick tick(double price, const std::string& symbol = "SH600000") {
  return tickflow::domain::Tick{symbol, price, 0};
}

tickflow::IndicatorConfig windows(int ma_short, int ma_long, int rsi) {
  return tickflow::IndicatorConfig{ma_short, ma_long, rsi};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Short MA 2, long MA 3 over [10, 10, 10, 12, 14].
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, MovingAveragesWarmUpThenTrackLastN) {
  tickflow::IndicatorEngine engine(windows(2, 3, 14));

  auto s = engine.update(tick(10));
  EXPECT_FALSE(s.ma_short.has_value());
  EXPECT_FALSE(s.ma_long.has_value());

  s = engine.update(tick(10));
  ASSERT_TRUE(s.ma_short.has_value());
  EXPECT_DOUBLE_EQ(*s.ma_short, 10.0);
  EXPECT_FALSE(s.ma_long.has_value());

  s = engine.update(tick(10));
  EXPECT_DOUBLE_EQ(*s.ma_short, 10.0);
  ASSERT_TRUE(s.ma_long.has_value());
  EXPECT_DOUBLE_EQ(*s.ma_long, 10.0);

  s = engine.update(tick(12));
  EXPECT_DOUBLE_EQ(*s.ma_short, 11.0);
  EXPECT_NEAR(*s.ma_long, 32.0 / 3.0, 1e-12);

  s = engine.update(tick(14));
  EXPECT_DOUBLE_EQ(*s.ma_short, 13.0);
  EXPECT_DOUBLE_EQ(*s.ma_long, 12.0);
}

// -----------------------------------------------------------------------------
// 2. RSI(3) is undefined for the first 3 prices (2 changes) and defined at
//    the 4th. Values follow avg = (avg_prev * (n - 1) + x) / n from zero.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, RsiWilderSmoothing) {
  tickflow::IndicatorEngine engine(windows(2, 3, 3));

  EXPECT_FALSE(engine.update(tick(10)).rsi.has_value());
  EXPECT_FALSE(engine.update(tick(11)).rsi.has_value());  // +1
  EXPECT_FALSE(engine.update(tick(10)).rsi.has_value());  // -1

  // Expected averages after the changes +1, -1, +2.
  double gain = 0.0;
  double loss = 0.0;
  auto fold = [&](double g, double l) {
    gain = (gain * 2.0 + g) / 3.0;
    loss = (loss * 2.0 + l) / 3.0;
  };
  fold(1, 0);
  fold(0, 1);
  fold(2, 0);

  auto s = engine.update(tick(12));
  ASSERT_TRUE(s.rsi.has_value());
  EXPECT_NEAR(*s.rsi, 100.0 - 100.0 / (1.0 + gain / loss), 1e-9);

  fold(0, 3);
  s = engine.update(tick(9));
  EXPECT_NEAR(*s.rsi, 100.0 - 100.0 / (1.0 + gain / loss), 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Degenerate series.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, RsiEdgeCases) {
  tickflow::IndicatorEngine flat(windows(2, 3, 3));
  tickflow::IndicatorEngine rising(windows(2, 3, 3));
  tickflow::IndicatorEngine falling(windows(2, 3, 3));

  for (int i = 0; i < 6; ++i) {
    flat.update(tick(10));
    rising.update(tick(10 + i));
    falling.update(tick(20 - i));
  }

  EXPECT_DOUBLE_EQ(*flat.update(tick(10)).rsi, 50.0);
  EXPECT_DOUBLE_EQ(*rising.update(tick(17)).rsi, 100.0);
  EXPECT_DOUBLE_EQ(*falling.update(tick(13)).rsi, 0.0);
}

// -----------------------------------------------------------------------------
// 4. RSI stays within [0, 100] over a long random walk.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, RsiBoundedForRandomWalk) {
  tickflow::IndicatorEngine engine(windows(5, 20, 14));
  std::mt19937 rng(12345);
  std::normal_distribution<double> step(0.0, 0.03);

  double price = 100.0;
  int defined = 0;
  for (int i = 0; i < 5000; ++i) {
    price = std::max(0.01, price * std::exp(step(rng)));
    auto s = engine.update(tick(price));
    if (s.rsi) {
      ++defined;
      EXPECT_GE(*s.rsi, 0.0);
      EXPECT_LE(*s.rsi, 100.0);
    }
  }
  EXPECT_EQ(defined, 5000 - 14);
}

// -----------------------------------------------------------------------------
// 5. History never exceeds max(long, rsi) + 1.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, HistoryIsBounded) {
  tickflow::IndicatorEngine engine(windows(3, 8, 14));
  EXPECT_EQ(engine.history_capacity(), 15u);

  for (int i = 0; i < 100; ++i) {
    engine.update(tick(10.0 + i));
  }
  EXPECT_EQ(engine.history_size("SH600000"), 15u);

  tickflow::IndicatorEngine long_window(windows(3, 30, 14));
  EXPECT_EQ(long_window.history_capacity(), 31u);
}

// -----------------------------------------------------------------------------
// 6. Symbols keep separate state; forget() starts one over.
// -----------------------------------------------------------------------------
TEST(IndicatorEngineTest, SymbolsAreIndependentAndForgettable) {
  tickflow::IndicatorEngine engine(windows(2, 3, 3));

  engine.update(tick(10, "A"));
  engine.update(tick(20, "A"));
  auto b = engine.update(tick(50, "B"));
  EXPECT_FALSE(b.ma_short.has_value());
  EXPECT_EQ(engine.symbol_count(), 2u);

  auto a = engine.update(tick(30, "A"));
  EXPECT_DOUBLE_EQ(*a.ma_short, 25.0);
  EXPECT_DOUBLE_EQ(*a.ma_long, 20.0);

  engine.forget("A");
  EXPECT_EQ(engine.history_size("A"), 0u);
  EXPECT_EQ(engine.symbol_count(), 1u);
  EXPECT_FALSE(engine.update(tick(40, "A")).ma_short.has_value());
}
