// =============================================================================
// indicators_test.cpp
// =============================================================================
// Unit tests for the ATR and EMA/MACD indicator functions.
//
// Validates:
//   - Hand-computed warm-up values for ATR, EMA and MACD/Signal
//   - Batch warm-up over a prefix + per-tick steps == batch over everything
//   - smoothing = 0 leaves the EMA unchanged
//   - "Previous" MACD/Signal that do not exist yet are NaN
//   - Invalid lengths and short warm-ups are rejected
// =============================================================================

#include "trendsim/indicators/atr.hpp"
#include "trendsim/indicators/ema.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace {

// Deterministic, non-trivial price path.
std::vector<double> wavyPrices(std::size_t n) {
  std::vector<double> prices;
  prices.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const double x = static_cast<double>(i);
    prices.push_back(100.0 + 5.0 * std::sin(x / 3.0) + 0.25 * x);
  }
  return prices;
}

trendsim::domain::MacdParams smallMacd() {
  trendsim::domain::MacdParams params;
  params.fast_length = 2;
  params.slow_length = 3;
  params.signal_length = 2;
  params.smoothing = 2.0;
  return params;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. ATR warm-up: mean of the first `window` true ranges, then Wilder steps.
//    TR = 1, 2 | 1, 0  ->  seed 1.5, then 1.25, then 0.625.
// -----------------------------------------------------------------------------
TEST(AtrTest, InitMatchesHandComputedValue) {
  const std::vector<double> prices{10.0, 11.0, 13.0, 12.0, 12.0};
  EXPECT_DOUBLE_EQ(trendsim::indicators::initATR(prices, 2), 0.625);
}

TEST(AtrTest, StepUsesAbsoluteMove) {
  EXPECT_DOUBLE_EQ(trendsim::indicators::stepATR(1.0, 100.0, 97.0, 20),
                   (19.0 * 1.0 + 3.0) / 20.0);
}

// -----------------------------------------------------------------------------
// 2. Incremental/batch equivalence: warm-up over a prefix, then stepATR()
//    tick by tick, must give exactly the batch value over the whole series.
// -----------------------------------------------------------------------------
TEST(AtrTest, IncrementalEqualsBatch) {
  const auto prices = wavyPrices(120);
  const int window = 14;

  for (std::size_t prefix = window + 1; prefix < prices.size(); prefix += 17) {
    std::vector<double> head(prices.begin(),
                             prices.begin() + static_cast<long>(prefix));
    double atr = trendsim::indicators::initATR(head, window);
    for (std::size_t i = prefix; i < prices.size(); ++i) {
      atr = trendsim::indicators::stepATR(atr, prices[i - 1], prices[i],
                                          window);
    }
    EXPECT_EQ(atr, trendsim::indicators::initATR(prices, window))
        << "prefix=" << prefix;
  }
}

TEST(AtrTest, RejectsBadWindowAndShortSeries) {
  const std::vector<double> prices{1.0, 2.0, 3.0};
  EXPECT_THROW(trendsim::indicators::initATR(prices, 0),
               std::invalid_argument);
  EXPECT_THROW(trendsim::indicators::initATR(prices, 3),
               std::invalid_argument);
  EXPECT_NO_THROW(trendsim::indicators::initATR(prices, 2));
}

// -----------------------------------------------------------------------------
// 3. EMA
// -----------------------------------------------------------------------------
TEST(EmaTest, StepUsesSmoothingOverLengthPlusOne) {
  // multiplier = 2 / 4 = 0.5
  EXPECT_DOUBLE_EQ(trendsim::indicators::stepEMA(10.0, 3, 2.0, 14.0), 12.0);
}

TEST(EmaTest, ZeroSmoothingReturnsPreviousValue) {
  EXPECT_DOUBLE_EQ(trendsim::indicators::stepEMA(42.0, 5, 0.0, 1000.0), 42.0);
}

TEST(EmaTest, InitSeedsWithMeanThenSteps) {
  // seed mean(1,2,3) = 2, then 0.5*4 + 0.5*2 = 3, then 0.5*5 + 0.5*3 = 4
  const std::vector<double> prices{1.0, 2.0, 3.0, 4.0, 5.0};
  EXPECT_DOUBLE_EQ(trendsim::indicators::initEMA(prices, 3), 4.0);
}

TEST(EmaTest, RejectsBadLength) {
  const std::vector<double> prices{1.0, 2.0};
  EXPECT_THROW(trendsim::indicators::initEMA(prices, 0),
               std::invalid_argument);
  EXPECT_THROW(trendsim::indicators::initEMA(prices, 3),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. MACD warm-up on a linear series. With fast=2, slow=3 the EMAs lag the
//    price by 0.5 and 1.0, so MACD is 0.5 from its first value on and the
//    Signal seed (mean of two MACD values) is 0.5 too.
// -----------------------------------------------------------------------------
TEST(MacdTest, WarmupOnLinearSeries) {
  const std::vector<double> prices{1.0, 2.0, 3.0, 4.0};
  const auto state = trendsim::indicators::initMACD(prices, smallMacd());

  EXPECT_NEAR(state.ema_fast, 3.5, 1e-12);
  EXPECT_NEAR(state.ema_slow, 3.0, 1e-12);
  EXPECT_NEAR(state.macd, 0.5, 1e-12);
  EXPECT_NEAR(state.signal, 0.5, 1e-12);
  EXPECT_NEAR(state.prev_macd, 0.5, 1e-12);
  EXPECT_TRUE(std::isnan(state.prev_signal));
}

TEST(MacdTest, StepShiftsCurrentIntoPrevious) {
  const std::vector<double> prices{1.0, 2.0, 3.0, 4.0};
  const auto params = smallMacd();
  const auto before = trendsim::indicators::initMACD(prices, params);
  const auto after = trendsim::indicators::stepMACD(before, 7.0, params);

  EXPECT_DOUBLE_EQ(after.prev_macd, before.macd);
  EXPECT_DOUBLE_EQ(after.prev_signal, before.signal);
  EXPECT_NEAR(after.ema_fast, 17.5 / 3.0, 1e-12);
  EXPECT_NEAR(after.ema_slow, 5.0, 1e-12);
  EXPECT_NEAR(after.macd, 17.5 / 3.0 - 5.0, 1e-12);
}

TEST(MacdTest, IncrementalEqualsBatch) {
  const auto prices = wavyPrices(200);
  trendsim::domain::MacdParams params;  // 12 / 26 / 9

  const std::size_t prefix = 40;
  std::vector<double> head(prices.begin(),
                           prices.begin() + static_cast<long>(prefix));
  auto state = trendsim::indicators::initMACD(head, params);
  for (std::size_t i = prefix; i < prices.size(); ++i) {
    state = trendsim::indicators::stepMACD(state, prices[i], params);
  }

  const auto batch = trendsim::indicators::initMACD(prices, params);
  EXPECT_DOUBLE_EQ(state.ema_fast, batch.ema_fast);
  EXPECT_DOUBLE_EQ(state.ema_slow, batch.ema_slow);
  EXPECT_DOUBLE_EQ(state.macd, batch.macd);
  EXPECT_DOUBLE_EQ(state.signal, batch.signal);
  EXPECT_DOUBLE_EQ(state.prev_macd, batch.prev_macd);
  EXPECT_DOUBLE_EQ(state.prev_signal, batch.prev_signal);

  // The fast EMA is also an ordinary EMA over the whole series.
  EXPECT_NEAR(state.ema_fast,
              trendsim::indicators::initEMA(prices, params.fast_length), 1e-9);
  EXPECT_NEAR(state.ema_slow,
              trendsim::indicators::initEMA(prices, params.slow_length), 1e-9);
}

TEST(MacdTest, RejectsInconsistentLengthsAndShortSeries) {
  const auto prices = wavyPrices(50);

  auto params = smallMacd();
  params.fast_length = 3;  // fast == slow
  EXPECT_THROW(trendsim::indicators::initMACD(prices, params),
               std::invalid_argument);

  params = smallMacd();
  params.signal_length = 0;
  EXPECT_THROW(trendsim::indicators::initMACD(prices, params),
               std::invalid_argument);

  const std::vector<double> three{1.0, 2.0, 3.0};  // needs 3 + 2 - 1 = 4
  EXPECT_THROW(trendsim::indicators::initMACD(three, smallMacd()),
               std::invalid_argument);
}
