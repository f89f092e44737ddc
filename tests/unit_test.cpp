// =============================================================================
// unit_test.cpp
// =============================================================================
// Unit tests for trendsim::domain::Unit.
//
// Validates:
//   - Stop placement on both sides, and which prices hit it
//   - value() / marginReq() arithmetic
//   - Trade id derivation from (security, entry time, direction)
//   - setStopPrice() moves only the current stop
// =============================================================================

#include "trendsim/domain/unit.hpp"

#include <gtest/gtest.h>

using trendsim::domain::Direction;
using trendsim::domain::Unit;
using trendsim::domain::UnitTerms;

namespace {

UnitTerms makeTerms(Direction direction, double entry_price, double atr) {
  UnitTerms terms;
  terms.direction = direction;
  terms.security = "sec_0";
  terms.entry_price = entry_price;
  terms.entry_time = trendsim::ms_to_timestamp(1700000000000);
  terms.entry_tick = 7;
  terms.atr = atr;
  terms.unit_size = 3;
  terms.lot_size = 15;
  terms.margin_factor = 0.5;
  terms.stop_loss_factor = 2.0;
  return terms;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Long: stop below entry by factor * ATR; hit when the stop is above the
//    price.
// -----------------------------------------------------------------------------
TEST(UnitTest, LongStopBelowEntry) {
  Unit unit(makeTerms(Direction::Long, 100.0, 1.0));

  EXPECT_TRUE(unit.isLong());
  EXPECT_DOUBLE_EQ(unit.originalStopPrice(), 98.0);
  EXPECT_DOUBLE_EQ(unit.stopPrice(), 98.0);
  EXPECT_TRUE(unit.isStoppedOut(97.0));
  EXPECT_FALSE(unit.isStoppedOut(98.0));
  EXPECT_FALSE(unit.isStoppedOut(150.0));
}

// -----------------------------------------------------------------------------
// 2. Short: mirror image.
// -----------------------------------------------------------------------------
TEST(UnitTest, ShortStopAboveEntry) {
  Unit unit(makeTerms(Direction::Short, 100.0, 1.5));

  EXPECT_FALSE(unit.isLong());
  EXPECT_DOUBLE_EQ(unit.originalStopPrice(), 103.0);
  EXPECT_TRUE(unit.isStoppedOut(103.5));
  EXPECT_FALSE(unit.isStoppedOut(103.0));
  EXPECT_FALSE(unit.isStoppedOut(50.0));
}

TEST(UnitTest, ValueAndMargin) {
  Unit unit(makeTerms(Direction::Long, 100.0, 1.0));

  // 3 contracts * 15 per lot
  EXPECT_DOUBLE_EQ(unit.value(100.0), 4500.0);
  EXPECT_DOUBLE_EQ(unit.value(110.0), 4950.0);
  EXPECT_DOUBLE_EQ(unit.marginReq(), 2250.0);
}

TEST(UnitTest, TradeIdFromSecurityEntryTimeAndDirection) {
  Unit long_unit(makeTerms(Direction::Long, 100.0, 1.0));
  Unit short_unit(makeTerms(Direction::Short, 100.0, 1.0));
  EXPECT_EQ(long_unit.tradeId(), "sec_0@1700000000000/L");
  EXPECT_EQ(short_unit.tradeId(), "sec_0@1700000000000/S");
  EXPECT_EQ(trendsim::domain::makeTradeId(
                "ES", trendsim::ms_to_timestamp(1234), Direction::Short),
            "ES@1234/S");
}

TEST(UnitTest, SetStopKeepsOriginal) {
  Unit unit(makeTerms(Direction::Long, 100.0, 1.0));
  unit.setStopPrice(99.0);

  EXPECT_DOUBLE_EQ(unit.stopPrice(), 99.0);
  EXPECT_DOUBLE_EQ(unit.originalStopPrice(), 98.0);
  EXPECT_TRUE(unit.isStoppedOut(98.5));
  EXPECT_EQ(unit.entryTick(), 7u);
}
