// =============================================================================
// policy_config_test.cpp
// =============================================================================
// Unit tests for the policy enums and PortfolioConfig / SecurityConfig.
//
// Validates:
//   - Policy names parse to their enum and back; unknown names throw
//   - minWarmupLength() follows the enabled windows
//   - validate() rejects out-of-range values
//   - resolveSecurityConfig() inherits defaults and applies overrides
// =============================================================================

#include "trendsim/domain/config.hpp"
#include "trendsim/domain/policy.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace trendsim::domain;

// -----------------------------------------------------------------------------
// 1. Policy names
// -----------------------------------------------------------------------------
TEST(PolicyTest, NamesRoundTrip) {
  for (auto t : {EntryType::Breakout, EntryType::MacdSignalCrossover,
                 EntryType::MacdZeroCrossover}) {
    EXPECT_EQ(parseEntryType(entryTypeToString(t)), t);
  }
  for (auto t : {ExitType::Timed, ExitType::Breakout,
                 ExitType::MacdSignalCrossover}) {
    EXPECT_EQ(parseExitType(exitTypeToString(t)), t);
  }
  for (auto p : {ExtraUnitPolicy::AsNewUnit, ExtraUnitPolicy::UsingAtr,
                 ExtraUnitPolicy::No}) {
    EXPECT_EQ(parseExtraUnitPolicy(extraUnitPolicyToString(p)), p);
  }
  EXPECT_STREQ(exitKindToString(ExitKind::StopOut), "Stop out");
  EXPECT_STREQ(exitKindToString(ExitKind::ExitAll), "Exit all");
}

TEST(PolicyTest, UnknownNamesThrow) {
  EXPECT_THROW(parseEntryType("Momentum"), std::invalid_argument);
  EXPECT_THROW(parseEntryType("breakout"), std::invalid_argument);
  EXPECT_THROW(parseExitType(""), std::invalid_argument);
  EXPECT_THROW(parseExtraUnitPolicy("Yes"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Warm-up length
// -----------------------------------------------------------------------------
TEST(PortfolioConfigTest, MinWarmupLength) {
  PortfolioConfig config;  // ATR 20, breakout 20/20, timed exit
  EXPECT_FALSE(config.usesMacd());
  EXPECT_EQ(config.minWarmupLength(), 21u);

  config.exit_type = ExitType::Breakout;  // exit breakouts 80
  EXPECT_EQ(config.minWarmupLength(), 81u);

  config.exit_type = ExitType::Timed;
  config.entry_type = EntryType::MacdSignalCrossover;  // 26 + 9
  EXPECT_TRUE(config.usesMacd());
  EXPECT_EQ(config.minWarmupLength(), 36u);
}

// -----------------------------------------------------------------------------
// 3. validate()
// -----------------------------------------------------------------------------
TEST(PortfolioConfigTest, ValidateRejectsOutOfRange) {
  PortfolioConfig config;
  EXPECT_NO_THROW(config.validate());

  auto bad = config;
  bad.lot_size = 0;
  EXPECT_THROW(bad.validate(), std::invalid_argument);

  bad = config;
  bad.notional_account_size = 0.0;
  EXPECT_THROW(bad.validate(), std::invalid_argument);

  bad = config;
  bad.max_margin_per_trade = -1.0;
  EXPECT_THROW(bad.validate(), std::invalid_argument);

  bad = config;
  bad.long_breakout = 0;
  EXPECT_THROW(bad.validate(), std::invalid_argument);
}

TEST(PortfolioConfigTest, MacdLengthsCheckedOnlyWhenUsed) {
  PortfolioConfig config;
  config.macd.fast_length = 30;  // not shorter than slow
  EXPECT_NO_THROW(config.validate());

  config.use_polarity_condition = true;
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 4. resolveSecurityConfig()
// -----------------------------------------------------------------------------
TEST(SecurityConfigTest, OverridesApplyAndDefaultsInherit) {
  PortfolioConfig portfolio;
  portfolio.margin_factor = 0.2;

  SecurityOverrides overrides;
  overrides.name = "sec_1";
  overrides.lot_size = 25;
  overrides.max_units = 2;

  const SecurityConfig config = resolveSecurityConfig(portfolio, overrides);
  EXPECT_EQ(config.name, "sec_1");
  EXPECT_EQ(config.lot_size, 25);
  EXPECT_EQ(config.max_units, 2);
  EXPECT_EQ(config.atr_average_range, portfolio.atr_average_range);
  EXPECT_DOUBLE_EQ(config.margin_factor, 0.2);
  EXPECT_DOUBLE_EQ(config.stop_loss_factor, portfolio.stop_loss_factor);
  EXPECT_FALSE(config.macd.has_value());
}

TEST(SecurityConfigTest, MacdCarriedWhenPortfolioUsesIt) {
  PortfolioConfig portfolio;
  portfolio.entry_type = EntryType::MacdZeroCrossover;

  SecurityOverrides overrides;
  overrides.name = "sec_0";
  const SecurityConfig config = resolveSecurityConfig(portfolio, overrides);
  ASSERT_TRUE(config.macd.has_value());
  EXPECT_EQ(config.macd->slow_length, 26);
}

TEST(SecurityConfigTest, RejectsBadOverridesAndMissingName) {
  PortfolioConfig portfolio;

  SecurityOverrides unnamed;
  EXPECT_THROW(resolveSecurityConfig(portfolio, unnamed),
               std::invalid_argument);

  SecurityOverrides bad;
  bad.name = "sec_0";
  bad.margin_factor = 0.0;
  EXPECT_THROW(resolveSecurityConfig(portfolio, bad), std::invalid_argument);
}
