// =============================================================================
// lombard_config_test.cpp
// =============================================================================
// Unit tests for SimulationConfig validation and its derived quantities.
// =============================================================================

#include "lombard_config.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

class LombardConfigTest : public ::testing::Test {
 protected:
  SimulationConfig config;

  // Runs validate() and returns the field named by the exception, or "" if
  // nothing was thrown.
  std::string rejected_field() const {
    try {
      validate(config);
    } catch (const InvalidConfiguration& e) {
      return e.field();
    }
    return "";
  }
};

TEST_F(LombardConfigTest, DefaultsAreValid) {
  EXPECT_NO_THROW(validate(config));
}

TEST_F(LombardConfigTest, RejectsNonPositiveDuration) {
  config.duration_years = 0;
  EXPECT_EQ(rejected_field(), "duration_years");
}

TEST_F(LombardConfigTest, RejectsNegativeVolatility) {
  config.volatility = -0.01;
  EXPECT_EQ(rejected_field(), "volatility");
  EXPECT_THROW(validate(config), std::invalid_argument);
}

TEST_F(LombardConfigTest, ZeroVolatilityIsAccepted) {
  config.volatility = 0.0;
  EXPECT_NO_THROW(validate(config));
}

TEST_F(LombardConfigTest, RejectsRepeatsBelowOne) {
  config.repeats = 0;
  EXPECT_EQ(rejected_field(), "repeats");
}

TEST_F(LombardConfigTest, RejectsProbabilityOutsideUnitInterval) {
  config.job_loss_probability = 1.5;
  EXPECT_EQ(rejected_field(), "job_loss_probability");
  config.job_loss_probability = -0.1;
  EXPECT_EQ(rejected_field(), "job_loss_probability");
  config.job_loss_probability = 1.0;
  EXPECT_EQ(rejected_field(), "");
}

TEST_F(LombardConfigTest, RejectsMarginLevelOfOne) {
  config.margin_level = 1.0;
  EXPECT_EQ(rejected_field(), "margin_level");
}

TEST_F(LombardConfigTest, RejectsLoanRateAtOrBelowMinusOne) {
  config.loan_rate = -1.0;
  EXPECT_EQ(rejected_field(), "loan_rate");
  config.loan_rate = -2.5;
  EXPECT_EQ(rejected_field(), "loan_rate");
  config.loan_rate = -0.5;
  EXPECT_EQ(rejected_field(), "");
}

TEST_F(LombardConfigTest, RejectsConfidenceOutsideOpenUnitInterval) {
  config.var_confidence = 0.0;
  EXPECT_EQ(rejected_field(), "var_confidence");
  config.var_confidence = 1.0;
  EXPECT_EQ(rejected_field(), "var_confidence");
  config.var_confidence = 1.2;
  EXPECT_EQ(rejected_field(), "var_confidence");
  config.var_confidence = 0.99;
  EXPECT_EQ(rejected_field(), "");
}

TEST_F(LombardConfigTest, RejectsNonFiniteAmounts) {
  config.loan_principal = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(rejected_field(), "loan_principal");
  config.loan_principal = 1000.0;
  config.portfolio_value = 0.0;
  EXPECT_EQ(rejected_field(), "portfolio_value");
}

TEST_F(LombardConfigTest, MessageNamesFieldAndConstraint) {
  config.repeats = -3;
  try {
    validate(config);
    FAIL() << "expected InvalidConfiguration";
  } catch (const InvalidConfiguration& e) {
    EXPECT_EQ(std::string(e.what()), "repeats: must be >= 1");
  }
}

TEST_F(LombardConfigTest, DerivedQuantities) {
  config.loan_principal = 50000.0;
  config.portfolio_value = 390000.0;
  config.loan_rate = 0.04;
  config.duration_years = 5;
  config.margin_level = 0.6;

  EXPECT_DOUBLE_EQ(total_invested(config), 440000.0);
  EXPECT_DOUBLE_EQ(liquidation_threshold(config), 234000.0);
  EXPECT_DOUBLE_EQ(loan_owed(config, 2), 50000.0 * 1.04 * 1.04);
  EXPECT_DOUBLE_EQ(total_loan_repayment(config), 50000.0 * std::pow(1.04, 5));
  EXPECT_DOUBLE_EQ(break_even_value(config), 390000.0);

  config.margin_basis = MarginBasis::LoanPrincipal;
  EXPECT_DOUBLE_EQ(liquidation_threshold(config), 30000.0);

  config.profit_baseline = ProfitBaseline::Zero;
  EXPECT_DOUBLE_EQ(break_even_value(config), 0.0);
}

TEST(RegimeValidationTest, RejectsEmptySet) {
  std::vector<Regime> regimes;
  EXPECT_THROW(validate_regimes(regimes), InvalidConfiguration);
}

TEST(RegimeValidationTest, RejectsDuplicateNames) {
  std::vector<Regime> regimes = {{"Mid", 0.05}, {"Mid", 0.06}};
  EXPECT_THROW(validate_regimes(regimes), InvalidConfiguration);
}

TEST(RegimeValidationTest, RejectsEmptyName) {
  std::vector<Regime> regimes = {{"Mid", 0.05}, {"", 0.03}};
  try {
    validate_regimes(regimes);
    FAIL() << "expected InvalidConfiguration";
  } catch (const InvalidConfiguration& e) {
    EXPECT_EQ(e.field(), "regimes");
  }
}

TEST(RegimeValidationTest, RejectsNonFiniteReturn) {
  std::vector<Regime> nan_return = {{"Broken", std::numeric_limits<double>::quiet_NaN()}};
  EXPECT_THROW(validate_regimes(nan_return), InvalidConfiguration);

  std::vector<Regime> inf_return = {{"Moon", std::numeric_limits<double>::infinity()}};
  EXPECT_THROW(validate_regimes(inf_return), InvalidConfiguration);
}

TEST(RegimeValidationTest, AcceptsNegativeReturns) {
  std::vector<Regime> regimes = {{"Crash", -0.2}, {"Flat", 0.0}};
  EXPECT_NO_THROW(validate_regimes(regimes));
}
