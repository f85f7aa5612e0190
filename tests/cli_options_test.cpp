// =============================================================================
// cli_options_test.cpp
// =============================================================================
// Tests for lombard_sim option parsing and the summary table formatting.
// =============================================================================

#include "cli_options.h"
#include "table_report.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace {

CliOptions parse(std::vector<const char*> args) {
  args.insert(args.begin(), "lombard_sim");
  return parse_cli(static_cast<int>(args.size()), args.data());
}

std::string rejected_option(std::vector<const char*> args) {
  try {
    parse(args);
  } catch (const InvalidConfiguration& e) {
    return e.field();
  }
  return "";
}

}  // namespace

TEST(CliOptionsTest, DefaultsToThreeRegimes) {
  CliOptions opts = parse({});
  ASSERT_EQ(opts.regimes.size(), 3u);
  EXPECT_EQ(opts.regimes[1].name, "Mid Return (5%)");
  EXPECT_DOUBLE_EQ(opts.regimes[2].expected_return, 0.08);
  EXPECT_EQ(opts.config.repeats, 10000);
  EXPECT_FALSE(opts.config.has_seed);
}

TEST(CliOptionsTest, ParsesNumericFieldsAndPolicies) {
  CliOptions opts = parse({"--loan=50000", "--rate=0.04", "--years=5", "--portfolio=50000",
                           "--margin=0.35", "--job-loss=0.05", "--volatility=0.15",
                           "--repeats=2500", "--seed=42", "--profit-baseline=zero",
                           "--liquidation-measure=threshold", "--seed-policy=reseed",
                           "--margin-basis=loan", "--confidence=0.99", "--verbose"});

  EXPECT_DOUBLE_EQ(opts.config.portfolio_value, 50000.0);
  EXPECT_DOUBLE_EQ(opts.config.margin_level, 0.35);
  EXPECT_EQ(opts.config.repeats, 2500);
  EXPECT_TRUE(opts.config.has_seed);
  EXPECT_EQ(opts.config.seed, 42u);
  EXPECT_EQ(opts.config.profit_baseline, ProfitBaseline::Zero);
  EXPECT_EQ(opts.config.liquidation_measure, LiquidationMeasure::TerminalBelowThreshold);
  EXPECT_EQ(opts.config.seed_policy, SeedPolicy::ReseedPerRegime);
  EXPECT_EQ(opts.config.margin_basis, MarginBasis::LoanPrincipal);
  EXPECT_DOUBLE_EQ(opts.config.var_confidence, 0.99);
  EXPECT_TRUE(opts.verbose);
}

TEST(CliOptionsTest, RegimeNameMayContainColons) {
  CliOptions opts = parse({"--regime=Bear: 2008:-0.2", "--regime=Flat:0"});
  ASSERT_EQ(opts.regimes.size(), 2u);
  EXPECT_EQ(opts.regimes[0].name, "Bear: 2008");
  EXPECT_DOUBLE_EQ(opts.regimes[0].expected_return, -0.2);
}

TEST(CliOptionsTest, RejectsBadInput) {
  EXPECT_EQ(rejected_option({"--loan=abc"}), "--loan");
  EXPECT_EQ(rejected_option({"--years=2.5"}), "--years");
  EXPECT_EQ(rejected_option({"--seed=-1"}), "--seed");
  EXPECT_EQ(rejected_option({"--regime=NoReturn"}), "--regime");
  EXPECT_EQ(rejected_option({"--seed-policy=sometimes"}), "--seed-policy");
  EXPECT_EQ(rejected_option({"--frobnicate"}), "--frobnicate");
}

TEST(CliOptionsTest, ValidatesParsedConfig) {
  EXPECT_EQ(rejected_option({"--volatility=-0.2"}), "volatility");
  EXPECT_EQ(rejected_option({"--repeats=0"}), "repeats");
  EXPECT_EQ(rejected_option({"--regime=A:0.1", "--regime=A:0.2"}), "regimes");
}

TEST(CliOptionsTest, HelpSkipsValidation) {
  CliOptions opts = parse({"--repeats=0", "--help"});
  EXPECT_TRUE(opts.help);
  EXPECT_NE(usage().find("--regime=NAME:RETURN"), std::string::npos);
}

TEST(TableReportTest, FormatsAmountsAndPercentages) {
  EXPECT_EQ(format_chf(1234567.4), "1,234,567 CHF");
  EXPECT_EQ(format_chf(-1234.6), "-1,235 CHF");
  EXPECT_EQ(format_chf(999.0), "999 CHF");
  EXPECT_EQ(format_chf(-0.2), "0 CHF");
  EXPECT_EQ(format_percent(0.1234), "12.34%");
  EXPECT_EQ(format_percent(1.0), "100.00%");
}

TEST(TableReportTest, FormatsAmountsBeyondIntegerRange) {
  EXPECT_EQ(format_chf(1e20), "100,000,000,000,000,000,000 CHF");

  const std::string huge_loss = format_chf(-1e25);
  EXPECT_EQ(huge_loss.rfind("-10,000,000,000,000,000,", 0), 0u);
  EXPECT_EQ(huge_loss.find("--"), std::string::npos);
  EXPECT_EQ(huge_loss.size(), std::string("-10,000,000,000,000,000,000,000,000 CHF").size());
}

TEST(TableReportTest, HeaderColumnsAreSeparated) {
  SimulationConfig config;
  RegimeResult a;
  a.name = "Mid Return (5%)";

  std::ostringstream out;
  TableReport report(out);
  publish(config, {a}, report);

  EXPECT_EQ(out.str().find("CVaRLiquidation"), std::string::npos);
  EXPECT_NE(out.str().find("CVaR  Liquidation Risk"), std::string::npos);
}

TEST(TableReportTest, PrintsHeaderOnceAndOneRowPerRegime) {
  SimulationConfig config;
  RegimeResult a;
  a.name = "Low Return (3%)";
  a.summary.profit_probability = 0.5;
  a.summary.expected_value = 400000.0;
  RegimeResult b = a;
  b.name = "High Return (8%)";

  std::ostringstream out;
  TableReport report(out);
  publish(config, {a, b}, report);

  const std::string text = out.str();
  EXPECT_NE(text.find("VaR 95%"), std::string::npos);
  EXPECT_EQ(text.find("Profit Prob."), text.rfind("Profit Prob."));
  EXPECT_NE(text.find("Low Return (3%)"), std::string::npos);
  EXPECT_NE(text.find("400,000 CHF"), std::string::npos);
  EXPECT_NE(text.find("50.00%"), std::string::npos);
}
