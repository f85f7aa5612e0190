#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/// Raised when a configuration field violates its constraint.
/// what() reads "<field>: <constraint>".
class InvalidConfiguration : public std::invalid_argument {
public:
    InvalidConfiguration(const std::string& field, const std::string& constraint);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/// Amount the liquidation threshold is measured against.
enum class MarginBasis {
    Equity,         ///< portfolio value (excluding borrowed funds) * margin level
    LoanPrincipal   ///< loan principal * margin level
};

/// Break-even value used by the profit probability.
enum class ProfitBaseline {
    OriginalEquity, ///< total invested minus loan principal
    Zero
};

/// How liquidations are counted in the summary.
enum class LiquidationMeasure {
    Flag,                  ///< PathOutcome::liquidated
    TerminalBelowThreshold ///< net terminal value below the liquidation threshold
};

/// How the random stream is seeded across regimes.
enum class SeedPolicy {
    SharedStream,         ///< seeded once per run, regimes draw in declaration order
    ReseedPerRegime,      ///< same seed before every regime; regimes see identical raw draws
    IndependentPerRegime  ///< sub-stream derived from (seed, regime name)
};

struct SimulationConfig {
    /// Amount borrowed against the portfolio.
    double loan_principal = 50000.0;
    /// Annual loan interest, compounded once per whole year.
    double loan_rate = 0.04;
    /// Loan term in whole years.
    int duration_years = 5;
    /// Initial portfolio value excluding borrowed funds.
    double portfolio_value = 390000.0;
    /// Maintenance margin fraction in [0, 1).
    double margin_level = 0.6;
    /// Probability of losing the income in any one year.
    double job_loss_probability = 0.05;
    /// Standard deviation of the annual return draw.
    double volatility = 0.15;
    /// Paths simulated per regime.
    int repeats = 5000;
    /// When false a std::random_device seed is drawn per run.
    bool has_seed = false;
    /// Ignored unless has_seed.
    std::uint32_t seed = 0;

    /// Defaults to Equity: the threshold is portfolio_value * margin_level,
    /// not loan_principal * margin_level.
    MarginBasis margin_basis = MarginBasis::Equity;
    /// Break-even used by RegimeSummary::profit_probability.
    ProfitBaseline profit_baseline = ProfitBaseline::OriginalEquity;
    /// Source of RegimeSummary::liquidation_count.
    LiquidationMeasure liquidation_measure = LiquidationMeasure::Flag;
    /// Stream layout across regimes.
    SeedPolicy seed_policy = SeedPolicy::IndependentPerRegime;
    /// VaR is reported at the (1 - var_confidence) quantile.
    double var_confidence = 0.95;
};

/// A named expected annual return.
struct Regime {
    /// Unique within a run.
    std::string name;
    /// Mean of the annual normal return draw; may be negative.
    double expected_return = 0.0;
};

/// Throws InvalidConfiguration on the first field out of range.
void validate(const SimulationConfig& config);

/// Regime set must be non-empty, names non-empty and unique, returns finite.
void validate_regimes(const std::vector<Regime>& regimes);

double total_invested(const SimulationConfig& config);
double liquidation_threshold(const SimulationConfig& config);
/// Loan owed after `year` whole years of annual compounding.
double loan_owed(const SimulationConfig& config, int year);
double total_loan_repayment(const SimulationConfig& config);
double break_even_value(const SimulationConfig& config);

const char* to_string(MarginBasis basis);
const char* to_string(ProfitBaseline baseline);
const char* to_string(LiquidationMeasure measure);
const char* to_string(SeedPolicy policy);
