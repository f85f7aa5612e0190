#include "lombard_config.h"

#include <cmath>
#include <set>

InvalidConfiguration::InvalidConfiguration(
    const std::string& field,
    const std::string& constraint
)
    : std::invalid_argument(field + ": " + constraint), field_(field) {}

// Finite and strictly positive.
static void require_positive(double value, const char* field) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidConfiguration(field, "must be a finite value > 0");
    }
}

static void require_probability(double value, const char* field) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw InvalidConfiguration(field, "must lie in [0, 1]");
    }
}

void validate(const SimulationConfig& config) {
    require_positive(config.loan_principal, "loan_principal");
    if (!std::isfinite(config.loan_rate) || config.loan_rate <= -1.0) {
        throw InvalidConfiguration("loan_rate", "must be a finite value > -1");
    }
    if (config.duration_years < 1) {
        throw InvalidConfiguration("duration_years", "must be >= 1");
    }
    require_positive(config.portfolio_value, "portfolio_value");
    if (!std::isfinite(config.margin_level) || config.margin_level < 0.0 ||
        config.margin_level >= 1.0) {
        throw InvalidConfiguration("margin_level", "must lie in [0, 1)");
    }
    require_probability(config.job_loss_probability, "job_loss_probability");
    if (!std::isfinite(config.volatility) || config.volatility < 0.0) {
        throw InvalidConfiguration("volatility", "must be a finite value >= 0");
    }
    if (config.repeats < 1) {
        throw InvalidConfiguration("repeats", "must be >= 1");
    }
    if (!std::isfinite(config.var_confidence) || config.var_confidence <= 0.0 ||
        config.var_confidence >= 1.0) {
        throw InvalidConfiguration("var_confidence", "must lie in (0, 1)");
    }
}

void validate_regimes(const std::vector<Regime>& regimes) {
    if (regimes.empty()) {
        throw InvalidConfiguration("regimes", "at least one regime is required");
    }
    std::set<std::string> seen;
    for (const Regime& regime : regimes) {
        if (regime.name.empty()) {
            throw InvalidConfiguration("regimes", "regime name must not be empty");
        }
        if (!seen.insert(regime.name).second) {
            throw InvalidConfiguration("regimes", "duplicate regime name '" + regime.name + "'");
        }
        if (!std::isfinite(regime.expected_return)) {
            throw InvalidConfiguration(
                "regimes", "expected return of '" + regime.name + "' must be finite");
        }
    }
}

double total_invested(const SimulationConfig& config) {
    return config.portfolio_value + config.loan_principal;
}

double liquidation_threshold(const SimulationConfig& config) {
    double basis = config.margin_basis == MarginBasis::Equity
        ? config.portfolio_value
        : config.loan_principal;
    return basis * config.margin_level;
}

double loan_owed(const SimulationConfig& config, int year) {
    return config.loan_principal * std::pow(1.0 + config.loan_rate, year);
}

double total_loan_repayment(const SimulationConfig& config) {
    return loan_owed(config, config.duration_years);
}

double break_even_value(const SimulationConfig& config) {
    if (config.profit_baseline == ProfitBaseline::Zero) {
        return 0.0;
    }
    return total_invested(config) - config.loan_principal;
}

const char* to_string(MarginBasis basis) {
    switch (basis) {
        case MarginBasis::Equity: return "equity";
        case MarginBasis::LoanPrincipal: return "loan";
    }
    return "unknown";
}

const char* to_string(ProfitBaseline baseline) {
    switch (baseline) {
        case ProfitBaseline::OriginalEquity: return "equity";
        case ProfitBaseline::Zero: return "zero";
    }
    return "unknown";
}

const char* to_string(LiquidationMeasure measure) {
    switch (measure) {
        case LiquidationMeasure::Flag: return "flag";
        case LiquidationMeasure::TerminalBelowThreshold: return "threshold";
    }
    return "unknown";
}

const char* to_string(SeedPolicy policy) {
    switch (policy) {
        case SeedPolicy::SharedStream: return "shared";
        case SeedPolicy::ReseedPerRegime: return "reseed";
        case SeedPolicy::IndependentPerRegime: return "independent";
    }
    return "unknown";
}
