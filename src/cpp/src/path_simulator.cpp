#include "path_simulator.h"

PathSimulator::PathSimulator(const SimulationConfig& config)
    : config_(config),
      start_value_(0.0),
      threshold_(0.0),
      full_term_repayment_(0.0) {
    validate(config_);
    start_value_ = total_invested(config_);
    threshold_ = liquidation_threshold(config_);
    full_term_repayment_ = total_loan_repayment(config_);
}

// Discrete annual compounding with i.i.d. normal returns.
PathOutcome PathSimulator::run(double expected_return, RandomSource& rng) const {
    double value = start_value_;

    for (int year = 1; year <= config_.duration_years; ++year) {
        double yearly_return = rng.normal(expected_return, config_.volatility);
        value *= (1.0 + yearly_return);

        bool job_lost = rng.uniform() < config_.job_loss_probability;
        bool below_margin = value < threshold_;

        if (job_lost && below_margin) {
            PathOutcome out;
            out.net_terminal_value = value - loan_owed(config_, year);
            out.liquidated = true;
            out.exit_year = year;
            return out;
        }
    }

    PathOutcome out;
    out.net_terminal_value = value - full_term_repayment_;
    out.liquidated = false;
    out.exit_year = config_.duration_years;
    return out;
}
