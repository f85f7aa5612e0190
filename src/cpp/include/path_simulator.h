#pragma once

#include "lombard_config.h"
#include "random_source.h"

/// Result of one leveraged path.
struct PathOutcome {
    /// Ending portfolio value minus loan owed at exit.
    double net_terminal_value = 0.0;
    /// True when the lender forced liquidation before the path could run to term.
    bool liquidated = false;
    /// Year the path ended, in [1, duration_years].
    int exit_year = 0;
};

/// Runs single realizations of the leveraged portfolio over the loan term.
class PathSimulator {
public:
    /// Validates the config; throws InvalidConfiguration.
    explicit PathSimulator(const SimulationConfig& config);

    /// Simulate one path. Each year draws one normal return, then one uniform
    /// for the job-loss event. Liquidation requires both a job loss and a
    /// portfolio below the threshold in the same year.
    PathOutcome run(double expected_return, RandomSource& rng) const;

    const SimulationConfig& config() const { return config_; }

private:
    SimulationConfig config_;
    double start_value_;
    double threshold_;
    double full_term_repayment_;
};
