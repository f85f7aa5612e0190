#pragma once

#include "lombard_config.h"
#include "path_simulator.h"

#include <cstddef>
#include <vector>

struct TailSummary {
    /// Value-at-Risk: the alpha quantile of the sample.
    double var = 0.0;
    /// Conditional Value-at-Risk: mean of values at or below var.
    double cvar = 0.0;
    /// 95th percentile of the sample.
    double q95 = 0.0;
};

struct RegimeSummary {
    /// Fraction of net values strictly above break_even_value().
    double profit_probability = 0.0;
    /// Arithmetic mean of net values.
    double expected_value = 0.0;
    /// (1 - var_confidence) quantile of net values.
    double value_at_risk = 0.0;
    /// Mean of net values at or below value_at_risk.
    double conditional_value_at_risk = 0.0;
    /// 95th percentile of net values.
    double upper_quantile_95 = 0.0;
    /// liquidation_count over the number of paths.
    double liquidation_rate = 0.0;
    /// Paths counted as liquidated under the config's LiquidationMeasure.
    std::size_t liquidation_count = 0;
    /// Confidence the VaR was taken at.
    double var_confidence = 0.95;
};

/// Empirical quantile with linear interpolation between order statistics.
double quantile(std::vector<double> values, double q);

double mean(const std::vector<double>& values);

/// Tail metrics of a sample at the requested alpha.
TailSummary summarize_values(const std::vector<double>& values, double alpha);

/// Summary statistics of one regime's outcomes under the config's policies.
RegimeSummary summarize_outcomes(
    const std::vector<PathOutcome>& outcomes,
    const SimulationConfig& config
);
