#include "statistics.h"

#include <algorithm>
#include <stdexcept>

// Compute an empirical quantile for a vector of values.
double quantile(std::vector<double> values, double q) {
    if (values.empty()) {
        throw std::invalid_argument("values is empty");
    }
    if (q < 0.0 || q > 1.0) {
        throw std::invalid_argument("quantile must lie in [0, 1]");
    }
    std::sort(values.begin(), values.end());
    double pos = q * (static_cast<double>(values.size() - 1));
    std::size_t idx = static_cast<std::size_t>(pos);
    double frac = pos - static_cast<double>(idx);
    if (idx + 1 < values.size()) {
        return values[idx] * (1.0 - frac) + values[idx + 1] * frac;
    }
    return values[idx];
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::invalid_argument("values is empty");
    }
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

TailSummary summarize_values(const std::vector<double>& values, double alpha) {
    TailSummary out;
    out.var = quantile(values, alpha);
    double tail_sum = 0.0;
    std::size_t tail_count = 0;
    for (double v : values) {
        if (v <= out.var) {
            tail_sum += v;
            tail_count += 1;
        }
    }
    out.cvar = tail_count ? (tail_sum / static_cast<double>(tail_count)) : out.var;
    out.q95 = quantile(values, 0.95);
    return out;
}

RegimeSummary summarize_outcomes(
    const std::vector<PathOutcome>& outcomes,
    const SimulationConfig& config
) {
    if (outcomes.empty()) {
        throw std::invalid_argument("outcomes is empty");
    }

    std::vector<double> net(outcomes.size(), 0.0);
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        net[i] = outcomes[i].net_terminal_value;
    }

    const double baseline = break_even_value(config);
    const double threshold = liquidation_threshold(config);
    std::size_t profitable = 0;
    std::size_t liquidated = 0;
    for (const PathOutcome& o : outcomes) {
        if (o.net_terminal_value > baseline) {
            profitable += 1;
        }
        bool counted = config.liquidation_measure == LiquidationMeasure::Flag
            ? o.liquidated
            : o.net_terminal_value < threshold;
        if (counted) {
            liquidated += 1;
        }
    }

    const double n = static_cast<double>(outcomes.size());
    TailSummary tail = summarize_values(net, 1.0 - config.var_confidence);

    RegimeSummary out;
    out.profit_probability = static_cast<double>(profitable) / n;
    out.expected_value = mean(net);
    out.value_at_risk = tail.var;
    out.conditional_value_at_risk = tail.cvar;
    out.upper_quantile_95 = tail.q95;
    out.liquidation_count = liquidated;
    out.liquidation_rate = static_cast<double>(liquidated) / n;
    out.var_confidence = config.var_confidence;
    return out;
}
