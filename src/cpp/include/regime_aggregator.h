#pragma once

#include "lombard_config.h"
#include "logger.h"
#include "path_simulator.h"
#include "random_source.h"
#include "statistics.h"

#include <string>
#include <vector>

struct RegimeResult {
    std::string name;
    double expected_return = 0.0;
    /// One outcome per repeat, in generation order.
    std::vector<PathOutcome> outcomes;
    RegimeSummary summary;
};

/// Net terminal values of a result, in generation order.
std::vector<double> net_values(const RegimeResult& result);

/// Repeats PathSimulator per regime and summarizes each outcome sample.
class RegimeAggregator {
public:
    /// Validates the config; throws InvalidConfiguration.
    explicit RegimeAggregator(const SimulationConfig& config, Logger logger = Logger());

    /// Run every regime with streams seeded per config.seed_policy.
    /// Results are returned in declaration order.
    std::vector<RegimeResult> run(const std::vector<Regime>& regimes) const;

    /// Run every regime on one caller-owned stream; seed_policy is ignored.
    std::vector<RegimeResult> run(const std::vector<Regime>& regimes, RandomSource& rng) const;

    /// config.repeats paths of one regime.
    RegimeResult run_regime(const Regime& regime, RandomSource& rng) const;

    const SimulationConfig& config() const { return simulator_.config(); }

private:
    PathSimulator simulator_;
    Logger logger_;
};
