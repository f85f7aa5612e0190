#include "regime_aggregator.h"

#include <sstream>

namespace {
const char* kComponent = "RegimeAggregator";
}

std::vector<double> net_values(const RegimeResult& result) {
    std::vector<double> out;
    out.reserve(result.outcomes.size());
    for (const PathOutcome& o : result.outcomes) {
        out.push_back(o.net_terminal_value);
    }
    return out;
}

RegimeAggregator::RegimeAggregator(const SimulationConfig& config, Logger logger)
    : simulator_(config), logger_(logger) {}

std::vector<RegimeResult> RegimeAggregator::run(const std::vector<Regime>& regimes) const {
    validate_regimes(regimes);

    const SimulationConfig& cfg = simulator_.config();
    const std::uint32_t seed = cfg.has_seed ? cfg.seed : entropy_seed();
    if (logger_.enabled(LogLevel::Debug)) {
        std::ostringstream msg;
        msg << "seed_policy=" << to_string(cfg.seed_policy) << " seed=" << seed
            << (cfg.has_seed ? "" : " (entropy)");
        logger_.debug(kComponent, msg.str());
    }
    if (cfg.seed_policy == SeedPolicy::ReseedPerRegime && regimes.size() > 1) {
        logger_.warn(kComponent, "reseed policy: every regime replays the same raw draws");
    }

    MersenneSource rng(seed);
    std::vector<RegimeResult> results;
    results.reserve(regimes.size());
    for (const Regime& regime : regimes) {
        if (cfg.seed_policy == SeedPolicy::ReseedPerRegime) {
            rng.reseed(seed);
        } else if (cfg.seed_policy == SeedPolicy::IndependentPerRegime) {
            rng.reseed(seed, regime.name);
        }
        results.push_back(run_regime(regime, rng));
    }
    return results;
}

std::vector<RegimeResult> RegimeAggregator::run(
    const std::vector<Regime>& regimes,
    RandomSource& rng
) const {
    validate_regimes(regimes);

    std::vector<RegimeResult> results;
    results.reserve(regimes.size());
    for (const Regime& regime : regimes) {
        results.push_back(run_regime(regime, rng));
    }
    return results;
}

RegimeResult RegimeAggregator::run_regime(const Regime& regime, RandomSource& rng) const {
    const SimulationConfig& cfg = simulator_.config();

    if (logger_.enabled(LogLevel::Info)) {
        std::ostringstream msg;
        msg << "regime='" << regime.name << "' expected_return=" << regime.expected_return
            << " repeats=" << cfg.repeats;
        logger_.info(kComponent, msg.str());
    }

    RegimeResult result;
    result.name = regime.name;
    result.expected_return = regime.expected_return;
    result.outcomes.reserve(static_cast<std::size_t>(cfg.repeats));
    for (int i = 0; i < cfg.repeats; ++i) {
        result.outcomes.push_back(simulator_.run(regime.expected_return, rng));
    }
    result.summary = summarize_outcomes(result.outcomes, cfg);

    if (logger_.enabled(LogLevel::Info)) {
        std::ostringstream msg;
        msg << "regime='" << regime.name << "' done: mean=" << result.summary.expected_value
            << " var=" << result.summary.value_at_risk
            << " liquidations=" << result.summary.liquidation_count;
        logger_.info(kComponent, msg.str());
    }
    return result;
}
