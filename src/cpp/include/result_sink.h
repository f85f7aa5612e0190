#pragma once

#include "lombard_config.h"
#include "regime_aggregator.h"

#include <vector>

/// Consumer of finished regime results (tables, plots, exports).
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void on_regime(const SimulationConfig& config, const RegimeResult& result) = 0;

    /// Called once after the last regime.
    virtual void on_complete() {}
};

/// Hand every result to the sink in order, then signal completion.
void publish(
    const SimulationConfig& config,
    const std::vector<RegimeResult>& results,
    ResultSink& sink
);
