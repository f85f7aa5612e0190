#include "result_sink.h"

void publish(
    const SimulationConfig& config,
    const std::vector<RegimeResult>& results,
    ResultSink& sink
) {
    for (const RegimeResult& result : results) {
        sink.on_regime(config, result);
    }
    sink.on_complete();
}
