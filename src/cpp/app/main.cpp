// lombard_sim: Monte Carlo risk of a Lombard loan with job-loss driven
// forced liquidation, summarized per return regime.

#include "cli_options.h"
#include "logger.h"
#include "regime_aggregator.h"
#include "result_sink.h"
#include "table_report.h"

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parse_cli(argc, argv);
    } catch (const InvalidConfiguration& e) {
        std::cerr << "[main] error: " << e.what() << "\n\n" << usage();
        return 1;
    }
    if (opts.help) {
        std::cout << usage();
        return 0;
    }

    Logger logger = opts.verbose ? Logger(std::cerr, LogLevel::Debug) : Logger(std::cerr, LogLevel::Warn);

    try {
        RegimeAggregator aggregator(opts.config, logger);
        std::vector<RegimeResult> results = aggregator.run(opts.regimes);

        TableReport report(std::cout);
        publish(opts.config, results, report);
    } catch (const InvalidConfiguration& e) {
        logger.error("main", e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error("main", std::string("unexpected failure: ") + e.what());
        return 2;
    }
    return 0;
}
