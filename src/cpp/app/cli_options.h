#pragma once

#include "lombard_config.h"

#include <string>
#include <vector>

struct CliOptions {
    SimulationConfig config;
    /// Falls back to default_regimes() when no --regime is given.
    std::vector<Regime> regimes;
    bool verbose = false;
    bool help = false;
};

/// Low, mid and high return regimes (3%, 5%, 8%).
std::vector<Regime> default_regimes();

/// Parse --key=value options. Throws InvalidConfiguration naming the option.
/// The returned config is validated unless help was requested.
CliOptions parse_cli(int argc, const char* const* argv);

std::string usage();
