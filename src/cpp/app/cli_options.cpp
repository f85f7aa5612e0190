#include "cli_options.h"

#include <cstring>
#include <limits>
#include <stdexcept>

std::vector<Regime> default_regimes() {
    return {
        {"Low Return (3%)", 0.03},
        {"Mid Return (5%)", 0.05},
        {"High Return (8%)", 0.08},
    };
}

std::string usage() {
    return
        "lombard_sim [options]\n"
        "  --loan=50000            loan principal\n"
        "  --rate=0.04             annual loan interest rate\n"
        "  --years=5               loan duration in whole years\n"
        "  --portfolio=390000      portfolio value excluding the loan\n"
        "  --margin=0.6            maintenance margin level\n"
        "  --job-loss=0.05         annual job loss probability\n"
        "  --volatility=0.15       annual return standard deviation\n"
        "  --repeats=10000         paths per regime\n"
        "  --seed=N                seed the random stream\n"
        "  --regime=NAME:RETURN    add a regime (repeatable)\n"
        "  --confidence=0.95       VaR confidence level\n"
        "  --margin-basis=equity|loan\n"
        "  --profit-baseline=equity|zero\n"
        "  --liquidation-measure=flag|threshold\n"
        "  --seed-policy=independent|shared|reseed\n"
        "  --verbose               log progress to stderr\n"
        "  --help\n";
}

// Whole string must parse as a number.
static double parse_double(const std::string& option, const std::string& text) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration(option, "expected a number, got '" + text + "'");
    }
    if (used != text.size()) {
        throw InvalidConfiguration(option, "expected a number, got '" + text + "'");
    }
    return value;
}

static long long parse_integer(const std::string& option, const std::string& text) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw InvalidConfiguration(option, "expected an integer, got '" + text + "'");
    }
    if (used != text.size()) {
        throw InvalidConfiguration(option, "expected an integer, got '" + text + "'");
    }
    return value;
}

static int parse_int(const std::string& option, const std::string& text) {
    long long value = parse_integer(option, text);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw InvalidConfiguration(option, "out of range");
    }
    return static_cast<int>(value);
}

static Regime parse_regime(const std::string& text) {
    std::size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw InvalidConfiguration("--regime", "expected NAME:RETURN, got '" + text + "'");
    }
    Regime regime;
    regime.name = text.substr(0, colon);
    regime.expected_return = parse_double("--regime", text.substr(colon + 1));
    return regime;
}

CliOptions parse_cli(int argc, const char* const* argv) {
    CliOptions opts;
    opts.config.repeats = 10000;

    for (int i = 1; i < argc; ++i) {
        std::string s(argv[i]);
        auto eat = [&](const char* key) -> const char* {
            std::size_t n = std::strlen(key);
            if (s.size() >= n && s.compare(0, n, key) == 0) return s.c_str() + n;
            return nullptr;
        };

        if (s == "--help" || s == "-h") opts.help = true;
        else if (s == "--verbose" || s == "-v") opts.verbose = true;
        else if (auto v = eat("--loan=")) opts.config.loan_principal = parse_double("--loan", v);
        else if (auto v = eat("--rate=")) opts.config.loan_rate = parse_double("--rate", v);
        else if (auto v = eat("--years=")) opts.config.duration_years = parse_int("--years", v);
        else if (auto v = eat("--portfolio=")) opts.config.portfolio_value = parse_double("--portfolio", v);
        else if (auto v = eat("--margin=")) opts.config.margin_level = parse_double("--margin", v);
        else if (auto v = eat("--job-loss=")) opts.config.job_loss_probability = parse_double("--job-loss", v);
        else if (auto v = eat("--volatility=")) opts.config.volatility = parse_double("--volatility", v);
        else if (auto v = eat("--repeats=")) opts.config.repeats = parse_int("--repeats", v);
        else if (auto v = eat("--confidence=")) opts.config.var_confidence = parse_double("--confidence", v);
        else if (auto v = eat("--seed=")) {
            long long seed = parse_integer("--seed", v);
            if (seed < 0 || seed > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
                throw InvalidConfiguration("--seed", "must lie in [0, 4294967295]");
            }
            opts.config.has_seed = true;
            opts.config.seed = static_cast<std::uint32_t>(seed);
        }
        else if (auto v = eat("--regime=")) opts.regimes.push_back(parse_regime(v));
        else if (auto v = eat("--margin-basis=")) {
            std::string x(v);
            if (x == "equity") opts.config.margin_basis = MarginBasis::Equity;
            else if (x == "loan") opts.config.margin_basis = MarginBasis::LoanPrincipal;
            else throw InvalidConfiguration("--margin-basis", "expected equity or loan");
        }
        else if (auto v = eat("--profit-baseline=")) {
            std::string x(v);
            if (x == "equity") opts.config.profit_baseline = ProfitBaseline::OriginalEquity;
            else if (x == "zero") opts.config.profit_baseline = ProfitBaseline::Zero;
            else throw InvalidConfiguration("--profit-baseline", "expected equity or zero");
        }
        else if (auto v = eat("--liquidation-measure=")) {
            std::string x(v);
            if (x == "flag") opts.config.liquidation_measure = LiquidationMeasure::Flag;
            else if (x == "threshold") opts.config.liquidation_measure = LiquidationMeasure::TerminalBelowThreshold;
            else throw InvalidConfiguration("--liquidation-measure", "expected flag or threshold");
        }
        else if (auto v = eat("--seed-policy=")) {
            std::string x(v);
            if (x == "independent") opts.config.seed_policy = SeedPolicy::IndependentPerRegime;
            else if (x == "shared") opts.config.seed_policy = SeedPolicy::SharedStream;
            else if (x == "reseed") opts.config.seed_policy = SeedPolicy::ReseedPerRegime;
            else throw InvalidConfiguration("--seed-policy", "expected independent, shared or reseed");
        }
        else throw InvalidConfiguration(s, "unknown option");
    }

    if (opts.help) {
        return opts;
    }
    if (opts.regimes.empty()) {
        opts.regimes = default_regimes();
    }
    validate(opts.config);
    validate_regimes(opts.regimes);
    return opts;
}
