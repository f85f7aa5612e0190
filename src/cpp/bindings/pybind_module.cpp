#include "lombard_config.h"
#include "path_simulator.h"
#include "random_source.h"
#include "regime_aggregator.h"
#include "statistics.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

namespace py = pybind11;

// Regimes arrive as an insertion-ordered {name: expected_return} dict.
static std::vector<Regime> regimes_from_dict(const py::dict& regimes) {
    std::vector<Regime> out;
    for (auto item : regimes) {
        Regime regime;
        regime.name = py::cast<std::string>(item.first);
        regime.expected_return = py::cast<double>(item.second);
        out.push_back(regime);
    }
    return out;
}

PYBIND11_MODULE(lombard_mc, m) {
    m.doc() = "Monte Carlo risk engine for leveraged (Lombard) portfolios";

    py::register_exception<InvalidConfiguration>(m, "InvalidConfiguration", PyExc_ValueError);

    py::enum_<MarginBasis>(m, "MarginBasis")
        .value("Equity", MarginBasis::Equity)
        .value("LoanPrincipal", MarginBasis::LoanPrincipal);

    py::enum_<ProfitBaseline>(m, "ProfitBaseline")
        .value("OriginalEquity", ProfitBaseline::OriginalEquity)
        .value("Zero", ProfitBaseline::Zero);

    py::enum_<LiquidationMeasure>(m, "LiquidationMeasure")
        .value("Flag", LiquidationMeasure::Flag)
        .value("TerminalBelowThreshold", LiquidationMeasure::TerminalBelowThreshold);

    py::enum_<SeedPolicy>(m, "SeedPolicy")
        .value("SharedStream", SeedPolicy::SharedStream)
        .value("ReseedPerRegime", SeedPolicy::ReseedPerRegime)
        .value("IndependentPerRegime", SeedPolicy::IndependentPerRegime);

    py::class_<SimulationConfig>(m, "SimulationConfig")
        .def(py::init<>())
        .def_readwrite("loan_principal", &SimulationConfig::loan_principal)
        .def_readwrite("loan_rate", &SimulationConfig::loan_rate)
        .def_readwrite("duration_years", &SimulationConfig::duration_years)
        .def_readwrite("portfolio_value", &SimulationConfig::portfolio_value)
        .def_readwrite("margin_level", &SimulationConfig::margin_level)
        .def_readwrite("job_loss_probability", &SimulationConfig::job_loss_probability)
        .def_readwrite("volatility", &SimulationConfig::volatility)
        .def_readwrite("repeats", &SimulationConfig::repeats)
        .def_readwrite("has_seed", &SimulationConfig::has_seed)
        .def_readwrite("seed", &SimulationConfig::seed)
        .def_readwrite("margin_basis", &SimulationConfig::margin_basis)
        .def_readwrite("profit_baseline", &SimulationConfig::profit_baseline)
        .def_readwrite("liquidation_measure", &SimulationConfig::liquidation_measure)
        .def_readwrite("seed_policy", &SimulationConfig::seed_policy)
        .def_readwrite("var_confidence", &SimulationConfig::var_confidence)
        .def_property_readonly("total_invested", &total_invested)
        .def_property_readonly("liquidation_threshold", &liquidation_threshold)
        .def_property_readonly("total_loan_repayment", &total_loan_repayment)
        .def_property_readonly("break_even_value", &break_even_value)
        .def("validate", &validate);

    py::class_<Regime>(m, "Regime")
        .def(py::init<>())
        .def(py::init([](const std::string& name, double expected_return) {
            return Regime{name, expected_return};
        }))
        .def_readwrite("name", &Regime::name)
        .def_readwrite("expected_return", &Regime::expected_return);

    py::class_<PathOutcome>(m, "PathOutcome")
        .def_readonly("net_terminal_value", &PathOutcome::net_terminal_value)
        .def_readonly("liquidated", &PathOutcome::liquidated)
        .def_readonly("exit_year", &PathOutcome::exit_year);

    py::class_<RegimeSummary>(m, "RegimeSummary")
        .def_readonly("profit_probability", &RegimeSummary::profit_probability)
        .def_readonly("expected_value", &RegimeSummary::expected_value)
        .def_readonly("value_at_risk", &RegimeSummary::value_at_risk)
        .def_readonly("conditional_value_at_risk", &RegimeSummary::conditional_value_at_risk)
        .def_readonly("upper_quantile_95", &RegimeSummary::upper_quantile_95)
        .def_readonly("liquidation_rate", &RegimeSummary::liquidation_rate)
        .def_readonly("liquidation_count", &RegimeSummary::liquidation_count)
        .def_readonly("var_confidence", &RegimeSummary::var_confidence);

    py::class_<RegimeResult>(m, "RegimeResult")
        .def_readonly("name", &RegimeResult::name)
        .def_readonly("expected_return", &RegimeResult::expected_return)
        .def_readonly("outcomes", &RegimeResult::outcomes)
        .def_readonly("summary", &RegimeResult::summary)
        .def_property_readonly("net_values", &net_values);

    py::class_<RandomSource>(m, "RandomSource");

    py::class_<MersenneSource, RandomSource>(m, "MersenneSource")
        .def(py::init<>())
        .def(py::init<std::uint32_t>())
        .def("reseed", py::overload_cast<std::uint32_t>(&MersenneSource::reseed))
        .def("normal", &MersenneSource::normal)
        .def("uniform", &MersenneSource::uniform);

    py::class_<PathSimulator>(m, "PathSimulator")
        .def(py::init<const SimulationConfig&>())
        .def("run", &PathSimulator::run, py::arg("expected_return"), py::arg("rng"));

    m.def("quantile", &quantile, "Empirical quantile with linear interpolation");

    m.def(
        "run_regimes",
        [](const SimulationConfig& config, const py::dict& regimes) {
            std::vector<Regime> list = regimes_from_dict(regimes);
            RegimeAggregator aggregator(config);
            py::gil_scoped_release release;
            return aggregator.run(list);
        },
        py::arg("config"), py::arg("regimes"),
        "Simulate every regime and return one RegimeResult per regime, in dict order"
    );
}
