#include "table_report.h"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace {
const int kNameWidth = 20;
const int kColumnWidth = 16;
const char* kSeparator = "  ";
}

// Rounds the magnitude as text so amounts beyond long long still group.
std::string format_chf(double amount) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(0) << std::fabs(amount);
    std::string digits = ss.str();
    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }
    if (amount < 0.0 && digits != "0") {
        grouped.insert(grouped.begin(), '-');
    }
    return grouped + " CHF";
}

std::string format_percent(double fraction) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << fraction * 100.0 << "%";
    return ss.str();
}

TableReport::TableReport(std::ostream& out) : out_(out) {}

void TableReport::print_header(const SimulationConfig& config) {
    std::ostringstream var_label;
    var_label << "VaR " << std::llround(config.var_confidence * 100.0) << "%";

    out_ << "\n--- Simulation Summary Statistics ---\n";
    out_ << std::left << std::setw(kNameWidth) << ""
         << std::right
         << kSeparator << std::setw(kColumnWidth) << "Profit Prob."
         << kSeparator << std::setw(kColumnWidth) << "Expected Value"
         << kSeparator << std::setw(kColumnWidth) << var_label.str()
         << kSeparator << std::setw(kColumnWidth) << "CVaR"
         << kSeparator << std::setw(kColumnWidth) << "Liquidation Risk"
         << "\n";
    header_printed_ = true;
}

void TableReport::on_regime(const SimulationConfig& config, const RegimeResult& result) {
    if (!header_printed_) {
        print_header(config);
    }
    const RegimeSummary& s = result.summary;
    out_ << std::left << std::setw(kNameWidth) << result.name
         << std::right
         << kSeparator << std::setw(kColumnWidth) << format_percent(s.profit_probability)
         << kSeparator << std::setw(kColumnWidth) << format_chf(s.expected_value)
         << kSeparator << std::setw(kColumnWidth) << format_chf(s.value_at_risk)
         << kSeparator << std::setw(kColumnWidth) << format_chf(s.conditional_value_at_risk)
         << kSeparator << std::setw(kColumnWidth) << format_percent(s.liquidation_rate)
         << "\n";
}

void TableReport::on_complete() {
    out_.flush();
}
