#pragma once

#include "result_sink.h"

#include <iosfwd>
#include <string>

/// Prints one summary row per regime, amounts in CHF.
class TableReport : public ResultSink {
public:
    explicit TableReport(std::ostream& out);

    void on_regime(const SimulationConfig& config, const RegimeResult& result) override;
    void on_complete() override;

private:
    void print_header(const SimulationConfig& config);

    std::ostream& out_;
    bool header_printed_ = false;
};

/// "-1,234 CHF"
std::string format_chf(double amount);

/// "12.34%"
std::string format_percent(double fraction);
