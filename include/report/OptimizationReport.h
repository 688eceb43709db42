#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace portopt {
namespace report {

// Metrics of one strategy group (the baseline or the optimum)
struct GroupSummary {
    std::size_t count = 0;
    std::vector<std::string> tickers;
    double efficiency_score = 0.0;
    double diversification_multiplier = 0.0;
    double independence_multiplier = 0.0;
    double activity_multiplier = 0.0;
    double total_expectancy = 0.0;
    double average_expectancy = 0.0;
    double weighted_efficiency = 0.0;
    double risk_concentration_index = 0.0;
};

// Horizon echoed in the report. An unset horizon stands for the default of 1
// period and is written as 1, unlike other empty values which are written as null.
struct DefaultHorizon {
    static constexpr int kDefault = 1;
    std::optional<int> value;

    int resolved() const { return value.value_or(kDefault); }
};

struct ReportConfigEcho {
    std::string portfolio;
    int min_size = 0;
    std::optional<int> max_size;
    std::optional<std::size_t> max_candidates;
    DefaultHorizon horizon;
    std::string allocation_mode;
};

// Baseline vs optimum comparison. Built once by ReportBuilder and never modified.
class OptimizationReport {
public:
    OptimizationReport(GroupSummary all_strategies,
                       GroupSummary optimal_strategies,
                       std::optional<double> efficiency_improvement_percent,
                       std::vector<std::string> removed_strategies,
                       ReportConfigEcho config,
                       std::string efficiency_calculation_note)
        : all_strategies_(std::move(all_strategies))
        , optimal_strategies_(std::move(optimal_strategies))
        , efficiency_improvement_percent_(efficiency_improvement_percent)
        , removed_strategies_(std::move(removed_strategies))
        , config_(std::move(config))
        , efficiency_calculation_note_(std::move(efficiency_calculation_note)) {}

    const GroupSummary& allStrategies() const { return all_strategies_; }
    const GroupSummary& optimalStrategies() const { return optimal_strategies_; }
    // Empty when the baseline efficiency is exactly zero
    const std::optional<double>& efficiencyImprovementPercent() const { return efficiency_improvement_percent_; }
    const std::vector<std::string>& removedStrategies() const { return removed_strategies_; }
    const ReportConfigEcho& config() const { return config_; }
    const std::string& efficiencyCalculationNote() const { return efficiency_calculation_note_; }

private:
    GroupSummary all_strategies_;
    GroupSummary optimal_strategies_;
    std::optional<double> efficiency_improvement_percent_;
    std::vector<std::string> removed_strategies_;
    ReportConfigEcho config_;
    std::string efficiency_calculation_note_;
};

} // namespace report
} // namespace portopt
