#include "report/ReportEncoder.h"

namespace portopt {
namespace report {

nlohmann::json ReportEncoder::encode(const GroupSummary& group) {
    nlohmann::json j;
    j["count"] = encode(group.count);
    j["tickers"] = encode(group.tickers);
    j["efficiency_score"] = encode(group.efficiency_score);
    j["diversification_multiplier"] = encode(group.diversification_multiplier);
    j["independence_multiplier"] = encode(group.independence_multiplier);
    j["activity_multiplier"] = encode(group.activity_multiplier);
    j["total_expectancy"] = encode(group.total_expectancy);
    j["average_expectancy"] = encode(group.average_expectancy);
    j["weighted_efficiency"] = encode(group.weighted_efficiency);
    j["risk_concentration_index"] = encode(group.risk_concentration_index);
    return j;
}

nlohmann::json ReportEncoder::encode(const ReportConfigEcho& config) {
    nlohmann::json j;
    j["portfolio"] = encode(config.portfolio);
    j["min_strategies"] = encode(config.min_size);
    j["max_strategies"] = encode(config.max_size);
    j["max_permutations"] = encode(config.max_candidates);
    j["horizon"] = encode(config.horizon);
    j["allocation_mode"] = encode(config.allocation_mode);
    return j;
}

nlohmann::json ReportEncoder::encode(const OptimizationReport& report) {
    const GroupSummary& all = report.allStrategies();
    const GroupSummary& optimal = report.optimalStrategies();

    nlohmann::json summary;
    summary["all_strategies_count"] = encode(all.count);
    summary["optimal_strategies_count"] = encode(optimal.count);
    summary["all_strategies_efficiency"] = encode(all.efficiency_score);
    summary["optimal_strategies_efficiency"] = encode(optimal.efficiency_score);
    summary["efficiency_improvement_percent"] = encode(report.efficiencyImprovementPercent());
    summary["removed_strategies"] = encode(report.removedStrategies());

    nlohmann::json j;
    j["optimization_summary"] = summary;
    j["all_strategies"] = encode(all);
    j["optimal_strategies"] = encode(optimal);
    j["config"] = encode(report.config());
    j["efficiency_calculation_note"] = encode(report.efficiencyCalculationNote());
    return j;
}

} // namespace report
} // namespace portopt
