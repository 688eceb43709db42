#include "report/ReportBuilder.h"
#include "common/Logger.h"

#include <set>
#include <string>

namespace portopt {
namespace report {
namespace {
const char* kEfficiencyNote =
    "Efficiency score = weighted strategy efficiency x diversification multiplier x "
    "independence multiplier x activity multiplier. Every candidate is evaluated with equal "
    "allocation (1 / number of strategies). Improvement is relative to running all strategies.";
}

std::optional<double> ReportBuilder::improvementPercent(double baseline_score, double optimal_score) {
    if (baseline_score == 0.0) {
        return std::nullopt;
    }
    return (optimal_score - baseline_score) / baseline_score * 100.0;
}

GroupSummary ReportBuilder::summarize(const std::vector<StrategyRecord>& strategies,
                                      const EfficiencyStats& stats) {
    GroupSummary group;
    group.count = strategies.size();
    group.tickers.reserve(strategies.size());
    for (const auto& strategy : strategies) {
        group.tickers.push_back(strategy.ticker.empty() ? "unknown" : strategy.ticker);
    }

    group.efficiency_score = stats.efficiency_score;
    group.diversification_multiplier = stats.diversification_multiplier.value_or(0.0);
    group.independence_multiplier = stats.independence_multiplier.value_or(0.0);
    group.activity_multiplier = stats.activity_multiplier.value_or(0.0);
    group.total_expectancy = stats.total_expectancy.value_or(0.0);
    group.average_expectancy = (group.count > 0)
        ? group.total_expectancy / static_cast<double>(group.count)
        : 0.0;
    group.weighted_efficiency = stats.weighted_efficiency.value_or(0.0);
    group.risk_concentration_index = stats.risk_concentration_index.value_or(0.0);
    return group;
}

OptimizationReport ReportBuilder::build(const std::vector<StrategyRecord>& all_strategies,
                                        const EfficiencyStats& all_stats,
                                        const std::vector<StrategyRecord>& optimal_strategies,
                                        const EfficiencyStats& optimal_stats,
                                        const optimization::OptimizationConfig& config) {
    GroupSummary all_group = summarize(all_strategies, all_stats);
    GroupSummary optimal_group = summarize(optimal_strategies, optimal_stats);

    const auto improvement = improvementPercent(all_group.efficiency_score, optimal_group.efficiency_score);
    if (!improvement) {
        LOG_WARN("Baseline efficiency is 0; improvement percentage is undefined");
    }

    std::set<std::string> optimal_ids;
    for (const auto& strategy : optimal_strategies) {
        optimal_ids.insert(strategy.strategyId());
    }
    std::vector<std::string> removed;
    for (const auto& strategy : all_strategies) {
        const std::string id = strategy.strategyId();
        if (optimal_ids.count(id) == 0) {
            removed.push_back(id);
        }
    }

    ReportConfigEcho echo;
    echo.portfolio = config.portfolio;
    echo.min_size = config.min_size;
    echo.max_size = config.max_size;
    echo.max_candidates = config.max_candidates;
    echo.horizon.value = config.horizon;
    echo.allocation_mode = config.allocation_mode;

    LOG_INFO("Optimization report: {} -> {} strategies, efficiency {:.4f} -> {:.4f}",
             all_group.count, optimal_group.count,
             all_group.efficiency_score, optimal_group.efficiency_score);
    if (improvement) {
        LOG_INFO("Efficiency improvement: {:+.2f}%", *improvement);
    }

    return OptimizationReport(std::move(all_group), std::move(optimal_group), improvement,
                              std::move(removed), std::move(echo), kEfficiencyNote);
}

} // namespace report
} // namespace portopt
