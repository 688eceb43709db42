#pragma once

#include <vector>

#include "common/Types.h"
#include "optimization/OptimizationConfig.h"
#include "report/OptimizationReport.h"

namespace portopt {
namespace report {

class ReportBuilder {
public:
    // all_stats / optimal_stats must carry efficiency_score; a missing
    // total_expectancy or multiplier is treated as 0.
    static OptimizationReport build(const std::vector<StrategyRecord>& all_strategies,
                                    const EfficiencyStats& all_stats,
                                    const std::vector<StrategyRecord>& optimal_strategies,
                                    const EfficiencyStats& optimal_stats,
                                    const optimization::OptimizationConfig& config);

    // (optimal - baseline) / baseline * 100; empty when baseline == 0
    static std::optional<double> improvementPercent(double baseline_score, double optimal_score);

    static GroupSummary summarize(const std::vector<StrategyRecord>& strategies,
                                  const EfficiencyStats& stats);
};

} // namespace report
} // namespace portopt
