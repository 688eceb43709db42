#include "report/ReportBuilder.h"
#include "support/FakeCollaborators.h"

#include <cassert>
#include <cmath>
#include <iostream>

using portopt::EfficiencyStats;
using portopt::StrategyRecord;
using portopt::optimization::OptimizationConfig;
using portopt::report::ReportBuilder;
using portopt::testing::makeStrategy;

int main() {
    std::vector<StrategyRecord> all = {
        makeStrategy("BTC-USD", 10, 30),
        makeStrategy("ETH-USD", 12, 26),
        makeStrategy("", 5, 50)
    };
    std::vector<StrategyRecord> optimal = {all[0], all[1]};

    EfficiencyStats all_stats;
    all_stats.efficiency_score = 0.7;
    all_stats.total_expectancy = 0.9;
    all_stats.diversification_multiplier = 0.8;

    EfficiencyStats optimal_stats;
    optimal_stats.efficiency_score = 0.85;
    optimal_stats.total_expectancy = 0.5;
    optimal_stats.risk_concentration_index = 0.4;

    OptimizationConfig config;
    config.portfolio = "csv/strategies/DAILY.csv";
    config.min_size = 2;
    config.max_candidates = 100;

    const auto report = ReportBuilder::build(all, all_stats, optimal, optimal_stats, config);

    assert(report.efficiencyImprovementPercent().has_value());
    assert(std::abs(*report.efficiencyImprovementPercent() - 21.428571) < 1e-4);
    assert(report.allStrategies().count == 3);
    assert(report.optimalStrategies().count == 2);

    assert(std::abs(report.allStrategies().average_expectancy - 0.3) < 1e-12);
    assert(std::abs(report.optimalStrategies().average_expectancy - 0.25) < 1e-12);
    assert(report.allStrategies().diversification_multiplier == 0.8);
    assert(report.allStrategies().independence_multiplier == 0.0);
    assert(report.optimalStrategies().risk_concentration_index == 0.4);

    const auto& tickers = report.allStrategies().tickers;
    assert(tickers.size() == 3);
    assert(tickers[0] == "BTC-USD");
    assert(tickers[2] == "unknown");

    assert(report.removedStrategies().size() == 1);
    assert(report.removedStrategies()[0] == "_SMA_5_50");

    assert(report.config().portfolio == "csv/strategies/DAILY.csv");
    assert(report.config().min_size == 2);
    assert(!report.config().max_size.has_value());
    assert(report.config().max_candidates.value() == 100);
    assert(!report.efficiencyCalculationNote().empty());

    // zero baseline: improvement undefined rather than inf/NaN
    {
        EfficiencyStats zero;
        zero.efficiency_score = 0.0;
        const auto r = ReportBuilder::build(all, zero, optimal, optimal_stats, config);
        assert(!r.efficiencyImprovementPercent().has_value());
    }

    // negative baseline keeps the plain formula
    {
        const auto pct = ReportBuilder::improvementPercent(-0.5, -0.25);
        assert(pct.has_value());
        assert(std::abs(*pct - (-50.0)) < 1e-12);
    }

    std::cout << "[TEST] ReportBuilder PASSED\n";
    return 0;
}
