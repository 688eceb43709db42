#pragma once

#include <functional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ICandidateLoader.h"
#include "core/contracts/IEfficiencyAnalyzer.h"

namespace portopt {
namespace testing {

inline StrategyRecord makeStrategy(const std::string& ticker, int short_window, int long_window,
                                   StrategyType type = StrategyType::SMA) {
    StrategyRecord s;
    s.ticker = ticker;
    s.strategy_type = type;
    s.short_window = short_window;
    s.long_window = long_window;
    s.signal_window = (type == StrategyType::MACD) ? 9 : 0;
    s.allocation = 0.25;
    return s;
}

// One synthetic series per strategy; throws for tickers listed in fail_tickers
class FakeLoader : public core::ICandidateLoader {
public:
    std::set<std::string> fail_tickers;
    int calls = 0;
    std::vector<Candidate> seen;

    core::LoadResult load(const Candidate& candidate,
                          const optimization::OptimizationConfig&) override {
        ++calls;
        seen.push_back(candidate);
        core::LoadResult result;
        for (const auto& s : candidate) {
            if (fail_tickers.count(s.ticker) > 0) {
                throw std::runtime_error("no price data for " + s.ticker);
            }
            StrategySeries series;
            series.strategy_id = s.strategyId();
            series.timestamps = {1, 2, 3};
            series.positions = {0, 1, 1};
            series.returns = {0.0, 0.01, -0.005};
            result.data.push_back(series);
        }
        result.aligned_candidate = candidate;
        return result;
    }
};

// Scores a candidate with a caller-supplied function
class ScriptedAnalyzer : public core::IEfficiencyAnalyzer {
public:
    std::function<double(const Candidate&)> score;
    int calls = 0;

    explicit ScriptedAnalyzer(std::function<double(const Candidate&)> fn) : score(std::move(fn)) {}

    core::AnalysisResult analyze(const LoadedData& data, const Candidate& candidate) override {
        ++calls;
        core::AnalysisResult result;
        result.stats.efficiency_score = score(candidate);
        result.stats.total_expectancy = 0.1 * static_cast<double>(candidate.size());
        result.aligned_data = data;
        return result;
    }
};

inline bool hasTicker(const Candidate& candidate, const std::string& ticker) {
    for (const auto& s : candidate) {
        if (s.ticker == ticker) return true;
    }
    return false;
}

} // namespace testing
} // namespace portopt
