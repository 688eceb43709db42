#include "optimization/CandidateEvaluator.h"
#include "support/FakeCollaborators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

using portopt::Candidate;
using portopt::optimization::CandidateEvaluator;
using portopt::optimization::OptimizationConfig;
using portopt::testing::FakeLoader;
using portopt::testing::ScriptedAnalyzer;
using portopt::testing::makeStrategy;

int main() {
    Candidate candidate = {
        makeStrategy("BTC-USD", 10, 30),
        makeStrategy("ETH-USD", 12, 26),
        makeStrategy("SOL-USD", 7, 40)
    };

    OptimizationConfig config;
    config.portfolio = "crypto.csv";

    // loader sees normalized allocations; outputs pass through unchanged
    {
        FakeLoader loader;
        ScriptedAnalyzer analyzer([](const Candidate& c) { return 0.5 + 0.01 * static_cast<double>(c.size()); });
        CandidateEvaluator evaluator(loader, analyzer, config);

        auto outcome = evaluator.evaluate(candidate);
        assert(loader.calls == 1);
        assert(analyzer.calls == 1);
        for (const auto& s : loader.seen.front()) {
            assert(s.allocation > 0.3333 && s.allocation < 0.3334);
        }
        assert(std::abs(outcome.stats.efficiency_score - 0.53) < 1e-12);
        assert(outcome.aligned_data.size() == 3);
        assert(outcome.aligned_data[0].strategy_id == "BTC-USD_SMA_10_30");
        assert(outcome.candidate.size() == 3);

        // the caller's candidate keeps its original allocation
        assert(candidate[0].allocation == 0.25);
    }

    // loader failures propagate
    {
        FakeLoader loader;
        loader.fail_tickers.insert("ETH-USD");
        ScriptedAnalyzer analyzer([](const Candidate&) { return 1.0; });
        CandidateEvaluator evaluator(loader, analyzer, config);

        bool thrown = false;
        try {
            evaluator.evaluate(candidate);
        } catch (const std::runtime_error& e) {
            thrown = true;
            assert(std::string(e.what()) == "no price data for ETH-USD");
        }
        assert(thrown);
        assert(analyzer.calls == 0);
    }

    // analyzer failures propagate
    {
        FakeLoader loader;
        ScriptedAnalyzer analyzer([](const Candidate&) -> double { throw std::domain_error("singular covariance"); });
        CandidateEvaluator evaluator(loader, analyzer, config);

        bool thrown = false;
        try {
            evaluator.evaluate(candidate);
        } catch (const std::domain_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[TEST] CandidateEvaluator PASSED\n";
    return 0;
}
