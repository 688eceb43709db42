#include "optimization/AllocationNormalizer.h"
#include "optimization/CombinationGenerator.h"
#include "support/FakeCollaborators.h"

#include <cassert>
#include <cmath>
#include <iostream>

using portopt::Candidate;
using portopt::optimization::AllocationNormalizer;
using portopt::optimization::CombinationGenerator;
using portopt::testing::makeStrategy;

int main() {
    std::vector<portopt::StrategyRecord> strategies = {
        makeStrategy("BTC-USD", 10, 30),
        makeStrategy("ETH-USD", 12, 26, portopt::StrategyType::MACD),
        makeStrategy("AAPL", 5, 50, portopt::StrategyType::EMA),
        makeStrategy("MSFT", 8, 21)
    };
    strategies[0].allocation = 0.7;

    for (auto candidate : CombinationGenerator::generate(strategies, 2, 4)) {
        const double fraction = AllocationNormalizer::normalize(candidate);
        assert(std::abs(fraction - 1.0 / static_cast<double>(candidate.size())) < 1e-12);

        double sum = 0.0;
        for (const auto& s : candidate) {
            assert(s.allocation == fraction);
            sum += s.allocation;
        }
        assert(std::abs(sum - 1.0) < 1e-9);
    }

    // source list untouched
    assert(strategies[0].allocation == 0.7);
    assert(strategies[1].allocation == 0.25);

    Candidate empty;
    assert(AllocationNormalizer::normalize(empty) == 0.0);

    std::cout << "[TEST] AllocationNormalizer PASSED\n";
    return 0;
}
