#include "optimization/CombinationGenerator.h"
#include "common/Errors.h"
#include "support/FakeCollaborators.h"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

using portopt::Candidate;
using portopt::StrategyRecord;
using portopt::ValidationError;
using portopt::optimization::CombinationGenerator;
using portopt::testing::makeStrategy;

namespace {
std::vector<StrategyRecord> makeStrategies(int n) {
    std::vector<StrategyRecord> out;
    for (int i = 0; i < n; ++i) {
        out.push_back(makeStrategy("T" + std::to_string(i), 5 + i, 20 + i));
    }
    return out;
}

std::string key(const Candidate& c) {
    std::string k;
    for (const auto& s : c) {
        k += s.ticker + ",";
    }
    return k;
}
}

int main() {
    // C(n, k) candidates of exact size k, no repeats
    for (int n = 2; n <= 7; ++n) {
        const auto strategies = makeStrategies(n);
        for (int k = 2; k <= n; ++k) {
            const auto candidates = CombinationGenerator::generate(strategies, k);
            assert(candidates.size() == CombinationGenerator::countCombinations(n, k));

            std::set<std::string> distinct;
            for (const auto& c : candidates) {
                assert(static_cast<int>(c.size()) == k);
                std::set<std::string> members;
                for (const auto& s : c) {
                    members.insert(s.ticker);
                }
                assert(members.size() == c.size());
                distinct.insert(key(c));
            }
            assert(distinct.size() == candidates.size());
        }
    }

    assert(CombinationGenerator::countCombinations(5, 3) == 10);
    assert(CombinationGenerator::countCombinations(10, 4) == 210);
    assert(CombinationGenerator::countCombinations(3, 4) == 0);

    // min_size alone means exactly min_size, never larger
    {
        const auto strategies = makeStrategies(5);
        const auto candidates = CombinationGenerator::generate(strategies, 3);
        assert(candidates.size() == 10);
        for (const auto& c : candidates) {
            assert(c.size() == 3);
        }
    }

    // explicit max_size sweeps min..max in ascending size
    {
        const auto strategies = makeStrategies(5);
        const auto candidates = CombinationGenerator::generate(strategies, 3, 5);
        assert(candidates.size() == 10 + 5 + 1);
        assert(candidates.front().size() == 3);
        assert(candidates.back().size() == 5);
        for (std::size_t i = 1; i < candidates.size(); ++i) {
            assert(candidates[i - 1].size() <= candidates[i].size());
        }

        // max_size above n is clamped
        const auto clamped = CombinationGenerator::generate(strategies, 4, 9);
        assert(clamped.size() == 5 + 1);
    }

    // lexicographic order by input index
    {
        const auto strategies = makeStrategies(4);
        const auto candidates = CombinationGenerator::generate(strategies, 2);
        const std::vector<std::string> expected = {
            "T0,T1,", "T0,T2,", "T0,T3,", "T1,T2,", "T1,T3,", "T2,T3,"
        };
        assert(candidates.size() == expected.size());
        for (std::size_t i = 0; i < expected.size(); ++i) {
            assert(key(candidates[i]) == expected[i]);
        }

        // stable across calls
        const auto again = CombinationGenerator::generate(strategies, 2);
        for (std::size_t i = 0; i < again.size(); ++i) {
            assert(key(again[i]) == key(candidates[i]));
        }
    }

    // visitor can stop early
    {
        const auto strategies = makeStrategies(6);
        int seen = 0;
        const auto visited = CombinationGenerator::forEach(strategies, 2, std::nullopt,
            [&seen](Candidate&&) { return ++seen < 4; });
        assert(visited == 4);
        assert(seen == 4);
    }

    // candidates are copies
    {
        const auto strategies = makeStrategies(3);
        auto candidates = CombinationGenerator::generate(strategies, 2);
        candidates[0][0].allocation = 0.9;
        assert(strategies[0].allocation == 0.25);
    }

    // validation
    {
        const auto strategies = makeStrategies(4);
        bool thrown = false;
        try {
            CombinationGenerator::generate(strategies, 1);
        } catch (const ValidationError& e) {
            thrown = true;
            assert(std::string(e.what()).find("must be at least 2") != std::string::npos);
            assert(e.fieldName() == "min_size");
        }
        assert(thrown);

        thrown = false;
        try {
            CombinationGenerator::generate(strategies, 5);
        } catch (const ValidationError& e) {
            thrown = true;
            assert(std::string(e.what()).find("cannot be greater than") != std::string::npos);
            assert(std::string(e.what()).find("4") != std::string::npos);
        }
        assert(thrown);

        thrown = false;
        try {
            CombinationGenerator::generate(strategies, 3, 2);
        } catch (const ValidationError& e) {
            thrown = true;
            assert(e.fieldName() == "max_size");
        }
        assert(thrown);
    }

    std::cout << "[TEST] CombinationGenerator PASSED\n";
    return 0;
}
