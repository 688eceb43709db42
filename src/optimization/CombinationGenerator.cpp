#include "optimization/CombinationGenerator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <string>

namespace portopt {
namespace optimization {

SizeRange CombinationGenerator::validate(std::size_t strategy_count,
                                         int min_size,
                                         std::optional<int> max_size) {
    if (min_size < 2) {
        throw ValidationError("min_size must be at least 2, got " + std::to_string(min_size),
                              "min_size", ">= 2", std::to_string(min_size));
    }
    if (static_cast<std::size_t>(min_size) > strategy_count) {
        throw ValidationError("min_size (" + std::to_string(min_size) +
                              ") cannot be greater than the number of strategies (" +
                              std::to_string(strategy_count) + ")",
                              "min_size", "<= " + std::to_string(strategy_count),
                              std::to_string(min_size));
    }

    SizeRange range;
    range.min_size = min_size;
    range.max_size = min_size;

    if (max_size) {
        if (*max_size < min_size) {
            throw ValidationError("max_size must be >= min_size (" + std::to_string(*max_size) +
                                  " < " + std::to_string(min_size) + ")",
                                  "max_size", ">= " + std::to_string(min_size),
                                  std::to_string(*max_size));
        }
        range.max_size = std::min(*max_size, static_cast<int>(strategy_count));
    }
    return range;
}

std::size_t CombinationGenerator::forEach(const std::vector<StrategyRecord>& strategies,
                                          int min_size,
                                          std::optional<int> max_size,
                                          const Visitor& visitor) {
    const SizeRange range = validate(strategies.size(), min_size, max_size);
    const std::size_t n = strategies.size();
    std::size_t visited = 0;

    for (int size = range.min_size; size <= range.max_size; ++size) {
        const std::size_t k = static_cast<std::size_t>(size);

        // indices[0] < indices[1] < ... < indices[k-1], advanced lexicographically
        std::vector<std::size_t> indices(k);
        for (std::size_t i = 0; i < k; ++i) {
            indices[i] = i;
        }

        while (true) {
            Candidate candidate;
            candidate.reserve(k);
            for (std::size_t idx : indices) {
                candidate.push_back(strategies[idx]);
            }
            ++visited;
            if (!visitor(std::move(candidate))) {
                return visited;
            }

            std::size_t pos = k;
            while (pos > 0 && indices[pos - 1] == n - k + (pos - 1)) {
                --pos;
            }
            if (pos == 0) {
                break;
            }
            ++indices[pos - 1];
            for (std::size_t i = pos; i < k; ++i) {
                indices[i] = indices[i - 1] + 1;
            }
        }
    }
    return visited;
}

std::vector<Candidate> CombinationGenerator::generate(const std::vector<StrategyRecord>& strategies,
                                                      int min_size,
                                                      std::optional<int> max_size) {
    std::vector<Candidate> out;
    const SizeRange range = validate(strategies.size(), min_size, max_size);
    out.reserve(countCandidates(strategies.size(), range));

    forEach(strategies, min_size, max_size, [&out](Candidate&& candidate) {
        out.push_back(std::move(candidate));
        return true;
    });

    LOG_DEBUG("Generated {} candidates (size {}..{}) from {} strategies",
              out.size(), range.min_size, range.max_size, strategies.size());
    return out;
}

std::size_t CombinationGenerator::countCombinations(std::size_t n, std::size_t k) {
    if (k > n) {
        return 0;
    }
    k = std::min(k, n - k);
    std::size_t result = 1;
    for (std::size_t i = 1; i <= k; ++i) {
        // exact at every step: result * (n - k + i) is divisible by i
        result = result * (n - k + i) / i;
    }
    return result;
}

std::size_t CombinationGenerator::countCandidates(std::size_t n, const SizeRange& range) {
    std::size_t total = 0;
    for (int size = range.min_size; size <= range.max_size; ++size) {
        total += countCombinations(n, static_cast<std::size_t>(size));
    }
    return total;
}

} // namespace optimization
} // namespace portopt
