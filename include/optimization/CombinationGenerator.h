#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include "common/Types.h"

namespace portopt {
namespace optimization {

// Resolved size range after validation
struct SizeRange {
    int min_size = 0;
    int max_size = 0;
};

// Enumerates candidate subsets of a strategy list.
//
// Size policy: with only min_size every candidate has exactly min_size members.
// Passing max_size sweeps min_size..max_size (clamped to the number of strategies).
//
// Order is stable: ascending size, then lexicographic by input index, so the
// search controller's first-wins tie-break is reproducible.
class CombinationGenerator {
public:
    // Return false from the visitor to stop enumeration
    using Visitor = std::function<bool(Candidate&& candidate)>;

    // Throws ValidationError for min_size < 2, min_size > n, or max_size < min_size
    static SizeRange validate(std::size_t strategy_count,
                              int min_size,
                              std::optional<int> max_size = std::nullopt);

    // Returns the number of candidates visited
    static std::size_t forEach(const std::vector<StrategyRecord>& strategies,
                               int min_size,
                               std::optional<int> max_size,
                               const Visitor& visitor);

    static std::vector<Candidate> generate(const std::vector<StrategyRecord>& strategies,
                                           int min_size,
                                           std::optional<int> max_size = std::nullopt);

    // C(n, k); 0 when k > n
    static std::size_t countCombinations(std::size_t n, std::size_t k);
    static std::size_t countCandidates(std::size_t n, const SizeRange& range);
};

} // namespace optimization
} // namespace portopt
