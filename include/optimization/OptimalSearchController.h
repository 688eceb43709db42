#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ICandidateLoader.h"
#include "core/contracts/IEfficiencyAnalyzer.h"
#include "core/contracts/IErrorSink.h"
#include "optimization/OptimizationConfig.h"

namespace portopt {
namespace optimization {

struct SearchSummary {
    std::size_t total_candidates = 0;   // size of the enumerated space
    std::size_t attempted = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    bool stopped_by_cap = false;
    long long elapsed_ms = 0;
};

struct SearchResult {
    std::optional<Candidate> best_candidate;
    std::optional<EfficiencyStats> best_stats;
    AlignedData best_aligned_data;
    SearchSummary summary;

    // false when every candidate failed
    bool found() const { return best_candidate.has_value(); }
};

// Exhaustive search for the highest-scoring candidate.
//
// Candidates are evaluated one at a time in generator order. A failing
// candidate is logged, reported to the error sink and skipped. Parameter
// validation errors are not caught. A score must beat -inf to count, so NaN
// and -inf scores never become the best candidate.
class OptimalSearchController {
public:
    static constexpr const char* kOperationName = "candidate_evaluation";

    using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

    OptimalSearchController(std::shared_ptr<core::ICandidateLoader> loader,
                            std::shared_ptr<core::IEfficiencyAnalyzer> analyzer,
                            std::shared_ptr<core::IErrorSink> error_sink,
                            OptimizationConfig config);

    void setProgressCallback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

    SearchResult findOptimalCandidate(const std::vector<StrategyRecord>& strategies,
                                      int min_size = 3,
                                      std::optional<int> max_size = std::nullopt);

    // Uses min_size / max_size from the config
    SearchResult run(const std::vector<StrategyRecord>& strategies);

private:
    std::shared_ptr<core::ICandidateLoader> loader_;
    std::shared_ptr<core::IEfficiencyAnalyzer> analyzer_;
    std::shared_ptr<core::IErrorSink> error_sink_;
    OptimizationConfig config_;
    ProgressCallback progress_callback_;
};

} // namespace optimization
} // namespace portopt
