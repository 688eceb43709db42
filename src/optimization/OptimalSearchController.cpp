#include "optimization/OptimalSearchController.h"
#include "optimization/CandidateEvaluator.h"
#include "optimization/CombinationGenerator.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include <boost/core/demangle.hpp>

namespace portopt {
namespace optimization {
namespace {
nlohmann::json candidateIds(const Candidate& candidate) {
    nlohmann::json ids = nlohmann::json::array();
    for (const auto& strategy : candidate) {
        ids.push_back(strategy.strategyId());
    }
    return ids;
}
}

OptimalSearchController::OptimalSearchController(std::shared_ptr<core::ICandidateLoader> loader,
                                                 std::shared_ptr<core::IEfficiencyAnalyzer> analyzer,
                                                 std::shared_ptr<core::IErrorSink> error_sink,
                                                 OptimizationConfig config)
    : loader_(std::move(loader))
    , analyzer_(std::move(analyzer))
    , error_sink_(std::move(error_sink))
    , config_(std::move(config)) {
    if (!loader_ || !analyzer_) {
        throw std::invalid_argument("OptimalSearchController requires a loader and an analyzer");
    }
}

SearchResult OptimalSearchController::run(const std::vector<StrategyRecord>& strategies) {
    return findOptimalCandidate(strategies, config_.min_size, config_.max_size);
}

SearchResult OptimalSearchController::findOptimalCandidate(const std::vector<StrategyRecord>& strategies,
                                                           int min_size,
                                                           std::optional<int> max_size) {
    // Fail fast on bad parameters, before anything is evaluated
    const SizeRange range = CombinationGenerator::validate(strategies.size(), min_size, max_size);

    SearchResult result;
    result.summary.total_candidates = CombinationGenerator::countCandidates(strategies.size(), range);

    const std::size_t planned = config_.max_candidates
        ? std::min(*config_.max_candidates, result.summary.total_candidates)
        : result.summary.total_candidates;

    LOG_INFO("Searching {} candidates (size {}..{}) from {} strategies",
             result.summary.total_candidates, range.min_size, range.max_size, strategies.size());
    if (planned < result.summary.total_candidates) {
        LOG_WARN("Candidate cap {} limits the search to {} of {} candidates",
                 *config_.max_candidates, planned, result.summary.total_candidates);
    }

    const auto started = std::chrono::steady_clock::now();
    CandidateEvaluator evaluator(*loader_, *analyzer_, config_);
    double best_score = -std::numeric_limits<double>::infinity();

    CombinationGenerator::forEach(strategies, min_size, max_size, [&](Candidate&& candidate) {
        if (result.summary.attempted >= planned) {
            result.summary.stopped_by_cap = true;
            return false;
        }

        const std::size_t index = result.summary.attempted++;
        try {
            EvaluationOutcome outcome = evaluator.evaluate(candidate);
            result.summary.succeeded++;
            if (error_sink_) {
                error_sink_->recordOperation(kOperationName);
            }

            const double score = outcome.stats.efficiency_score;
            LOG_DEBUG("Candidate {}/{} scored {:.6f}", index + 1, planned, score);

            // Strict comparison: the first candidate to reach a score keeps it
            if (score > best_score) {
                best_score = score;
                LOG_INFO("New best candidate {} with efficiency {:.6f}", index + 1, score);
                result.best_candidate = std::move(outcome.candidate);
                result.best_stats = std::move(outcome.stats);
                result.best_aligned_data = std::move(outcome.aligned_data);
            }
        } catch (const std::exception& e) {
            result.summary.failed++;
            CandidateEvaluationError wrapped(e.what(), index, planned);
            LOG_ERROR("Error analyzing candidate: {} ({} failed so far)", e.what(), result.summary.failed);

            if (error_sink_) {
                nlohmann::json context = wrapped.context();
                context["strategies"] = candidateIds(candidate);
                context["cause_type"] = boost::core::demangle(typeid(e).name());
                error_sink_->recordError(wrapped, kOperationName, context);
            }
        } catch (...) {
            // Collaborators may throw types outside the std::exception hierarchy
            result.summary.failed++;
            CandidateEvaluationError wrapped("unknown exception", index, planned);
            LOG_ERROR("Error analyzing candidate: unknown exception ({} failed so far)", result.summary.failed);

            if (error_sink_) {
                nlohmann::json context = wrapped.context();
                context["strategies"] = candidateIds(candidate);
                context["cause_type"] = "unknown";
                error_sink_->recordError(wrapped, kOperationName, context);
            }
        }

        if (progress_callback_) {
            progress_callback_(result.summary.attempted, planned);
        }
        return true;
    });

    result.summary.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (result.found()) {
        LOG_INFO("Search finished in {} ms: {} succeeded, {} failed, best efficiency {:.6f} ({} strategies)",
                 result.summary.elapsed_ms, result.summary.succeeded, result.summary.failed,
                 best_score, result.best_candidate->size());
    } else {
        LOG_WARN("Search finished in {} ms without a result: all {} candidates failed",
                 result.summary.elapsed_ms, result.summary.failed);
    }
    return result;
}

} // namespace optimization
} // namespace portopt
