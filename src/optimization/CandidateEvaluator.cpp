#include "optimization/CandidateEvaluator.h"
#include "optimization/AllocationNormalizer.h"
#include "common/Logger.h"

namespace portopt {
namespace optimization {

CandidateEvaluator::CandidateEvaluator(core::ICandidateLoader& loader,
                                       core::IEfficiencyAnalyzer& analyzer,
                                       const OptimizationConfig& config)
    : loader_(loader)
    , analyzer_(analyzer)
    , config_(config) {}

EvaluationOutcome CandidateEvaluator::evaluate(Candidate candidate) const {
    AllocationNormalizer::normalize(candidate);

    core::LoadResult loaded = loader_.load(candidate, config_);
    LOG_DEBUG("Loaded {} series for {} strategies", loaded.data.size(), loaded.aligned_candidate.size());

    core::AnalysisResult analysis = analyzer_.analyze(loaded.data, loaded.aligned_candidate);

    EvaluationOutcome outcome;
    outcome.candidate = std::move(candidate);
    outcome.stats = std::move(analysis.stats);
    outcome.aligned_data = std::move(analysis.aligned_data);
    return outcome;
}

} // namespace optimization
} // namespace portopt
