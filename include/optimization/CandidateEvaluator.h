#pragma once

#include "common/Types.h"
#include "core/contracts/ICandidateLoader.h"
#include "core/contracts/IEfficiencyAnalyzer.h"
#include "optimization/OptimizationConfig.h"

namespace portopt {
namespace optimization {

struct EvaluationOutcome {
    Candidate candidate;            // the evaluated copy, allocations normalized
    EfficiencyStats stats;
    AlignedData aligned_data;
};

// Runs one candidate through load/align and scoring.
// Exceptions from either collaborator propagate unchanged.
class CandidateEvaluator {
public:
    CandidateEvaluator(core::ICandidateLoader& loader,
                       core::IEfficiencyAnalyzer& analyzer,
                       const OptimizationConfig& config);

    // Takes a copy so normalization never leaks into the caller's records
    EvaluationOutcome evaluate(Candidate candidate) const;

private:
    core::ICandidateLoader& loader_;
    core::IEfficiencyAnalyzer& analyzer_;
    OptimizationConfig config_;
};

} // namespace optimization
} // namespace portopt
