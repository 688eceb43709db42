#pragma once

#include "common/Types.h"

namespace portopt {
namespace core {

struct AnalysisResult {
    EfficiencyStats stats;
    AlignedData aligned_data;
};

// Scores a loaded candidate. Higher efficiency_score is better.
class IEfficiencyAnalyzer {
public:
    virtual ~IEfficiencyAnalyzer() = default;

    virtual AnalysisResult analyze(const LoadedData& data, const Candidate& candidate) = 0;
};

} // namespace core
} // namespace portopt
