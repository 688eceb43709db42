#pragma once

#include "common/Types.h"
#include "optimization/OptimizationConfig.h"

namespace portopt {
namespace core {

struct LoadResult {
    LoadedData data;
    Candidate aligned_candidate;
};

// Loads and aligns the time series of every strategy in a candidate.
class ICandidateLoader {
public:
    virtual ~ICandidateLoader() = default;

    virtual LoadResult load(const Candidate& candidate,
                            const optimization::OptimizationConfig& config) = 0;
};

} // namespace core
} // namespace portopt
