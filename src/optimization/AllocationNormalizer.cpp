#include "optimization/AllocationNormalizer.h"
#include "common/Logger.h"

namespace portopt {
namespace optimization {

double AllocationNormalizer::normalize(Candidate& candidate) {
    if (candidate.empty()) {
        return 0.0;
    }

    const double fraction = 1.0 / static_cast<double>(candidate.size());
    for (auto& strategy : candidate) {
        strategy.allocation = fraction;
    }

    LOG_INFO("Equal allocation applied: {:.4f} ({} strategies)", fraction, candidate.size());
    return fraction;
}

} // namespace optimization
} // namespace portopt
