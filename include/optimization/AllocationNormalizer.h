#pragma once

#include "common/Types.h"

namespace portopt {
namespace optimization {

// Gives every member of a candidate the same allocation, 1 / size.
// Works on the candidate's own copies; the source strategy list is untouched.
class AllocationNormalizer {
public:
    // Returns the fraction applied (0 for an empty candidate)
    static double normalize(Candidate& candidate);
};

} // namespace optimization
} // namespace portopt
