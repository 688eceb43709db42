#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace portopt {
namespace optimization {

// Search settings for one portfolio
struct OptimizationConfig {
    std::string portfolio;                          // portfolio file name or id; its stem names the report
    int min_size = 3;                               // smallest candidate
    std::optional<int> max_size;                    // unset: exactly min_size
    std::optional<std::size_t> max_candidates;      // stop after this many attempts
    std::optional<int> horizon;                     // unset: default horizon (1)
    std::string allocation_mode = "EQUAL";
    std::string output_dir = "json/concurrency/optimization";
};

} // namespace optimization
} // namespace portopt
