#pragma once

#include <filesystem>
#include <string>

#include "optimization/OptimizationConfig.h"
#include "report/OptimizationReport.h"

namespace portopt {
namespace report {

// Writes an OptimizationReport as <output_dir>/<portfolio-stem>_optimization.json
class ReportPersister {
public:
    static std::filesystem::path reportPath(const optimization::OptimizationConfig& config);

    // Creates parent directories. Throws PersistenceError on any I/O failure.
    static std::filesystem::path save(const OptimizationReport& report,
                                      const optimization::OptimizationConfig& config);
};

} // namespace report
} // namespace portopt
