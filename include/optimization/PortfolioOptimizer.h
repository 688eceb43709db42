#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "common/Types.h"
#include "core/contracts/ICandidateLoader.h"
#include "core/contracts/IEfficiencyAnalyzer.h"
#include "core/contracts/IErrorSink.h"
#include "optimization/OptimalSearchController.h"
#include "optimization/OptimizationConfig.h"
#include "report/OptimizationReport.h"

namespace portopt {
namespace optimization {

struct OptimizationRun {
    SearchResult search;
    std::optional<EfficiencyStats> baseline_stats;
    std::optional<report::OptimizationReport> report;
    std::optional<std::filesystem::path> report_path;
};

// Search -> baseline -> report -> save for one portfolio.
// No report is produced when the search yields nothing.
class PortfolioOptimizer {
public:
    PortfolioOptimizer(std::shared_ptr<core::ICandidateLoader> loader,
                       std::shared_ptr<core::IEfficiencyAnalyzer> analyzer,
                       std::shared_ptr<core::IErrorSink> error_sink,
                       OptimizationConfig config);

    void setProgressCallback(OptimalSearchController::ProgressCallback callback) {
        controller_.setProgressCallback(std::move(callback));
    }

    // Baseline failures are rethrown as CandidateEvaluationError; save failures as PersistenceError
    OptimizationRun run(const std::vector<StrategyRecord>& strategies, bool save_report = true);

private:
    std::shared_ptr<core::ICandidateLoader> loader_;
    std::shared_ptr<core::IEfficiencyAnalyzer> analyzer_;
    OptimizationConfig config_;
    OptimalSearchController controller_;
};

} // namespace optimization
} // namespace portopt
