#include "optimization/PortfolioOptimizer.h"
#include "optimization/CandidateEvaluator.h"
#include "report/ReportBuilder.h"
#include "report/ReportPersister.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace portopt {
namespace optimization {

PortfolioOptimizer::PortfolioOptimizer(std::shared_ptr<core::ICandidateLoader> loader,
                                       std::shared_ptr<core::IEfficiencyAnalyzer> analyzer,
                                       std::shared_ptr<core::IErrorSink> error_sink,
                                       OptimizationConfig config)
    : loader_(loader)
    , analyzer_(analyzer)
    , config_(config)
    , controller_(loader, analyzer, std::move(error_sink), config) {}

OptimizationRun PortfolioOptimizer::run(const std::vector<StrategyRecord>& strategies, bool save_report) {
    OptimizationRun out;
    out.search = controller_.run(strategies);

    if (!out.search.found()) {
        LOG_WARN("No optimal candidate for {}; keeping all {} strategies",
                 config_.portfolio, strategies.size());
        return out;
    }

    CandidateEvaluator evaluator(*loader_, *analyzer_, config_);
    try {
        out.baseline_stats = evaluator.evaluate(strategies).stats;
    } catch (const std::exception& e) {
        LOG_ERROR("Baseline evaluation of all {} strategies failed: {}", strategies.size(), e.what());
        throw CandidateEvaluationError(std::string("Baseline evaluation failed: ") + e.what(),
                                       out.search.summary.attempted, out.search.summary.attempted + 1);
    }

    out.report = report::ReportBuilder::build(strategies, *out.baseline_stats,
                                              *out.search.best_candidate, *out.search.best_stats,
                                              config_);
    if (save_report) {
        out.report_path = report::ReportPersister::save(*out.report, config_);
    }
    return out;
}

} // namespace optimization
} // namespace portopt
