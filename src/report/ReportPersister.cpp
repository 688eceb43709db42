#include "report/ReportPersister.h"
#include "report/ReportEncoder.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <fstream>
#include <system_error>

namespace portopt {
namespace report {
namespace {
[[noreturn]] void fail(const std::filesystem::path& path, const std::string& reason) {
    LOG_ERROR("Failed to save optimization report to {}: {}", path.string(), reason);
    throw PersistenceError("Failed to save optimization report: " + reason, path.string());
}

// Drops a partially written temp file, then fails
[[noreturn]] void failAndDiscard(const std::filesystem::path& path,
                                 const std::filesystem::path& tmp_path,
                                 const std::string& reason) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    if (ec) {
        LOG_WARN("Could not remove temporary report file {}: {}", tmp_path.string(), ec.message());
    }
    fail(path, reason);
}
}

std::filesystem::path ReportPersister::reportPath(const optimization::OptimizationConfig& config) {
    const std::string file_name = utils::PathUtils::portfolioStem(config.portfolio) + "_optimization.json";
    return std::filesystem::path(config.output_dir) / file_name;
}

std::filesystem::path ReportPersister::save(const OptimizationReport& report,
                                            const optimization::OptimizationConfig& config) {
    const std::filesystem::path path = reportPath(config);
    std::string text;
    try {
        text = ReportEncoder::encode(report).dump(4);
    } catch (const nlohmann::json::exception& e) {
        fail(path, std::string("cannot encode report: ") + e.what());
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            fail(path, "cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            fail(path, "cannot open " + tmp_path.string() + " for writing");
        }
        out << text;
        out.flush();
        if (!out) {
            out.close();
            failAndDiscard(path, tmp_path, "write error");
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        // rename can fail across filesystems; fall back to copy+remove
        ec.clear();
        std::filesystem::copy_file(tmp_path, path, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            failAndDiscard(path, tmp_path, ec.message());
        }
        std::filesystem::remove(tmp_path, ec);
        if (ec) {
            LOG_WARN("Could not remove temporary report file {}: {}", tmp_path.string(), ec.message());
        }
    }

    LOG_INFO("Optimization report saved to {}", path.string());
    return path;
}

} // namespace report
} // namespace portopt
