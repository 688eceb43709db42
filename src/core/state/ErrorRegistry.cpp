#include "core/state/ErrorRegistry.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <typeinfo>

#include <boost/core/demangle.hpp>

namespace portopt {
namespace core {

namespace {
long long toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
}

void to_json(nlohmann::json& j, const ErrorRecord& record) {
    j = nlohmann::json{
        {"timestamp_ms", toEpochMs(record.timestamp)},
        {"operation", record.operation},
        {"error_type", record.error_type},
        {"error_message", record.error_message},
        {"context", record.context}
    };
}

void to_json(nlohmann::json& j, const ErrorStats& stats) {
    nlohmann::json common = nlohmann::json::array();
    for (const auto& [message, count] : stats.most_common_errors) {
        common.push_back({{"error", message}, {"count", count}});
    }
    j = nlohmann::json{
        {"total_errors", stats.total_errors},
        {"errors_by_type", stats.errors_by_type},
        {"errors_by_operation", stats.errors_by_operation},
        {"most_common_errors", common},
        {"error_rate_by_operation", stats.error_rate_by_operation}
    };
}

ErrorRegistry::ErrorRegistry(std::size_t max_records)
    : max_records_(max_records == 0 ? 1 : max_records) {}

void ErrorRegistry::recordError(const std::exception& error,
                                const std::string& operation,
                                const nlohmann::json& context) noexcept {
    try {
        ErrorRecord record;
        record.timestamp = std::chrono::system_clock::now();
        record.operation = operation;
        record.error_type = errorTypeName(error);
        record.error_message = error.what();
        record.context = context.is_null() ? nlohmann::json::object() : context;

        std::lock_guard<std::mutex> lock(mutex_);
        pushLocked(std::move(record));
    } catch (const std::exception& e) {
        LOG_WARN("ErrorRegistry dropped a record for {}: {}", operation, e.what());
    }
}

void ErrorRegistry::recordOperation(const std::string& operation) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        operation_counts_[operation]++;
    } catch (const std::exception& e) {
        LOG_WARN("ErrorRegistry failed to count {}: {}", operation, e.what());
    }
}

void ErrorRegistry::addRecord(ErrorRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    pushLocked(std::move(record));
}

void ErrorRegistry::pushLocked(ErrorRecord record) {
    records_.push_back(std::move(record));
    while (records_.size() > max_records_) {
        records_.pop_front();
    }
}

std::vector<ErrorRecord> ErrorRegistry::errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ErrorRecord>(records_.begin(), records_.end());
}

int ErrorRegistry::operationCount(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = operation_counts_.find(operation);
    return it == operation_counts_.end() ? 0 : it->second;
}

ErrorStats ErrorRegistry::errorStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ErrorStats stats;
    stats.total_errors = records_.size();

    std::map<std::string, int> by_message;
    for (const auto& record : records_) {
        stats.errors_by_type[record.error_type]++;
        stats.errors_by_operation[record.operation]++;
        by_message[record.error_type + ": " + record.error_message]++;
    }

    stats.most_common_errors.assign(by_message.begin(), by_message.end());
    std::stable_sort(stats.most_common_errors.begin(), stats.most_common_errors.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (stats.most_common_errors.size() > 5) {
        stats.most_common_errors.resize(5);
    }

    for (const auto& [operation, failures] : stats.errors_by_operation) {
        auto it = operation_counts_.find(operation);
        const int successes = (it == operation_counts_.end()) ? 0 : it->second;
        stats.error_rate_by_operation[operation] =
            static_cast<double>(failures) / static_cast<double>(failures + successes);
    }
    for (const auto& [operation, successes] : operation_counts_) {
        if (successes > 0 && stats.error_rate_by_operation.count(operation) == 0) {
            stats.error_rate_by_operation[operation] = 0.0;
        }
    }
    return stats;
}

std::vector<ErrorRecord> ErrorRegistry::errorsByOperation(const std::string& operation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ErrorRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [&](const ErrorRecord& r) { return r.operation == operation; });
    return out;
}

std::vector<ErrorRecord> ErrorRegistry::errorsByType(const std::string& error_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ErrorRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [&](const ErrorRecord& r) { return r.error_type == error_type; });
    return out;
}

bool ErrorRegistry::exportErrors(const std::filesystem::path& path) const {
    nlohmann::json raw;
    raw["stats"] = errorStats();
    raw["errors"] = errors();
    raw["error_count"] = raw["errors"].size();
    raw["exported_at_ms"] = toEpochMs(std::chrono::system_clock::now());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Cannot create {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot open error export file: {}", path.string());
        return false;
    }
    out << raw.dump(2);
    return static_cast<bool>(out);
}

std::size_t ErrorRegistry::clearOldErrors(int hours_back) {
    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(hours_back);

    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const ErrorRecord& r) { return r.timestamp < cutoff; }),
                   records_.end());
    return before - records_.size();
}

std::string ErrorRegistry::errorTypeName(const std::exception& error) {
    const std::string full = boost::core::demangle(typeid(error).name());
    const auto template_start = full.find('<');
    const auto sep = full.rfind("::", template_start);
    return (sep == std::string::npos) ? full : full.substr(sep + 2);
}

} // namespace core
} // namespace portopt
