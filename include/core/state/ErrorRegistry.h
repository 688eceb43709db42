#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/contracts/IErrorSink.h"

namespace portopt {
namespace core {

struct ErrorRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string operation;
    std::string error_type;
    std::string error_message;
    nlohmann::json context = nlohmann::json::object();
};

struct ErrorStats {
    std::size_t total_errors = 0;
    std::map<std::string, int> errors_by_type;
    std::map<std::string, int> errors_by_operation;
    std::vector<std::pair<std::string, int>> most_common_errors;  // "Type: message", count desc
    std::map<std::string, double> error_rate_by_operation;       // errors / (errors + successes)
};

void to_json(nlohmann::json& j, const ErrorRecord& record);
void to_json(nlohmann::json& j, const ErrorStats& stats);

// Bounded in-memory collector of evaluation failures.
// Owned by whoever runs the search; there is no process-wide instance.
class ErrorRegistry : public IErrorSink {
public:
    explicit ErrorRegistry(std::size_t max_records = 1000);

    void recordError(const std::exception& error,
                     const std::string& operation,
                     const nlohmann::json& context = nlohmann::json::object()) noexcept override;
    void recordOperation(const std::string& operation) noexcept override;

    // Test and import hook; the oldest record is dropped when full
    void addRecord(ErrorRecord record);

    std::vector<ErrorRecord> errors() const;
    std::size_t maxRecords() const { return max_records_; }
    int operationCount(const std::string& operation) const;

    ErrorStats errorStats() const;
    std::vector<ErrorRecord> errorsByOperation(const std::string& operation) const;
    std::vector<ErrorRecord> errorsByType(const std::string& error_type) const;

    // Writes {"error_count", "errors", "stats"}; returns false on I/O failure
    bool exportErrors(const std::filesystem::path& path) const;

    // Drops records older than hours_back; returns how many were removed
    std::size_t clearOldErrors(int hours_back = 24);

private:
    static std::string errorTypeName(const std::exception& error);
    void pushLocked(ErrorRecord record);

    std::size_t max_records_;
    mutable std::mutex mutex_;
    std::deque<ErrorRecord> records_;
    std::map<std::string, int> operation_counts_;
};

} // namespace core
} // namespace portopt
