#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace portopt {

// Base of every error raised by the optimizer. context() carries structured detail.
class OptimizerError : public std::runtime_error {
public:
    explicit OptimizerError(const std::string& message,
                            nlohmann::json context = nlohmann::json::object())
        : std::runtime_error(message), context_(std::move(context)) {}

    const nlohmann::json& context() const { return context_; }

protected:
    nlohmann::json context_;
};

// Malformed search parameters. Never recovered.
class ValidationError : public OptimizerError {
public:
    ValidationError(const std::string& message,
                    const std::string& field_name,
                    const std::string& expected,
                    const std::string& actual_value)
        : OptimizerError(message)
        , field_name_(field_name)
        , expected_(expected)
        , actual_value_(actual_value) {
        context_["field_name"] = field_name;
        context_["expected"] = expected;
        context_["actual_value"] = actual_value;
    }

    const std::string& fieldName() const { return field_name_; }
    const std::string& expected() const { return expected_; }
    const std::string& actualValue() const { return actual_value_; }

private:
    std::string field_name_;
    std::string expected_;
    std::string actual_value_;
};

// A single candidate failed to load or score. Recovered by the search controller.
class CandidateEvaluationError : public OptimizerError {
public:
    CandidateEvaluationError(const std::string& message,
                             std::size_t candidate_index,
                             std::size_t candidate_count)
        : OptimizerError(message)
        , candidate_index_(candidate_index)
        , candidate_count_(candidate_count) {
        context_["candidate_index"] = candidate_index;
        context_["candidate_count"] = candidate_count;
    }

    std::size_t candidateIndex() const { return candidate_index_; }
    std::size_t candidateCount() const { return candidate_count_; }

private:
    std::size_t candidate_index_;
    std::size_t candidate_count_;
};

// Writing the report failed.
class PersistenceError : public OptimizerError {
public:
    PersistenceError(const std::string& message, const std::string& path)
        : OptimizerError(message), path_(path) {
        context_["path"] = path;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace portopt
