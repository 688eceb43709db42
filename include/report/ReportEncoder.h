#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <valarray>
#include <vector>

#include <nlohmann/json.hpp>

#include "report/OptimizationReport.h"

namespace portopt {
namespace report {

// Converts report values to plain JSON.
//
// Every integer width encodes as a JSON integer, every floating type as a
// JSON number and every array-like container as a JSON array. Empty optionals
// become null; only DefaultHorizon falls back to 1.
class ReportEncoder {
public:
    template<typename T>
    static std::enable_if_t<std::is_arithmetic<T>::value, nlohmann::json> encode(T value) {
        if constexpr (std::is_same<T, bool>::value) {
            return nlohmann::json(value);
        } else if constexpr (std::is_floating_point<T>::value) {
            return nlohmann::json(static_cast<double>(value));
        } else if constexpr (std::is_signed<T>::value) {
            return nlohmann::json(static_cast<std::int64_t>(value));
        } else {
            return nlohmann::json(static_cast<std::uint64_t>(value));
        }
    }

    static nlohmann::json encode(const std::string& value) { return nlohmann::json(value); }
    static nlohmann::json encode(const char* value) { return nlohmann::json(std::string(value)); }
    static nlohmann::json encode(const nlohmann::json& value) { return value; }
    static nlohmann::json encode(const DefaultHorizon& horizon) { return nlohmann::json(horizon.resolved()); }

    template<typename T>
    static nlohmann::json encode(const std::optional<T>& value) {
        return value ? encode(*value) : nlohmann::json(nullptr);
    }

    template<typename T, typename Alloc>
    static nlohmann::json encode(const std::vector<T, Alloc>& values) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& v : values) {
            out.push_back(encode(v));
        }
        return out;
    }

    template<typename T, std::size_t N>
    static nlohmann::json encode(const std::array<T, N>& values) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& v : values) {
            out.push_back(encode(v));
        }
        return out;
    }

    template<typename T>
    static nlohmann::json encode(const std::valarray<T>& values) {
        nlohmann::json out = nlohmann::json::array();
        for (std::size_t i = 0; i < values.size(); ++i) {
            out.push_back(encode(values[i]));
        }
        return out;
    }

    template<typename V>
    static nlohmann::json encode(const std::map<std::string, V>& values) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [key, v] : values) {
            out[key] = encode(v);
        }
        return out;
    }

    static nlohmann::json encode(const GroupSummary& group);
    static nlohmann::json encode(const ReportConfigEcho& config);

    // Top level: optimization_summary, all_strategies, optimal_strategies,
    // config, efficiency_calculation_note
    static nlohmann::json encode(const OptimizationReport& report);
};

} // namespace report
} // namespace portopt
