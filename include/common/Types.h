#pragma once

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>

namespace portopt {

enum class StrategyType { SMA, EMA, MACD, ATR, UNKNOWN };
enum class Direction { LONG, SHORT };

std::string toString(StrategyType type);
StrategyType strategyTypeFromString(const std::string& value);
std::string toString(Direction direction);
Direction directionFromString(const std::string& value);

// One configured strategy from a portfolio file
struct StrategyRecord {
    std::string ticker;
    std::string timeframe = "D";
    StrategyType strategy_type = StrategyType::SMA;
    Direction direction = Direction::LONG;
    int short_window = 0;
    int long_window = 0;
    int signal_window = 0;
    double allocation = 0.0;            // fraction of capital, [0, 1]
    std::optional<double> stop_loss;
    nlohmann::json portfolio_stats;     // score, win_rate, trade_count, profit_factor ...

    // TICKER_TYPE_short_long[_signal]; signal window only for MACD/ATR
    std::string strategyId() const;
};

void to_json(nlohmann::json& j, const StrategyRecord& record);
void from_json(const nlohmann::json& j, StrategyRecord& record);

// Unordered set of strategies evaluated together. Members are owned copies.
using Candidate = std::vector<StrategyRecord>;

struct EfficiencyStats {
    double efficiency_score = 0.0;
    std::optional<double> diversification_multiplier;
    std::optional<double> independence_multiplier;
    std::optional<double> activity_multiplier;
    std::optional<double> total_expectancy;
    std::optional<double> weighted_efficiency;
    std::optional<double> risk_concentration_index;
    nlohmann::json extra = nlohmann::json::object();
};

// Per-strategy time series as produced by the loader / aligner
struct StrategySeries {
    std::string strategy_id;
    std::vector<long long> timestamps;
    std::vector<int> positions;
    std::vector<double> returns;
};

using LoadedData = std::vector<StrategySeries>;
using AlignedData = std::vector<StrategySeries>;

} // namespace portopt
