#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace portopt {

namespace {
std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}
}

std::string toString(StrategyType type) {
    switch (type) {
        case StrategyType::SMA: return "SMA";
        case StrategyType::EMA: return "EMA";
        case StrategyType::MACD: return "MACD";
        case StrategyType::ATR: return "ATR";
        case StrategyType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

StrategyType strategyTypeFromString(const std::string& value) {
    const std::string upper = toUpperCopy(value);
    if (upper == "SMA") return StrategyType::SMA;
    if (upper == "EMA") return StrategyType::EMA;
    if (upper == "MACD") return StrategyType::MACD;
    if (upper == "ATR") return StrategyType::ATR;
    return StrategyType::UNKNOWN;
}

std::string toString(Direction direction) {
    return direction == Direction::SHORT ? "Short" : "Long";
}

Direction directionFromString(const std::string& value) {
    return toUpperCopy(value) == "SHORT" ? Direction::SHORT : Direction::LONG;
}

std::string StrategyRecord::strategyId() const {
    std::string id = toUpperCopy(ticker) + "_" + toString(strategy_type) + "_" +
                     std::to_string(short_window) + "_" + std::to_string(long_window);
    if (strategy_type != StrategyType::SMA && strategy_type != StrategyType::EMA) {
        id += "_" + std::to_string(signal_window);
    }
    return id;
}

void to_json(nlohmann::json& j, const StrategyRecord& record) {
    j = nlohmann::json{
        {"ticker", record.ticker},
        {"timeframe", record.timeframe},
        {"strategy_type", toString(record.strategy_type)},
        {"direction", toString(record.direction)},
        {"short_window", record.short_window},
        {"long_window", record.long_window},
        {"signal_window", record.signal_window},
        {"allocation", record.allocation}
    };
    if (record.stop_loss) {
        j["stop_loss"] = *record.stop_loss;
    }
    if (!record.portfolio_stats.is_null()) {
        j["portfolio_stats"] = record.portfolio_stats;
    }
}

void from_json(const nlohmann::json& j, StrategyRecord& record) {
    record.ticker = j.value("ticker", std::string());
    record.timeframe = j.value("timeframe", std::string("D"));
    record.strategy_type = strategyTypeFromString(j.value("strategy_type", std::string("SMA")));
    record.direction = directionFromString(j.value("direction", std::string("Long")));
    record.short_window = j.value("short_window", 0);
    record.long_window = j.value("long_window", 0);
    record.signal_window = j.value("signal_window", 0);
    record.allocation = j.value("allocation", 0.0);
    if (j.contains("stop_loss") && j["stop_loss"].is_number()) {
        record.stop_loss = j["stop_loss"].get<double>();
    } else {
        record.stop_loss.reset();
    }
    record.portfolio_stats = j.value("portfolio_stats", nlohmann::json());
}

} // namespace portopt
