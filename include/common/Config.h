#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "optimization/OptimizationConfig.h"

namespace portopt {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    std::size_t getErrorRegistryCapacity() const { return error_registry_capacity_; }

    optimization::OptimizationConfig getOptimizationConfig() const { return optimization_config_; }

    // Strategies listed inline under "strategies" (empty when the portfolio is loaded elsewhere)
    const std::vector<StrategyRecord>& getStrategies() const { return strategies_; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
    std::size_t error_registry_capacity_ = 1000;

    optimization::OptimizationConfig optimization_config_;
    std::vector<StrategyRecord> strategies_;
};

} // namespace portopt
