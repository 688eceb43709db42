#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace portopt {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeLevel(std::string level) {
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    level = trimCopy(level);

    // Python-style level name
    if (level == "warning") {
        return "warn";
    }
    return level;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "Config path: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "Warning: config file not found: " << config_path << std::endl;
            std::cout << "Using defaults." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: cannot open config file." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "Config loaded: portfolio=" << optimization_config_.portfolio
                  << ", min_size=" << optimization_config_.min_size << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = normalizeLevel(l.value("level", log_level_));
        log_dir_ = l.value("dir", log_dir_);
        error_registry_capacity_ = l.value("error_registry_capacity", error_registry_capacity_);
    }

    const std::string env_level = readEnvVar("PORTOPT_LOG_LEVEL");
    if (!env_level.empty()) {
        log_level_ = normalizeLevel(env_level);
    }

    if (j.contains("optimization")) {
        auto& o = j["optimization"];
        optimization_config_.portfolio = o.value("portfolio", optimization_config_.portfolio);
        optimization_config_.min_size = o.value("min_size", optimization_config_.min_size);
        optimization_config_.allocation_mode = o.value("allocation_mode", optimization_config_.allocation_mode);
        // Report dir stays relative to the working directory
        optimization_config_.output_dir = o.value("output_dir", optimization_config_.output_dir);

        if (o.contains("max_size") && o["max_size"].is_number_integer()) {
            optimization_config_.max_size = o["max_size"].get<int>();
        } else {
            optimization_config_.max_size.reset();
        }
        if (o.contains("max_candidates") && o["max_candidates"].is_number_unsigned()) {
            optimization_config_.max_candidates = o["max_candidates"].get<std::size_t>();
        } else {
            optimization_config_.max_candidates.reset();
        }
        if (o.contains("horizon") && o["horizon"].is_number_integer()) {
            optimization_config_.horizon = o["horizon"].get<int>();
        } else {
            optimization_config_.horizon.reset();
        }
    }

    strategies_.clear();
    if (j.contains("strategies") && j["strategies"].is_array()) {
        strategies_ = j["strategies"].get<std::vector<StrategyRecord>>();
    }
}

} // namespace portopt
