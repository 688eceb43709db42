#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace portopt {

class Logger {
public:
    static Logger& getInstance();
    void initialize(const std::string& log_dir = "logs", const std::string& level = "info");

    // Attach an extra sink (creates the logger on first use when initialize was not called)
    void addSink(spdlog::sink_ptr sink);
    void setLevel(const std::string& level);

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->error(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;

    // Snapshot taken under the lock; sinks are never changed on a published logger
    std::shared_ptr<spdlog::logger> current();
    void publish(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level);

    std::shared_ptr<spdlog::logger> main_logger_;
    std::mutex mutex_;
    bool initialized_ = false;
};

#define LOG_DEBUG(...) portopt::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...) portopt::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...) portopt::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) portopt::Logger::getInstance().error(__VA_ARGS__)

} // namespace portopt
