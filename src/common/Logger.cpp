#include "common/Logger.h"
#include "common/PathUtils.h"
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace portopt {

namespace {
spdlog::level::level_enum parseLevel(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_dir, const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) return;

    // Relative log dirs live next to the executable
    std::filesystem::path logs_path;
    if (std::filesystem::path(log_dir).is_absolute()) {
        logs_path = log_dir;
    } else {
        logs_path = utils::PathUtils::resolveRelativePath(log_dir);
    }

    std::filesystem::create_directories(logs_path);

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (logs_path / "portopt.log").string(), 1024 * 1024 * 10, 3
        );

        // Sinks attached before initialize are kept
        std::vector<spdlog::sink_ptr> sinks;
        if (main_logger_) {
            sinks = main_logger_->sinks();
        }
        sinks.push_back(console_sink);
        sinks.push_back(file_sink);
        publish(std::move(sinks), parseLevel(level));

        initialized_ = true;
        main_logger_->info("Logger initialized");
        main_logger_->info("Log directory: {}", logs_path.string());

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Log init failed: ") + ex.what());
    }
}

void Logger::addSink(spdlog::sink_ptr sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::debug;
    if (main_logger_) {
        sinks = main_logger_->sinks();
        level = main_logger_->level();
    }
    sinks.push_back(std::move(sink));
    publish(std::move(sinks), level);
}

std::shared_ptr<spdlog::logger> Logger::current() {
    std::lock_guard<std::mutex> lock(mutex_);
    return main_logger_;
}

// Caller holds mutex_. Threads still logging through the previous logger keep it alive.
void Logger::publish(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>("main", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop("main");
    spdlog::register_logger(logger);
    main_logger_ = std::move(logger);
}

void Logger::setLevel(const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (main_logger_) {
        main_logger_->set_level(parseLevel(level));
    }
}

} // namespace portopt
