#include "pqshare/core/logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>

namespace pqshare::core {

std::shared_ptr<spdlog::logger> Logger::logger_;

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return fallback;
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(static_cast<spdlog::level::level_enum>(level));
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    if (!log_file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1048576 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    logger_ = std::make_shared<spdlog::logger>("pqshare", sinks.begin(), sinks.end());
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    logger_->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger_);
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));

    LOG_INFO("Logger initialized with level: {}", static_cast<int>(level));
}

void Logger::shutdown() {
    if (logger_) {
        LOG_INFO("Shutting down logger");
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();

        // Keep a console default so LOG_* stays usable after shutdown
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "pqshare-console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
    }
}

void Logger::set_level(LogLevel level) {
    get()->set_level(static_cast<spdlog::level::level_enum>(level));
}

std::shared_ptr<spdlog::logger> Logger::get() {
    if (logger_) {
        return logger_;
    }
    return spdlog::default_logger();
}

}
