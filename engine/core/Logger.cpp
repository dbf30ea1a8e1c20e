#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace Bestiary {

std::shared_ptr<spdlog::logger> Logger::s_engineLogger;
std::shared_ptr<spdlog::logger> Logger::s_gameLogger;
bool Logger::s_initialized = false;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Replace any fallback loggers created before initialization
    spdlog::drop("BESTIARY");
    spdlog::drop("GAME");

    s_engineLogger = std::make_shared<spdlog::logger>("BESTIARY", sinks.begin(), sinks.end());
    s_engineLogger->set_level(spdlog::level::info);
    s_engineLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_engineLogger);

    s_gameLogger = std::make_shared<spdlog::logger>("GAME", sinks.begin(), sinks.end());
    s_gameLogger->set_level(spdlog::level::info);
    s_gameLogger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_gameLogger);

    spdlog::set_default_logger(s_engineLogger);

    s_initialized = true;
}

void Logger::Shutdown() {
    if (!s_initialized) {
        return;
    }

    s_engineLogger->flush();
    s_gameLogger->flush();

    spdlog::drop_all();

    s_engineLogger.reset();
    s_gameLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    GetEngineLogger()->set_level(level);
    GetGameLogger()->set_level(level);
}

void Logger::SetLevel(const std::string& levelName) {
    // Unknown names map to "off" in spdlog
    SetLevel(spdlog::level::from_str(levelName));
}

std::shared_ptr<spdlog::logger>& Logger::GetEngineLogger() {
    if (!s_engineLogger) {
        s_engineLogger = CreateFallback("BESTIARY");
    }
    return s_engineLogger;
}

std::shared_ptr<spdlog::logger>& Logger::GetGameLogger() {
    if (!s_gameLogger) {
        s_gameLogger = CreateFallback("GAME");
    }
    return s_gameLogger;
}

std::shared_ptr<spdlog::logger> Logger::CreateFallback(const std::string& name) {
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("%^[%T] [%n] [%l]%$ %v");
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(spdlog::level::info);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace Bestiary
