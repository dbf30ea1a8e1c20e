#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <string>

namespace Bestiary {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Owns two named loggers: "BESTIARY" for engine-level code (registry,
 * configuration, random source) and "GAME" for encounter generation.
 * Accessors lazily create a console logger so that library code can log
 * before Initialize() has been called (tests, tools).
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the minimum log level from its name ("info", "warn", "off", ...)
     */
    static void SetLevel(const std::string& levelName);

    [[nodiscard]] static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the engine logger
     */
    static std::shared_ptr<spdlog::logger>& GetEngineLogger();

    /**
     * @brief Get the game logger
     */
    static std::shared_ptr<spdlog::logger>& GetGameLogger();

private:
    static std::shared_ptr<spdlog::logger> CreateFallback(const std::string& name);

    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_gameLogger;
    static bool s_initialized;
};

} // namespace Bestiary

// Convenience macros for engine logging
#define BESTIARY_LOG_TRACE(...)    ::Bestiary::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define BESTIARY_LOG_DEBUG(...)    ::Bestiary::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define BESTIARY_LOG_INFO(...)     ::Bestiary::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define BESTIARY_LOG_WARN(...)     ::Bestiary::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define BESTIARY_LOG_ERROR(...)    ::Bestiary::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define BESTIARY_LOG_CRITICAL(...) ::Bestiary::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for encounter generation logging
#define GAME_LOG_TRACE(...)    ::Bestiary::Logger::GetGameLogger()->trace(__VA_ARGS__)
#define GAME_LOG_DEBUG(...)    ::Bestiary::Logger::GetGameLogger()->debug(__VA_ARGS__)
#define GAME_LOG_INFO(...)     ::Bestiary::Logger::GetGameLogger()->info(__VA_ARGS__)
#define GAME_LOG_WARN(...)     ::Bestiary::Logger::GetGameLogger()->warn(__VA_ARGS__)
#define GAME_LOG_ERROR(...)    ::Bestiary::Logger::GetGameLogger()->error(__VA_ARGS__)
#define GAME_LOG_CRITICAL(...) ::Bestiary::Logger::GetGameLogger()->critical(__VA_ARGS__)
