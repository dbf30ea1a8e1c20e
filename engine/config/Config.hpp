#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace Bestiary {

/**
 * @brief Errors reported by configuration I/O
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error);

/**
 * @brief JSON-based configuration document
 *
 * Values are addressed with dot-separated key paths ("elite.base_chance").
 * Missing keys and type mismatches fall back to the caller's default.
 */
class Config {
public:
    Config() = default;

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     * @param createIfMissing Write the default document first when the file is absent
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath,
                                          bool createIfMissing = false);

    /**
     * @brief Replace the document with already parsed JSON
     */
    void LoadFromJson(const nlohmann::json& data);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "") const;

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @param key Dot-separated key path (e.g., "encounter.max_enemies")
     * @param defaultValue Value to return if key not found or of the wrong type
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    [[nodiscard]] bool Has(std::string_view key) const;

    [[nodiscard]] const nlohmann::json& GetJson() const { return m_data; }
    [[nodiscard]] const std::filesystem::path& GetPath() const { return m_filepath; }

    /**
     * @brief The default configuration document
     */
    [[nodiscard]] static nlohmann::json DefaultDocument();

    /**
     * @brief Create default configuration file
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        *node = value;
    }
}

/**
 * @brief Encounter generation tuning defaults
 */
struct EncounterTuning {
    // Elite rolls
    double eliteBaseChance = 0.15;

    // Overworld battle sizing
    int minEnemies = 1;
    int maxEnemies = 8;
    std::vector<std::string> swarmPartyTypes = {"goblin", "wolf", "monster", "rat"};
    std::vector<std::string> elitePartyTypes = {"knight", "boss", "guard", "noble"};
    double swarmMultiplier = 1.5;
    double eliteMultiplier = 0.75;

    // Dungeon floors
    double uniqueSpawnChance = 0.15;
    int maxUniquePerFloor = 2;
    int maxEnemiesPerFloor = 12;

    /**
     * @brief Read tuning values, keeping defaults for missing keys
     */
    static EncounterTuning FromConfig(const Config& config);
};

/**
 * @brief Application-level settings (logging, content, seeding)
 */
struct AppConfig {
    std::string logLevel = "info";
    std::string logFile;
    std::string contentDirectory = "data";
    std::int64_t seed = -1;  // Negative: seed from std::random_device

    static AppConfig FromConfig(const Config& config);
};

} // namespace Bestiary
