#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <iomanip>

namespace Bestiary {

const char* ConfigErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::WriteError:   return "write error";
    }
    return "unknown";
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath,
                                              bool createIfMissing) {
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        if (!createIfMissing) {
            BESTIARY_LOG_ERROR("Config file not found: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }
        BESTIARY_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        if (auto created = CreateDefault(filepath); !created) {
            return std::unexpected(created.error());
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            BESTIARY_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }

        m_data = nlohmann::json::parse(file);
        BESTIARY_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        BESTIARY_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

void Config::LoadFromJson(const nlohmann::json& data) {
    m_data = data.is_object() ? data : nlohmann::json::object();
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) const {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        BESTIARY_LOG_ERROR("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            BESTIARY_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        BESTIARY_LOG_INFO("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::exception& e) {
        BESTIARY_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> Config::Reload() {
    if (m_filepath.empty()) {
        BESTIARY_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(m_filepath);
}

bool Config::Has(std::string_view key) const {
    return NavigateToKey(key) != nullptr;
}

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // anonymous namespace

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

nlohmann::json Config::DefaultDocument() {
    nlohmann::json config;

    // Elite variants
    config["elite"]["base_chance"] = 0.15;

    // Overworld encounter sizing
    config["encounter"]["min_enemies"] = 1;
    config["encounter"]["max_enemies"] = 8;
    config["encounter"]["swarm_party_types"] = {"goblin", "wolf", "monster", "rat"};
    config["encounter"]["elite_party_types"] = {"knight", "boss", "guard", "noble"};
    config["encounter"]["swarm_multiplier"] = 1.5;
    config["encounter"]["elite_multiplier"] = 0.75;

    // Dungeon floors
    config["floor"]["unique_spawn_chance"] = 0.15;
    config["floor"]["max_unique_per_floor"] = 2;
    config["floor"]["max_enemies"] = 12;

    // Logging
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";

    // Content
    config["content"]["directory"] = "data";

    // Random
    config["random"]["seed"] = -1;

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            BESTIARY_LOG_ERROR("Failed to create default config: {}", filepath.string());
            return std::unexpected(ConfigError::WriteError);
        }
        file << std::setw(4) << DefaultDocument() << std::endl;
        BESTIARY_LOG_INFO("Created default configuration at: {}", filepath.string());
        return {};
    } catch (const std::filesystem::filesystem_error& e) {
        BESTIARY_LOG_ERROR("Failed to create default config: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

// ============================================================================
// Defaults structs
// ============================================================================

EncounterTuning EncounterTuning::FromConfig(const Config& config) {
    EncounterTuning tuning;
    tuning.eliteBaseChance = config.Get("elite.base_chance", tuning.eliteBaseChance);
    tuning.minEnemies = config.Get("encounter.min_enemies", tuning.minEnemies);
    tuning.maxEnemies = config.Get("encounter.max_enemies", tuning.maxEnemies);
    tuning.swarmPartyTypes = config.Get("encounter.swarm_party_types", tuning.swarmPartyTypes);
    tuning.elitePartyTypes = config.Get("encounter.elite_party_types", tuning.elitePartyTypes);
    tuning.swarmMultiplier = config.Get("encounter.swarm_multiplier", tuning.swarmMultiplier);
    tuning.eliteMultiplier = config.Get("encounter.elite_multiplier", tuning.eliteMultiplier);
    tuning.uniqueSpawnChance = config.Get("floor.unique_spawn_chance", tuning.uniqueSpawnChance);
    tuning.maxUniquePerFloor = config.Get("floor.max_unique_per_floor", tuning.maxUniquePerFloor);
    tuning.maxEnemiesPerFloor = config.Get("floor.max_enemies", tuning.maxEnemiesPerFloor);

    if (tuning.minEnemies < 1) {
        BESTIARY_LOG_WARN("encounter.min_enemies must be at least 1, got {}", tuning.minEnemies);
        tuning.minEnemies = 1;
    }
    if (tuning.maxEnemies < tuning.minEnemies) {
        BESTIARY_LOG_WARN("encounter.max_enemies ({}) below min_enemies ({}), clamping",
                          tuning.maxEnemies, tuning.minEnemies);
        tuning.maxEnemies = tuning.minEnemies;
    }
    return tuning;
}

AppConfig AppConfig::FromConfig(const Config& config) {
    AppConfig app;
    app.logLevel = config.Get<std::string>("logging.level", app.logLevel);
    app.logFile = config.Get<std::string>("logging.file", app.logFile);
    app.contentDirectory = config.Get<std::string>("content.directory", app.contentDirectory);
    app.seed = config.Get<std::int64_t>("random.seed", app.seed);
    return app;
}

} // namespace Bestiary
