#pragma once

#include <stdexcept>
#include <string>

namespace Bestiary {
namespace Enemies {

// ============================================================================
// Registry Errors
// ============================================================================

/**
 * @brief Thrown when an archetype or pack id is not registered
 */
class NotFoundError : public std::runtime_error {
public:
    NotFoundError(const std::string& kind, const std::string& id)
        : std::runtime_error("Unknown " + kind + " id: " + id)
        , m_kind(kind)
        , m_id(id) {}

    [[nodiscard]] const std::string& GetKind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string& GetId() const noexcept { return m_id; }

private:
    std::string m_kind;
    std::string m_id;
};

/**
 * @brief Thrown when an id is registered twice
 */
class DuplicateRegistrationError : public std::runtime_error {
public:
    DuplicateRegistrationError(const std::string& kind, const std::string& id)
        : std::runtime_error("Duplicate " + kind + " id: " + id)
        , m_kind(kind)
        , m_id(id) {}

    [[nodiscard]] const std::string& GetKind() const noexcept { return m_kind; }
    [[nodiscard]] const std::string& GetId() const noexcept { return m_id; }

private:
    std::string m_kind;
    std::string m_id;
};

/**
 * @brief Thrown when selection is attempted against a registry with no archetypes
 */
class EmptyRegistryError : public std::runtime_error {
public:
    EmptyRegistryError()
        : std::runtime_error("No enemy archetypes are registered") {}
};

/**
 * @brief Thrown when registering after the registry has been sealed
 */
class RegistrySealedError : public std::runtime_error {
public:
    explicit RegistrySealedError(const std::string& id)
        : std::runtime_error("Registry is sealed, cannot register: " + id) {}
};

/**
 * @brief Thrown when a content file cannot be read or parsed
 */
class ContentParseError : public std::runtime_error {
public:
    ContentParseError(const std::string& path, const std::string& message)
        : std::runtime_error("Failed to load content '" + path + "': " + message)
        , m_path(path) {}

    [[nodiscard]] const std::string& GetPath() const noexcept { return m_path; }

private:
    std::string m_path;
};

} // namespace Enemies
} // namespace Bestiary
