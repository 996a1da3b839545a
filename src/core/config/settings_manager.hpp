/// @file settings_manager.hpp
/// @brief Reading, writing and checking engine settings
///
/// Settings files are TOML. Builds without toml++ treat every existing file
/// as defaults and cannot save.

#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "settings.hpp"

namespace lumen::config {

enum class ConfigError {
    FileNotFound,
    ParseError,
    ValidationError,
    IoError,
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError error) noexcept {
    switch (error) {
    case ConfigError::FileNotFound:
        return "Settings file not found";
    case ConfigError::ParseError:
        return "Settings file is not valid TOML";
    case ConfigError::ValidationError:
        return "Settings failed validation";
    case ConfigError::IoError:
        return "Cannot write settings file";
    }
    return "Unknown settings error";
}

/// @brief Findings of SettingsManager::validate
///
/// Errors make the settings unusable. Warnings describe legal settings that
/// weaken isolation or responsiveness.
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class SettingsManager {
public:
    /// @brief Read a settings file; keys that are absent keep their defaults
    [[nodiscard]] static std::expected<Settings, ConfigError>
    loadFrom(const std::filesystem::path& path);

    /// @brief Read a settings file, falling back to defaults when it is absent or broken
    [[nodiscard]] static Settings loadOrDefault(const std::filesystem::path& path = defaultPath());

    [[nodiscard]] static std::expected<void, ConfigError> saveTo(const Settings& settings,
                                                                 const std::filesystem::path& path);

    [[nodiscard]] static ValidationResult validate(const Settings& settings);

    /// @brief Install the default logger described by the logging section
    static void applyLogging(const LoggingSettings& logging);

    /// @brief $XDG_CONFIG_HOME/lumen/settings.toml, falling back to ~/.config
    [[nodiscard]] static std::filesystem::path defaultPath();
};

}  // namespace lumen::config
