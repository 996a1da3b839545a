/// @file settings_manager.cpp
/// @brief Settings persistence implementation using toml++

#include "settings_manager.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include "../util/logger.hpp"

#ifdef LUMEN_HAS_TOMLPLUSPLUS
    #include <toml++/toml.hpp>
#endif

namespace lumen::config {

namespace {

#ifdef LUMEN_HAS_TOMLPLUSPLUS

// Helper to get optional value from toml table
template <typename T>
T get_or(const toml::table& tbl, std::string_view key, T default_value) {
    if (auto val = tbl[key].value<T>()) {
        return *val;
    }
    return default_value;
}

// Integers are read as int64 and narrowed; negative values fall back to the default
template <typename T>
T get_unsigned_or(const toml::table& tbl, std::string_view key, T default_value) {
    if (auto val = tbl[key].value<int64_t>(); val && *val >= 0) {
        return static_cast<T>(*val);
    }
    return default_value;
}

Settings parse_settings(const toml::table& tbl) {
    Settings settings;

    if (auto* thumbnails = tbl["thumbnails"].as_table()) {
        settings.thumbnails.width =
            get_unsigned_or(*thumbnails, "width", settings.thumbnails.width);
        settings.thumbnails.height =
            get_unsigned_or(*thumbnails, "height", settings.thumbnails.height);
    }

    if (auto* loader = tbl["loader"].as_table()) {
        settings.loader.io_slots = get_unsigned_or(*loader, "io_slots", settings.loader.io_slots);
        settings.loader.decode_workers =
            get_unsigned_or(*loader, "decode_workers", settings.loader.decode_workers);
        auto isolation_str = get_or<std::string>(*loader, "isolation", "process");
        settings.loader.isolation = isolationModeFromString(isolation_str);
    }

    if (auto* store = tbl["store"].as_table()) {
        settings.store.file_name = get_or<std::string>(*store, "file_name", settings.store.file_name);
        settings.store.busy_timeout_ms = static_cast<int>(
            get_or<int64_t>(*store, "busy_timeout_ms", settings.store.busy_timeout_ms));
        settings.store.max_attempts =
            static_cast<int>(get_or<int64_t>(*store, "max_attempts", settings.store.max_attempts));
        settings.store.backoff_base_ms = static_cast<int>(
            get_or<int64_t>(*store, "backoff_base_ms", settings.store.backoff_base_ms));
    }

    if (auto* scan = tbl["scan"].as_table()) {
        settings.scan.chunk_size = get_unsigned_or(*scan, "chunk_size", settings.scan.chunk_size);
        auto policy_str = get_or<std::string>(*scan, "read_policy", "operator");
        settings.scan.read_policy = scanReadPolicyFromString(policy_str);
        settings.scan.prefetch_limit =
            get_unsigned_or(*scan, "prefetch_limit", settings.scan.prefetch_limit);
    }

    if (auto* pump = tbl["pump"].as_table()) {
        settings.pump.batch_size = get_unsigned_or(*pump, "batch_size", settings.pump.batch_size);
        settings.pump.interval_ms =
            get_unsigned_or(*pump, "interval_ms", settings.pump.interval_ms);
    }

    if (auto* cache = tbl["cache"].as_table()) {
        settings.cache.view_budget_mb =
            get_unsigned_or(*cache, "view_budget_mb", settings.cache.view_budget_mb);
        settings.cache.thumbnail_budget_mb =
            get_unsigned_or(*cache, "thumbnail_budget_mb", settings.cache.thumbnail_budget_mb);
    }

    if (auto* logging = tbl["logging"].as_table()) {
        settings.logging.level = get_or<std::string>(*logging, "level", settings.logging.level);
        settings.logging.file = get_or<std::string>(*logging, "file", "");
        settings.logging.console = get_or(*logging, "console", settings.logging.console);
    }

    return settings;
}

toml::table serialize_settings(const Settings& settings) {
    toml::table tbl;

    tbl.insert("thumbnails", toml::table{
                                 { "width",  static_cast<int64_t>(settings.thumbnails.width)},
                                 {"height", static_cast<int64_t>(settings.thumbnails.height)},
    });

    tbl.insert("loader",
               toml::table{
                   {      "io_slots",       static_cast<int64_t>(settings.loader.io_slots)},
                   {"decode_workers", static_cast<int64_t>(settings.loader.decode_workers)},
                   {     "isolation", std::string(to_string(settings.loader.isolation))},
    });

    tbl.insert("store", toml::table{
                            {      "file_name",                        settings.store.file_name},
                            {"busy_timeout_ms", static_cast<int64_t>(settings.store.busy_timeout_ms)},
                            {   "max_attempts",    static_cast<int64_t>(settings.store.max_attempts)},
                            {"backoff_base_ms", static_cast<int64_t>(settings.store.backoff_base_ms)},
    });

    tbl.insert("scan", toml::table{
                           {    "chunk_size",     static_cast<int64_t>(settings.scan.chunk_size)},
                           {   "read_policy", std::string(to_string(settings.scan.read_policy))},
                           {"prefetch_limit", static_cast<int64_t>(settings.scan.prefetch_limit)},
    });

    tbl.insert("pump", toml::table{
                           { "batch_size",  static_cast<int64_t>(settings.pump.batch_size)},
                           {"interval_ms", static_cast<int64_t>(settings.pump.interval_ms)},
    });

    tbl.insert("cache",
               toml::table{
                   {     "view_budget_mb",      static_cast<int64_t>(settings.cache.view_budget_mb)},
                   {"thumbnail_budget_mb", static_cast<int64_t>(settings.cache.thumbnail_budget_mb)},
    });

    toml::table logging_tbl{
        {  "level", settings.logging.level},
        {"console", settings.logging.console},
    };
    if (!settings.logging.file.empty()) {
        logging_tbl.insert("file", settings.logging.file.string());
    }
    tbl.insert("logging", std::move(logging_tbl));

    return tbl;
}

#else

const char* bool_str(bool value) {
    return value ? "true" : "false";
}

#endif  // LUMEN_HAS_TOMLPLUSPLUS

}  // namespace

std::filesystem::path SettingsManager::defaultPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "lumen" / "settings.toml";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "lumen" / "settings.toml";
    }
    return "settings.toml";
}

std::expected<Settings, ConfigError> SettingsManager::loadFrom(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(ConfigError::FileNotFound);
    }

#ifdef LUMEN_HAS_TOMLPLUSPLUS
    try {
        auto tbl = toml::parse_file(path.string());
        return parse_settings(tbl);
    } catch (const toml::parse_error& e) {
        LOG_WARN("Cannot parse {}: {}", path.string(), e.description());
        return std::unexpected(ConfigError::ParseError);
    }
#else
    // Without toml++, return defaults
    return Settings::defaults();
#endif
}

Settings SettingsManager::loadOrDefault(const std::filesystem::path& path) {
    auto result = loadFrom(path);
    if (result) {
        return *result;
    }
    if (result.error() != ConfigError::FileNotFound) {
        LOG_WARN("Using default settings: {}", to_string(result.error()));
    }
    return Settings::defaults();
}

void SettingsManager::applyLogging(const LoggingSettings& logging) {
    auto level = parse_log_level(logging.level);
    if (!init_logging(logging.file, logging.console, level)) {
        // Usually an unwritable log file; keep the console
        init_logging({}, true, level);
        LOG_WARN("Cannot open log file {}", logging.file.string());
    }
}

std::expected<void, ConfigError> SettingsManager::saveTo(const Settings& settings,
                                                         const std::filesystem::path& path) {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file) {
            return std::unexpected(ConfigError::IoError);
        }

#ifdef LUMEN_HAS_TOMLPLUSPLUS
        auto tbl = serialize_settings(settings);
        file << "# lumen configuration\n\n" << tbl << "\n";
#else
        file << "# lumen configuration\n\n";

        file << "[thumbnails]\n";
        file << "width = " << settings.thumbnails.width << "\n";
        file << "height = " << settings.thumbnails.height << "\n\n";

        file << "[loader]\n";
        file << "io_slots = " << settings.loader.io_slots << "\n";
        file << "decode_workers = " << settings.loader.decode_workers << "\n";
        file << "isolation = \"" << to_string(settings.loader.isolation) << "\"\n\n";

        file << "[store]\n";
        file << "file_name = \"" << settings.store.file_name << "\"\n";
        file << "busy_timeout_ms = " << settings.store.busy_timeout_ms << "\n";
        file << "max_attempts = " << settings.store.max_attempts << "\n";
        file << "backoff_base_ms = " << settings.store.backoff_base_ms << "\n\n";

        file << "[scan]\n";
        file << "chunk_size = " << settings.scan.chunk_size << "\n";
        file << "read_policy = \"" << to_string(settings.scan.read_policy) << "\"\n";
        file << "prefetch_limit = " << settings.scan.prefetch_limit << "\n\n";

        file << "[pump]\n";
        file << "batch_size = " << settings.pump.batch_size << "\n";
        file << "interval_ms = " << settings.pump.interval_ms << "\n\n";

        file << "[cache]\n";
        file << "view_budget_mb = " << settings.cache.view_budget_mb << "\n";
        file << "thumbnail_budget_mb = " << settings.cache.thumbnail_budget_mb << "\n\n";

        file << "[logging]\n";
        file << "level = \"" << settings.logging.level << "\"\n";
        file << "console = " << bool_str(settings.logging.console) << "\n";
        if (!settings.logging.file.empty()) {
            file << "file = \"" << settings.logging.file.string() << "\"\n";
        }
#endif

        if (!file) {
            return std::unexpected(ConfigError::IoError);
        }
        return {};
    } catch (const std::exception& e) {
        LOG_WARN("Cannot save settings to {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::IoError);
    }
}

ValidationResult SettingsManager::validate(const Settings& settings) {
    ValidationResult result;

    if (settings.thumbnails.width < 16 || settings.thumbnails.width > 2048 ||
        settings.thumbnails.height < 16 || settings.thumbnails.height > 2048) {
        result.errors.push_back("thumbnails.width and thumbnails.height must be between 16 and 2048");
        result.valid = false;
    }

    if (settings.loader.io_slots < 1 || settings.loader.io_slots > 64) {
        result.errors.push_back("loader.io_slots must be between 1 and 64");
        result.valid = false;
    }

    if (settings.loader.decode_workers < 1 || settings.loader.decode_workers > 256) {
        result.errors.push_back("loader.decode_workers must be between 1 and 256");
        result.valid = false;
    }

    if (settings.store.file_name.empty() ||
        settings.store.file_name.find('/') != std::string::npos) {
        result.errors.push_back("store.file_name must be a plain file name");
        result.valid = false;
    }

    if (settings.store.busy_timeout_ms < 0) {
        result.errors.push_back("store.busy_timeout_ms must not be negative");
        result.valid = false;
    }

    if (settings.store.max_attempts < 1 || settings.store.max_attempts > 20) {
        result.errors.push_back("store.max_attempts must be between 1 and 20");
        result.valid = false;
    }

    if (settings.store.backoff_base_ms < 0 || settings.store.backoff_base_ms > 10000) {
        result.errors.push_back("store.backoff_base_ms must be between 0 and 10000");
        result.valid = false;
    }

    if (settings.scan.chunk_size < 1) {
        result.errors.push_back("scan.chunk_size must be at least 1");
        result.valid = false;
    }

    if (settings.scan.prefetch_limit > 256) {
        result.errors.push_back("scan.prefetch_limit must not exceed 256");
        result.valid = false;
    }

    if (settings.pump.batch_size < 1) {
        result.errors.push_back("pump.batch_size must be at least 1");
        result.valid = false;
    }

    auto level = parse_log_level(settings.logging.level);
    if (level == spdlog::level::off && settings.logging.level != "off") {
        result.errors.push_back("logging.level is not a known level name");
        result.valid = false;
    }

    // Warnings
    if (settings.loader.decode_workers > 2 * hardwareThreads()) {
        result.warnings.push_back("decode_workers far above the core count slows decoding down");
    }

    if (settings.loader.isolation == IsolationMode::InProcess) {
        result.warnings.push_back("In-process decoding lets a decoder crash take the engine down");
    }

    return result;
}

}  // namespace lumen::config
