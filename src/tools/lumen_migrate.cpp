/// @file lumen_migrate.cpp
/// @brief Command line tool that migrates thumbnail store files
///
///   lumen-migrate migrate <store-file>
///   lumen-migrate status <store-file>
///   lumen-migrate downgrade <store-file> <version>

#include <filesystem>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <fmt/format.h>

#include "../core/config/settings_manager.hpp"
#include "../core/util/logger.hpp"
#include "migrate_command.hpp"

int main(int argc, char** argv) {
    auto app = CLI::App{"Migrate lumen thumbnail store files", "lumen-migrate"};
    app.require_subcommand(1);

    auto store_file = std::filesystem::path{};
    auto target_version = 0;
    auto config_file = std::filesystem::path{};

    app.add_option("--config", config_file, "Settings file for the logging section");

    auto* migrate = app.add_subcommand("migrate", "Apply pending schema migrations");
    migrate->add_option("store-file", store_file, "Store file")->required();

    auto* status = app.add_subcommand("status", "Show the schema version and pending steps");
    status->add_option("store-file", store_file, "Store file")->required();

    auto* downgrade = app.add_subcommand("downgrade", "Step the schema down to a version");
    downgrade->add_option("store-file", store_file, "Store file")->required();
    downgrade->add_option("version", target_version, "Target version")->required();

    if (argc == 1) {
        fmt::print(stderr, "{}", app.help());
        return lumen::tools::kExitUsage;
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // Help requests exit with 0, everything else is a usage error
        return app.exit(e) == 0 ? lumen::tools::kExitOk : lumen::tools::kExitUsage;
    }

    // Only warnings reach the console unless a settings file asks for more
    auto logging = lumen::config::LoggingSettings{.level = "warn"};
    if (!config_file.empty()) {
        auto settings = lumen::config::SettingsManager::loadFrom(config_file);
        if (!settings) {
            fmt::print(stderr, "Cannot read {}: {}\n", config_file.string(),
                       lumen::config::to_string(settings.error()));
            return lumen::tools::kExitUsage;
        }
        logging = settings->logging;
    }
    lumen::config::SettingsManager::applyLogging(logging);

    int code = lumen::tools::kExitUsage;
    if (migrate->parsed()) {
        code = lumen::tools::runMigrate(store_file, std::cout, std::cerr);
    } else if (status->parsed()) {
        code = lumen::tools::runStatus(store_file, std::cout, std::cerr);
    } else if (downgrade->parsed()) {
        code = lumen::tools::runDowngrade(store_file, target_version, std::cout, std::cerr);
    }

    lumen::shutdown_logging();
    return code;
}
