/// @file migrate_command.cpp
/// @brief lumen-migrate command implementations

#include "migrate_command.hpp"

#include <optional>
#include <ostream>
#include <system_error>

#include <fmt/format.h>

#include "../core/store/migrations.hpp"
#include "../core/store/sqlite_connection.hpp"
#include "../core/util/logger.hpp"

namespace lumen::tools {

namespace {

/// @brief Open an existing store file, reporting why it cannot be used
std::optional<store::SqliteConnection> open_existing(const std::filesystem::path& store_file,
                                                     store::OpenMode mode, std::ostream& err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(store_file, ec)) {
        err << fmt::format("Store file does not exist: {}\n", store_file.string());
        return std::nullopt;
    }

    auto connection = store::SqliteConnection::open(
        store_file, store::ConnectionOptions{.mode = mode, .wal = mode != store::OpenMode::ReadOnly});
    if (!connection) {
        err << fmt::format("Cannot open {}: {}\n", store_file.string(),
                           connection.error().format());
        return std::nullopt;
    }
    return std::move(*connection);
}

}  // namespace

int runMigrate(const std::filesystem::path& store_file, std::ostream& out, std::ostream& err) {
    auto connection = open_existing(store_file, store::OpenMode::ReadWrite, err);
    if (!connection) {
        return kExitFailure;
    }

    auto current = store::currentVersion(*connection);
    if (!current) {
        err << fmt::format("Cannot read user_version: {}\n", current.error().format());
        return kExitFailure;
    }
    out << fmt::format("Current user_version: {}\n", *current);

    auto report = store::upgrade(*connection);
    if (!report) {
        err << fmt::format("Migration failed: {}\n", report.error().format());
        return kExitFailure;
    }
    for (int version : report->applied) {
        out << fmt::format("Applied migration to v{}\n", version);
    }

    out << fmt::format("Migrated to user_version: {} (latest {})\n", report->to_version,
                       store::latestVersion());
    LOG_INFO("Migrated {} from v{} to v{}", store_file.string(), report->from_version,
             report->to_version);
    return kExitOk;
}

int runStatus(const std::filesystem::path& store_file, std::ostream& out, std::ostream& err) {
    auto connection = open_existing(store_file, store::OpenMode::ReadOnly, err);
    if (!connection) {
        return kExitFailure;
    }

    auto current = store::currentVersion(*connection);
    if (!current) {
        err << fmt::format("Cannot read user_version: {}\n", current.error().format());
        return kExitFailure;
    }
    out << fmt::format("Current user_version: {}\n", *current);
    out << fmt::format("Latest user_version: {}\n", store::latestVersion());

    auto pending = store::pendingSteps(*connection);
    if (!pending) {
        err << fmt::format("{}\n", pending.error().format());
        return kExitFailure;
    }
    out << fmt::format("Pending steps: {}\n", pending->size());
    for (const auto& step : *pending) {
        out << fmt::format("  v{} -> v{}: {}\n", step.from, step.to, step.description);
    }
    return kExitOk;
}

int runDowngrade(const std::filesystem::path& store_file, int target_version, std::ostream& out,
                 std::ostream& err) {
    if (target_version < 0 || target_version > store::latestVersion()) {
        err << fmt::format("Target version must be between 0 and {}\n", store::latestVersion());
        return kExitUsage;
    }

    auto connection = open_existing(store_file, store::OpenMode::ReadWrite, err);
    if (!connection) {
        return kExitFailure;
    }

    auto current = store::currentVersion(*connection);
    if (!current) {
        err << fmt::format("Cannot read user_version: {}\n", current.error().format());
        return kExitFailure;
    }
    out << fmt::format("Current user_version: {}\n", *current);

    auto report = store::downgrade(*connection, target_version);
    if (!report) {
        err << fmt::format("Downgrade failed: {}\n", report.error().format());
        return kExitFailure;
    }
    out << fmt::format("Downgraded to user_version: {}\n", report->to_version);
    return kExitOk;
}

}  // namespace lumen::tools
