/// @file migrations.cpp
/// @brief Schema migration steps

#include "migrations.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <string>

#include <fmt/format.h>

#include "../util/logger.hpp"

namespace lumen::store {

namespace {

using StepFn = StoreResult<void> (*)(SqliteConnection&);

struct StepImpl {
    MigrationStep step;
    StepFn up;
    StepFn down;
};

[[nodiscard]] bool has_column(const std::vector<std::string>& columns, std::string_view name) {
    return std::find(columns.begin(), columns.end(), name) != columns.end();
}

[[nodiscard]] double now_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

// ----- v0 -> v1 -----

StoreResult<void> create_base_table(SqliteConnection& connection) {
    return connection.exec(R"sql(
        CREATE TABLE IF NOT EXISTS thumbnails (
            path TEXT PRIMARY KEY,
            thumbnail BLOB,
            width INTEGER,
            height INTEGER,
            mtime INTEGER,
            size INTEGER
        );
    )sql");
}

StoreResult<void> drop_base_table(SqliteConnection& connection) {
    return connection.exec("DROP TABLE IF EXISTS thumbnails;");
}

// ----- v1 -> v2 -----

StoreResult<void> add_thumb_columns(SqliteConnection& connection) {
    auto columns = LUMEN_TRY(connection.columns(kThumbnailTable));

    // Stores written by older builds may already carry some of the columns
    if (!has_column(columns, "thumb_width")) {
        LUMEN_TRY_VOID(connection.exec(
            "ALTER TABLE thumbnails ADD COLUMN thumb_width INTEGER NOT NULL DEFAULT 0;"));
    }
    if (!has_column(columns, "thumb_height")) {
        LUMEN_TRY_VOID(connection.exec(
            "ALTER TABLE thumbnails ADD COLUMN thumb_height INTEGER NOT NULL DEFAULT 0;"));
    }
    if (!has_column(columns, "created_at")) {
        LUMEN_TRY_VOID(connection.exec(
            "ALTER TABLE thumbnails ADD COLUMN created_at REAL NOT NULL DEFAULT 0;"));
    }

    auto backfill =
        LUMEN_TRY(connection.prepare("UPDATE thumbnails SET created_at = ?1 WHERE created_at = 0;"));
    backfill.bindDouble(1, now_seconds());
    return backfill.run();
}

StoreResult<void> remove_thumb_columns(SqliteConnection& connection) {
    LUMEN_TRY_VOID(connection.exec(R"sql(
        CREATE TABLE thumbnails__v1 (
            path TEXT PRIMARY KEY,
            thumbnail BLOB,
            width INTEGER,
            height INTEGER,
            mtime INTEGER,
            size INTEGER
        );
        INSERT INTO thumbnails__v1 (path, thumbnail, width, height, mtime, size)
            SELECT path, thumbnail, width, height, mtime, size FROM thumbnails;
        DROP TABLE thumbnails;
        ALTER TABLE thumbnails__v1 RENAME TO thumbnails;
    )sql"));
    return {};
}

// ----- v2 -> v3 -----

StoreResult<void> create_indexes(SqliteConnection& connection) {
    return connection.exec(R"sql(
        CREATE INDEX IF NOT EXISTS idx_mtime ON thumbnails(mtime);
        CREATE INDEX IF NOT EXISTS idx_created_at ON thumbnails(created_at);
    )sql");
}

StoreResult<void> drop_indexes(SqliteConnection& connection) {
    return connection.exec(R"sql(
        DROP INDEX IF EXISTS idx_mtime;
        DROP INDEX IF EXISTS idx_created_at;
    )sql");
}

constexpr std::array<StepImpl, 3> kSteps = {{
    {{0, 1, "create thumbnails table"}, create_base_table, drop_base_table},
    {{1, 2, "add thumb_width, thumb_height, created_at"}, add_thumb_columns, remove_thumb_columns},
    {{2, 3, "index mtime and created_at"}, create_indexes, drop_indexes},
}};

constexpr std::array<MigrationStep, 3> kPublicSteps = {
    kSteps[0].step,
    kSteps[1].step,
    kSteps[2].step,
};

/// @brief Run one step body and record the version in the same transaction
StoreResult<void> apply_step(SqliteConnection& connection, const MigrationStep& step, StepFn body,
                             int resulting_version) {
    auto fail = [&](const StoreError& cause) {
        connection.rollback();
        return StoreError(StoreErrorCode::Schema,
                          fmt::format("step {} -> {} ({}) failed: {}", step.from, step.to,
                                      step.description, cause.message()));
    };

    if (auto begun = connection.beginImmediate(); !begun) {
        // Lock contention is left for the caller to retry
        if (begun.error().code() == StoreErrorCode::Busy) {
            return std::unexpected(begun.error());
        }
        return std::unexpected(fail(begun.error()));
    }
    if (auto done = body(connection); !done) {
        return std::unexpected(fail(done.error()));
    }
    if (auto set = connection.setUserVersion(resulting_version); !set) {
        return std::unexpected(fail(set.error()));
    }
    if (auto committed = connection.commit(); !committed) {
        return std::unexpected(fail(committed.error()));
    }
    return {};
}

}  // namespace

int latestVersion() noexcept {
    return kSteps.back().step.to;
}

std::span<const MigrationStep> migrationSteps() noexcept {
    return kPublicSteps;
}

StoreResult<int> currentVersion(SqliteConnection& connection) {
    return connection.userVersion();
}

StoreResult<std::vector<MigrationStep>> pendingSteps(SqliteConnection& connection) {
    int version = LUMEN_TRY(connection.userVersion());
    if (version > latestVersion()) {
        return std::unexpected(StoreError(
            StoreErrorCode::Schema,
            fmt::format("store version {} is newer than supported {}", version, latestVersion())));
    }

    std::vector<MigrationStep> pending;
    for (const auto& impl : kSteps) {
        if (impl.step.from >= version) {
            pending.push_back(impl.step);
        }
    }
    return pending;
}

StoreResult<MigrationReport> upgrade(SqliteConnection& connection) {
    auto pending = LUMEN_TRY(pendingSteps(connection));

    MigrationReport report;
    report.from_version = LUMEN_TRY(connection.userVersion());
    report.to_version = report.from_version;

    for (const auto& step : pending) {
        const auto& impl = kSteps[static_cast<size_t>(step.from)];
        LOG_INFO("Migrating {} from v{} to v{}: {}", connection.path().filename().string(),
                 step.from, step.to, step.description);
        LUMEN_TRY_VOID(apply_step(connection, step, impl.up, step.to));
        report.to_version = step.to;
        report.applied.push_back(step.to);
    }

    if (report.changed()) {
        LUMEN_TRY_VOID(verifySchema(connection));
    }
    return report;
}

StoreResult<MigrationReport> downgrade(SqliteConnection& connection, int target_version) {
    int version = LUMEN_TRY(connection.userVersion());
    if (target_version < 0 || target_version > version) {
        return std::unexpected(StoreError(
            StoreErrorCode::Schema,
            fmt::format("cannot downgrade from v{} to v{}", version, target_version)));
    }
    if (version > latestVersion()) {
        return std::unexpected(StoreError(
            StoreErrorCode::Schema,
            fmt::format("store version {} is newer than supported {}", version, latestVersion())));
    }

    MigrationReport report{.from_version = version, .to_version = version, .applied = {}};
    while (report.to_version > target_version) {
        const auto& impl = kSteps[static_cast<size_t>(report.to_version - 1)];
        LOG_INFO("Downgrading {} from v{} to v{}", connection.path().filename().string(),
                 impl.step.to, impl.step.from);
        LUMEN_TRY_VOID(apply_step(connection, impl.step, impl.down, impl.step.from));
        report.to_version = impl.step.from;
        report.applied.push_back(impl.step.from);
    }
    return report;
}

StoreResult<void> verifySchema(SqliteConnection& connection) {
    int version = LUMEN_TRY(connection.userVersion());
    if (version == 0) {
        return {};
    }

    auto columns = LUMEN_TRY(connection.columns(kThumbnailTable));
    std::vector<std::string_view> required = {"path", "thumbnail", "width", "height", "mtime",
                                              "size"};
    if (version >= 2) {
        required.insert(required.end(), {"thumb_width", "thumb_height", "created_at"});
    }

    for (auto name : required) {
        if (!has_column(columns, name)) {
            return std::unexpected(StoreError(
                StoreErrorCode::Schema,
                fmt::format("column '{}' missing at schema v{}", name, version)));
        }
    }
    return {};
}

}  // namespace lumen::store
