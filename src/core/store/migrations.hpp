/// @file migrations.hpp
/// @brief Versioned schema migrations for the thumbnail store
///
/// The schema version lives in PRAGMA user_version. Each step runs in its own
/// transaction that also records the new version, so an interrupted upgrade
/// leaves the file at the last completed step.
///
///   v1  thumbnails(path, thumbnail, width, height, mtime, size)
///   v2  + thumb_width, thumb_height, created_at
///   v3  + indexes on mtime and created_at

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include "sqlite_connection.hpp"
#include "store_error.hpp"

namespace lumen::store {

/// @brief Name of the single table
inline constexpr std::string_view kThumbnailTable = "thumbnails";

struct MigrationStep {
    int from = 0;
    int to = 0;
    std::string_view description;
};

/// @brief Outcome of an upgrade or downgrade
struct MigrationReport {
    int from_version = 0;
    int to_version = 0;
    std::vector<int> applied;  // Versions reached, in order

    [[nodiscard]] bool changed() const noexcept { return from_version != to_version; }
};

/// @brief Newest schema version this build understands
[[nodiscard]] int latestVersion() noexcept;

/// @brief All upgrade steps, oldest first
[[nodiscard]] std::span<const MigrationStep> migrationSteps() noexcept;

[[nodiscard]] StoreResult<int> currentVersion(SqliteConnection& connection);

/// @brief Upgrade steps not yet applied
/// @return Steps, or a Schema error if the store is newer than this build
[[nodiscard]] StoreResult<std::vector<MigrationStep>> pendingSteps(SqliteConnection& connection);

/// @brief Apply all pending upgrade steps; a no-op at the latest version
[[nodiscard]] StoreResult<MigrationReport> upgrade(SqliteConnection& connection);

/// @brief Step the schema down to target_version
[[nodiscard]] StoreResult<MigrationReport> downgrade(SqliteConnection& connection,
                                                     int target_version);

/// @brief Check that the table has every column the current version requires
[[nodiscard]] StoreResult<void> verifySchema(SqliteConnection& connection);

}  // namespace lumen::store
