/// @file thumb_store.hpp
/// @brief Query layer over the per-folder thumbnail store
///
/// Each browsed folder has one store file. All writes go through the store's
/// StoreOperator; reads either queue behind the writes or use a read-only
/// connection on the caller's thread, as the ReadPolicy says.

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../fs/file_metadata.hpp"
#include "../image/decoded_image.hpp"
#include "../image/decoder.hpp"
#include "cache_row.hpp"
#include "migrations.hpp"
#include "store_error.hpp"
#include "store_operator.hpp"

namespace lumen::store {

/// @brief Default store file name, matched case-insensitively
inline constexpr std::string_view kDefaultStoreFileName = "SwiftView_thumbs.db";

/// @brief How bulk reads reach the file
enum class ReadPolicy {
    ThroughOperator,   // Queued on the operator thread, ordered after pending writes
    DirectConnection,  // Read-only connection on the calling thread
};

[[nodiscard]] constexpr std::string_view to_string(ReadPolicy policy) noexcept {
    switch (policy) {
    case ReadPolicy::ThroughOperator:
        return "operator";
    case ReadPolicy::DirectConnection:
        return "direct";
    }
    return "unknown";
}

struct ThumbStoreOptions {
    std::string file_name = std::string(kDefaultStoreFileName);
    int busy_timeout_ms = 5000;
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{50};
};

/// @brief Key under which a file is stored: absolute, lexically normal, '/' separated
[[nodiscard]] std::string normalizeStorePath(const std::filesystem::path& path);

/// @brief Find an existing store file whose name matches ignoring case
[[nodiscard]] std::optional<std::filesystem::path>
findStoreFile(const std::filesystem::path& folder, std::string_view file_name);

/// @brief Whether a folder entry belongs to a store (database, WAL or shared-memory file)
[[nodiscard]] bool isStoreArtifact(const std::filesystem::path& path);

using ThumbnailReadCallback = std::function<void(StoreResult<std::optional<image::EncodedImage>>)>;

class ThumbStore {
public:
    /// @brief Open or create the store of a folder and bring its schema up to date
    [[nodiscard]] static StoreResult<std::unique_ptr<ThumbStore>>
    open(const std::filesystem::path& folder, const ThumbStoreOptions& options = {});

    /// @brief Drains pending writes
    ~ThumbStore();

    ThumbStore(const ThumbStore&) = delete;
    ThumbStore& operator=(const ThumbStore&) = delete;
    ThumbStore(ThumbStore&&) = delete;
    ThumbStore& operator=(ThumbStore&&) = delete;

    /// @brief True if open() created the file
    [[nodiscard]] bool created() const noexcept { return created_; }

    [[nodiscard]] const std::filesystem::path& dbPath() const noexcept { return db_path_; }
    [[nodiscard]] const MigrationReport& migration() const noexcept { return migration_; }

    // ===== Writes =====

    /// @brief Replace rows with metadata-only rows, all in one transaction
    [[nodiscard]] std::future<StoreResult<void>> upsertMeta(std::vector<CacheEntry> entries);
    void upsertMeta(std::vector<CacheEntry> entries, StoreCompletion<void> done);

    /// @brief Replace a row with a populated one
    [[nodiscard]] std::future<StoreResult<void>> putThumbnail(CacheEntry entry);
    void putThumbnail(CacheEntry entry, StoreCompletion<void> done);

    /// @brief Set a row's thumbnail to NULL, keeping its metadata
    [[nodiscard]] std::future<StoreResult<void>> clearThumbnail(const std::filesystem::path& path);

    /// @return Whether a row was deleted
    [[nodiscard]] std::future<StoreResult<bool>> remove(const std::filesystem::path& path);
    void remove(const std::filesystem::path& path, StoreCompletion<bool> done);

    /// @return Number of rows deleted
    [[nodiscard]] std::future<StoreResult<uint64_t>> clear();

    /// @brief Delete rows whose file no longer exists
    [[nodiscard]] std::future<StoreResult<uint64_t>> removeOrphaned();

    /// @brief Delete rows created more than age ago
    [[nodiscard]] std::future<StoreResult<uint64_t>> removeOlderThan(std::chrono::seconds age);

    [[nodiscard]] std::future<StoreResult<void>> vacuum();

    [[nodiscard]] std::future<StoreResult<StoreStats>> stats();

    // ===== Reads =====

    /// @brief Fetch the rows that exist for the given paths
    ///
    /// Blocks the caller. With ThroughOperator it must not be called from the
    /// operator thread.
    [[nodiscard]] StoreResult<std::vector<CacheRow>>
    getRows(const std::vector<std::filesystem::path>& paths, ReadPolicy policy);

    /// @brief Fetch one row if it is valid for the file and thumbnail box
    [[nodiscard]] StoreResult<std::optional<CacheRow>>
    lookup(const std::filesystem::path& path, const fs::FileStat& stat,
           const image::TargetSize& thumb, ReadPolicy policy);

    /// @brief Load a valid stored thumbnail
    ///
    /// Runs on the operator thread. A populated row whose bytes do not decode
    /// is cleared to metadata-only and reported as a miss.
    void readThumbnail(const std::filesystem::path& path, const fs::FileStat& stat,
                       const image::TargetSize& thumb, ThumbnailReadCallback done);

    [[nodiscard]] StoreOperator& storeOperator() noexcept { return *operator_; }

    /// @brief Finish queued work; later calls fail with ShutDown
    void shutdown();

private:
    ThumbStore(std::filesystem::path db_path, bool created, std::unique_ptr<StoreOperator> op,
               MigrationReport migration);

    std::filesystem::path db_path_;
    bool created_ = false;
    MigrationReport migration_;
    std::unique_ptr<StoreOperator> operator_;
};

}  // namespace lumen::store
