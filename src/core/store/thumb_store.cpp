/// @file thumb_store.cpp
/// @brief ThumbStore implementation

#include "thumb_store.hpp"

#include <algorithm>
#include <system_error>

#include <fmt/format.h>

#include "../image/png_codec.hpp"
#include "../util/logger.hpp"
#include "../util/metrics.hpp"
#include "../util/string_utils.hpp"

namespace lumen::store {

namespace {

// Kept well below SQLite's host parameter limit
constexpr size_t kMaxInClause = 500;

constexpr std::string_view kSelectColumns =
    "SELECT path, thumbnail, width, height, mtime, size, thumb_width, thumb_height, created_at "
    "FROM thumbnails";

constexpr std::string_view kUpsertSql = R"sql(
    INSERT INTO thumbnails
        (path, thumbnail, width, height, mtime, size, thumb_width, thumb_height, created_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)
    ON CONFLICT(path) DO UPDATE SET
        thumbnail = excluded.thumbnail,
        width = excluded.width,
        height = excluded.height,
        mtime = excluded.mtime,
        size = excluded.size,
        thumb_width = excluded.thumb_width,
        thumb_height = excluded.thumb_height,
        created_at = excluded.created_at;
)sql";

[[nodiscard]] double now_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

[[nodiscard]] std::optional<int64_t> to_optional_int(std::optional<uint32_t> value) {
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int64_t>(*value);
}

[[nodiscard]] std::optional<uint32_t> to_optional_dimension(std::optional<int64_t> value) {
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

/// @brief Insert or replace one row; an empty thumbnail is written as NULL
StoreResult<void> upsert_row(SqliteConnection& connection, const CacheEntry& entry,
                             double created_at) {
    auto stmt = LUMEN_TRY(connection.prepare(kUpsertSql));
    stmt.bindText(1, entry.path);
    if (entry.thumbnail.empty()) {
        stmt.bindNull(2);
    } else {
        stmt.bindBlob(2, entry.thumbnail);
    }
    stmt.bindOptional(3, to_optional_int(entry.width))
        .bindOptional(4, to_optional_int(entry.height))
        .bindInt64(5, entry.stat.mtime_ms)
        .bindInt64(6, entry.stat.size)
        .bindInt64(7, entry.thumb_width)
        .bindInt64(8, entry.thumb_height)
        .bindDouble(9, created_at);
    return stmt.run();
}

[[nodiscard]] CacheRow read_row(const SqliteStatement& stmt) {
    RowMeta meta{
        .path = stmt.columnText(0),
        .mtime_ms = stmt.columnInt64(4),
        .size = stmt.columnInt64(5),
        .width = to_optional_dimension(stmt.columnOptionalInt64(2)),
        .height = to_optional_dimension(stmt.columnOptionalInt64(3)),
        .thumb_width = static_cast<uint32_t>(stmt.columnInt64(6)),
        .thumb_height = static_cast<uint32_t>(stmt.columnInt64(7)),
        .created_at = stmt.columnDouble(8),
    };

    if (stmt.columnIsNull(1)) {
        return MetaOnly{std::move(meta)};
    }
    auto bytes = stmt.columnBlob(1);
    if (bytes.empty()) {
        return MetaOnly{std::move(meta)};
    }
    return Populated{std::move(meta), std::move(bytes)};
}

StoreResult<std::vector<CacheRow>> select_rows(SqliteConnection& connection,
                                               const std::vector<std::string>& keys) {
    std::vector<CacheRow> rows;
    rows.reserve(keys.size());

    for (size_t offset = 0; offset < keys.size(); offset += kMaxInClause) {
        size_t count = std::min(kMaxInClause, keys.size() - offset);

        std::string sql = fmt::format("{} WHERE path IN (", kSelectColumns);
        for (size_t i = 0; i < count; ++i) {
            sql += i == 0 ? "?" : ",?";
        }
        sql += ");";

        auto stmt = LUMEN_TRY(connection.prepare(sql));
        for (size_t i = 0; i < count; ++i) {
            stmt.bindText(static_cast<int>(i + 1), keys[offset + i]);
        }
        while (LUMEN_TRY(stmt.step())) {
            rows.push_back(read_row(stmt));
        }
    }
    return rows;
}

[[nodiscard]] StoreWork<void> clear_thumbnail_work(std::string key) {
    return [key = std::move(key)](SqliteConnection& connection) -> StoreResult<void> {
        auto stmt =
            LUMEN_TRY(connection.prepare("UPDATE thumbnails SET thumbnail = NULL WHERE path = ?1;"));
        stmt.bindText(1, key);
        return stmt.run();
    };
}

[[nodiscard]] StoreWork<bool> remove_work(std::string key) {
    return [key = std::move(key)](SqliteConnection& connection) -> StoreResult<bool> {
        auto stmt = LUMEN_TRY(connection.prepare("DELETE FROM thumbnails WHERE path = ?1;"));
        stmt.bindText(1, key);
        LUMEN_TRY_VOID(stmt.run());
        return connection.changes() > 0;
    };
}

/// @brief One upsert per entry, thumbnails dropped, sharing a creation time
[[nodiscard]] std::vector<StoreWork<void>> meta_works(std::vector<CacheEntry> entries) {
    std::vector<StoreWork<void>> works;
    works.reserve(entries.size());
    double created_at = now_seconds();

    for (auto& entry : entries) {
        entry.path = normalizeStorePath(entry.path);
        entry.thumbnail.clear();
        works.push_back([entry = std::move(entry), created_at](SqliteConnection& connection) {
            return upsert_row(connection, entry, created_at);
        });
    }
    return works;
}

[[nodiscard]] bool ends_with_any_icase(std::string_view name,
                                       std::initializer_list<std::string_view> suffixes) {
    return std::any_of(suffixes.begin(), suffixes.end(),
                       [name](std::string_view suffix) { return endsWithIcase(name, suffix); });
}

}  // namespace

std::string normalizeStorePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    return absolute.lexically_normal().generic_string();
}

std::optional<std::filesystem::path> findStoreFile(const std::filesystem::path& folder,
                                                   std::string_view file_name) {
    std::error_code ec;
    std::filesystem::directory_iterator it(folder, ec);
    if (ec) {
        return std::nullopt;
    }

    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        if (equalsIcase(pathToUtf8(it->path().filename()), file_name) &&
            it->is_regular_file(ec)) {
            return it->path();
        }
    }
    return std::nullopt;
}

bool isStoreArtifact(const std::filesystem::path& path) {
    std::string name = pathToUtf8(path.filename());
    return ends_with_any_icase(name, {".db", ".db-wal", ".db-shm", ".db-journal"});
}

StoreResult<std::unique_ptr<ThumbStore>> ThumbStore::open(const std::filesystem::path& folder,
                                                          const ThumbStoreOptions& options) {
    std::error_code ec;
    if (!std::filesystem::is_directory(folder, ec)) {
        return std::unexpected(
            StoreError(StoreErrorCode::NotFound, fmt::format("not a folder: {}", folder.string())));
    }

    bool created = false;
    std::filesystem::path db_path;
    if (auto existing = findStoreFile(folder, options.file_name)) {
        db_path = *existing;
    } else {
        db_path = folder / options.file_name;
        created = true;
    }

    auto op = std::make_unique<StoreOperator>(StoreOperatorConfig{
        .db_path = db_path,
        .busy_timeout_ms = options.busy_timeout_ms,
        .max_attempts = options.max_attempts,
        .backoff_base = options.backoff_base,
    });

    auto migrated =
        op->scheduleSession<MigrationReport>([](SqliteConnection& connection) {
              return upgrade(connection);
          }).get();
    if (!migrated) {
        LOG_ERROR("Cannot open store {}: {}", db_path.string(), migrated.error().format());
        return std::unexpected(migrated.error());
    }

    if (migrated->changed()) {
        LOG_INFO("Store {} migrated v{} -> v{}", db_path.filename().string(),
                 migrated->from_version, migrated->to_version);
    }
    LOG_DEBUG("Store opened: {} (created={})", db_path.string(), created);

    return std::unique_ptr<ThumbStore>(
        new ThumbStore(std::move(db_path), created, std::move(op), std::move(*migrated)));
}

ThumbStore::ThumbStore(std::filesystem::path db_path, bool created,
                       std::unique_ptr<StoreOperator> op, MigrationReport migration)
    : db_path_(std::move(db_path)), created_(created), migration_(std::move(migration)),
      operator_(std::move(op)) {
}

ThumbStore::~ThumbStore() {
    shutdown();
}

void ThumbStore::shutdown() {
    operator_->shutdown();
}

std::future<StoreResult<void>> ThumbStore::upsertMeta(std::vector<CacheEntry> entries) {
    return operator_->scheduleWriteBatch(meta_works(std::move(entries)));
}

void ThumbStore::upsertMeta(std::vector<CacheEntry> entries, StoreCompletion<void> done) {
    operator_->scheduleWriteBatch(meta_works(std::move(entries)), std::move(done));
}

std::future<StoreResult<void>> ThumbStore::putThumbnail(CacheEntry entry) {
    entry.path = normalizeStorePath(entry.path);
    return operator_->scheduleWrite<void>(
        [entry = std::move(entry), created_at = now_seconds()](SqliteConnection& connection) {
            return upsert_row(connection, entry, created_at);
        });
}

void ThumbStore::putThumbnail(CacheEntry entry, StoreCompletion<void> done) {
    entry.path = normalizeStorePath(entry.path);
    operator_->scheduleWrite<void>(
        [entry = std::move(entry), created_at = now_seconds()](SqliteConnection& connection) {
            return upsert_row(connection, entry, created_at);
        },
        std::move(done));
}

std::future<StoreResult<void>> ThumbStore::clearThumbnail(const std::filesystem::path& path) {
    return operator_->scheduleWrite<void>(clear_thumbnail_work(normalizeStorePath(path)));
}

std::future<StoreResult<bool>> ThumbStore::remove(const std::filesystem::path& path) {
    return operator_->scheduleWrite<bool>(remove_work(normalizeStorePath(path)));
}

void ThumbStore::remove(const std::filesystem::path& path, StoreCompletion<bool> done) {
    operator_->scheduleWrite<bool>(remove_work(normalizeStorePath(path)), std::move(done));
}

std::future<StoreResult<uint64_t>> ThumbStore::clear() {
    return operator_->scheduleWrite<uint64_t>(
        [](SqliteConnection& connection) -> StoreResult<uint64_t> {
            LUMEN_TRY_VOID(connection.exec("DELETE FROM thumbnails;"));
            return static_cast<uint64_t>(connection.changes());
        });
}

std::future<StoreResult<uint64_t>> ThumbStore::removeOrphaned() {
    return operator_->scheduleWrite<uint64_t>(
        [](SqliteConnection& connection) -> StoreResult<uint64_t> {
            std::vector<std::string> orphans;
            {
                auto select = LUMEN_TRY(connection.prepare("SELECT path FROM thumbnails;"));
                while (LUMEN_TRY(select.step())) {
                    std::string key = select.columnText(0);
                    std::error_code ec;
                    if (!std::filesystem::exists(utf8ToPath(key), ec) && !ec) {
                        orphans.push_back(std::move(key));
                    }
                }
            }

            auto remove = LUMEN_TRY(connection.prepare("DELETE FROM thumbnails WHERE path = ?1;"));
            uint64_t count = 0;
            for (const auto& key : orphans) {
                remove.reset();
                remove.bindText(1, key);
                LUMEN_TRY_VOID(remove.run());
                count += static_cast<uint64_t>(connection.changes());
            }
            if (count > 0) {
                LOG_INFO("Removed {} orphaned store rows", count);
            }
            return count;
        });
}

std::future<StoreResult<uint64_t>> ThumbStore::removeOlderThan(std::chrono::seconds age) {
    double cutoff = now_seconds() - static_cast<double>(age.count());
    return operator_->scheduleWrite<uint64_t>(
        [cutoff](SqliteConnection& connection) -> StoreResult<uint64_t> {
            auto stmt =
                LUMEN_TRY(connection.prepare("DELETE FROM thumbnails WHERE created_at < ?1;"));
            stmt.bindDouble(1, cutoff);
            LUMEN_TRY_VOID(stmt.run());
            return static_cast<uint64_t>(connection.changes());
        });
}

std::future<StoreResult<void>> ThumbStore::vacuum() {
    // VACUUM cannot run inside a transaction
    return operator_->scheduleSession<void>(
        [](SqliteConnection& connection) { return connection.exec("VACUUM;"); });
}

std::future<StoreResult<StoreStats>> ThumbStore::stats() {
    return operator_->scheduleRead<StoreStats>(
        [](SqliteConnection& connection) -> StoreResult<StoreStats> {
            auto stmt = LUMEN_TRY(connection.prepare(
                "SELECT COUNT(*), COUNT(thumbnail), COALESCE(SUM(LENGTH(thumbnail)), 0), "
                "MIN(created_at), MAX(created_at) FROM thumbnails;"));

            StoreStats stats;
            if (LUMEN_TRY(stmt.step())) {
                stats.rows = static_cast<uint64_t>(stmt.columnInt64(0));
                stats.populated = static_cast<uint64_t>(stmt.columnInt64(1));
                stats.thumbnail_bytes = static_cast<uint64_t>(stmt.columnInt64(2));
                if (!stmt.columnIsNull(3)) {
                    stats.oldest_created_at = stmt.columnDouble(3);
                }
                if (!stmt.columnIsNull(4)) {
                    stats.newest_created_at = stmt.columnDouble(4);
                }
            }
            return stats;
        });
}

StoreResult<std::vector<CacheRow>>
ThumbStore::getRows(const std::vector<std::filesystem::path>& paths, ReadPolicy policy) {
    std::vector<std::string> keys;
    keys.reserve(paths.size());
    for (const auto& path : paths) {
        keys.push_back(normalizeStorePath(path));
    }

    StoreWork<std::vector<CacheRow>> work = [keys = std::move(keys)](SqliteConnection& connection) {
        return select_rows(connection, keys);
    };

    ScopedTimer timer(policy == ReadPolicy::DirectConnection ? "store.read.direct"
                                                             : "store.read.operator");
    if (policy == ReadPolicy::DirectConnection) {
        return operator_->readSync(work);
    }
    return operator_->scheduleRead(std::move(work)).get();
}

StoreResult<std::optional<CacheRow>> ThumbStore::lookup(const std::filesystem::path& path,
                                                        const fs::FileStat& stat,
                                                        const image::TargetSize& thumb,
                                                        ReadPolicy policy) {
    auto rows = LUMEN_TRY(getRows({path}, policy));
    if (rows.empty() || !isValidFor(rows.front(), stat, thumb)) {
        return std::optional<CacheRow>{};
    }
    return std::optional<CacheRow>(std::move(rows.front()));
}

void ThumbStore::readThumbnail(const std::filesystem::path& path, const fs::FileStat& stat,
                               const image::TargetSize& thumb, ThumbnailReadCallback done) {
    std::string key = normalizeStorePath(path);

    StoreWork<std::vector<CacheRow>> work = [key](SqliteConnection& connection) {
        return select_rows(connection, {key});
    };

    operator_->scheduleRead<std::vector<CacheRow>>(
        std::move(work),
        [this, path, stat, thumb, done = std::move(done)](StoreResult<std::vector<CacheRow>> rows) {
            if (!rows) {
                done(std::unexpected(rows.error()));
                return;
            }
            if (rows->empty() || !isValidFor(rows->front(), stat, thumb)) {
                done(std::optional<image::EncodedImage>{});
                return;
            }

            const auto* populated = std::get_if<Populated>(&rows->front());
            if (!populated) {
                done(std::optional<image::EncodedImage>{});
                return;
            }

            auto decoded = image::PngDecoder{}.decodeFromMemory(populated->thumbnail, {});
            if (!decoded) {
                LOG_WARN("Corrupt stored thumbnail for {} ({}), clearing", path.string(),
                         image::to_string(decoded.error()));
                metrics().increment("store.corrupt_blob");
                // Queued behind this read on the same thread
                operator_->scheduleWrite<void>(
                    clear_thumbnail_work(normalizeStorePath(path)), [path](StoreResult<void> cleared) {
                        if (!cleared) {
                            LOG_WARN("Clearing thumbnail of {} failed: {}", path.string(),
                                     cleared.error().format());
                        }
                    });
                done(std::optional<image::EncodedImage>{});
                return;
            }

            done(std::optional<image::EncodedImage>(image::EncodedImage{
                .bytes = populated->thumbnail,
                .width = decoded->width(),
                .height = decoded->height(),
                .source_width = populated->meta.width.value_or(0),
                .source_height = populated->meta.height.value_or(0),
            }));
        });
}

}  // namespace lumen::store
