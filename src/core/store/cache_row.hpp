/// @file cache_row.hpp
/// @brief Rows of the thumbnail table
///
/// A row either carries only file metadata (written by a folder scan before
/// anything was decoded) or metadata plus the encoded thumbnail. Code that
/// interprets a row dispatches on the variant instead of testing for NULL.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "../fs/file_metadata.hpp"
#include "../image/decoder.hpp"

namespace lumen::store {

/// @brief Columns shared by both row kinds
struct RowMeta {
    std::string path;  // Normalized absolute path, '/' separated
    int64_t mtime_ms = 0;
    int64_t size = 0;
    std::optional<uint32_t> width;  // Source image dimensions, when known
    std::optional<uint32_t> height;
    uint32_t thumb_width = 0;  // Thumbnail box the row was made for
    uint32_t thumb_height = 0;
    double created_at = 0.0;  // Seconds since the Unix epoch

    [[nodiscard]] fs::FileStat stat() const noexcept { return fs::FileStat{mtime_ms, size}; }
};

/// @brief Row whose thumbnail column is NULL
struct MetaOnly {
    RowMeta meta;
};

/// @brief Row with thumbnail bytes
struct Populated {
    RowMeta meta;
    std::vector<uint8_t> thumbnail;  // PNG
};

using CacheRow = std::variant<MetaOnly, Populated>;

[[nodiscard]] inline const RowMeta& rowMeta(const CacheRow& row) noexcept {
    return std::visit([](const auto& r) -> const RowMeta& { return r.meta; }, row);
}

[[nodiscard]] inline bool isPopulated(const CacheRow& row) noexcept {
    return std::holds_alternative<Populated>(row);
}

/// @brief Whether a row still describes the file and the configured thumbnail box
///
/// A mismatch is not an error: the row is treated as a miss and replaced.
[[nodiscard]] inline bool isValidFor(const CacheRow& row, const fs::FileStat& stat,
                                     const image::TargetSize& thumb) noexcept {
    const RowMeta& meta = rowMeta(row);
    return meta.mtime_ms == stat.mtime_ms && meta.size == stat.size &&
           meta.thumb_width == thumb.width && meta.thumb_height == thumb.height;
}

/// @brief Values written for one file
struct CacheEntry {
    std::string path;
    fs::FileStat stat;
    std::optional<uint32_t> width;
    std::optional<uint32_t> height;
    uint32_t thumb_width = 0;
    uint32_t thumb_height = 0;
    std::vector<uint8_t> thumbnail;  // Empty for metadata-only rows
};

/// @brief Aggregate numbers about the table
struct StoreStats {
    uint64_t rows = 0;
    uint64_t populated = 0;
    uint64_t thumbnail_bytes = 0;
    std::optional<double> oldest_created_at;
    std::optional<double> newest_created_at;
};

}  // namespace lumen::store
