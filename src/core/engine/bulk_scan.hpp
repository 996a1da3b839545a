/// @file bulk_scan.hpp
/// @brief Classify a folder's images against the rows already in its store

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

#include "../fs/file_metadata.hpp"
#include "../image/decoder.hpp"
#include "../store/cache_row.hpp"
#include "../store/store_error.hpp"
#include "../store/thumb_store.hpp"

namespace lumen::engine {

/// @brief What the store knows about one file
enum class ScanStatus {
    Valid,    // Populated row matching the file and thumbnail box
    Pending,  // Metadata-only row matching the file; thumbnail not made yet
    Missing,  // No row, or a row describing another version of the file
};

[[nodiscard]] constexpr std::string_view to_string(ScanStatus status) noexcept {
    switch (status) {
    case ScanStatus::Valid:
        return "valid";
    case ScanStatus::Pending:
        return "pending";
    case ScanStatus::Missing:
        return "missing";
    }
    return "unknown";
}

struct ScanItem {
    std::filesystem::path path;
    fs::FileStat stat;
    std::optional<store::CacheRow> row;  // Set for Valid and Pending
    ScanStatus status = ScanStatus::Missing;

    /// @brief Whether the file still needs a thumbnail decode
    [[nodiscard]] bool needsDecode() const noexcept { return status != ScanStatus::Valid; }
};

struct ScanProgress {
    size_t done = 0;
    size_t total = 0;
};

struct ScanSummary {
    uint64_t generation = 0;
    size_t total = 0;
    size_t valid = 0;
    size_t pending = 0;
    size_t missing = 0;
    size_t skipped = 0;  // Files that could not be stat'ed
    bool cancelled = false;
    std::optional<store::StoreError> error;  // First store failure; its chunk counts as missing
};

/// @brief Receivers for scan events, called on the scanning thread
///
/// Chunks arrive in input order. finished is always called last, once.
struct ScanSink {
    std::function<void(std::vector<ScanItem>)> chunk;
    std::function<void(ScanProgress)> progress;
    std::function<void(ScanSummary)> finished;
};

struct ScanOptions {
    size_t chunk_size = 800;
    store::ReadPolicy policy = store::ReadPolicy::ThroughOperator;
    image::TargetSize thumbnail{256, 195};
    uint64_t generation = 0;

    /// Polled between chunks; returning true stops the scan
    std::function<bool()> cancelled;
};

/// @brief Stat the paths chunk by chunk and look up their rows
///
/// Blocks the calling thread until the last chunk has been read. With
/// ReadPolicy::ThroughOperator it must not run on the store's operator thread.
/// @return The summary also passed to sink.finished
ScanSummary scanExisting(store::ThumbStore& store, const std::vector<std::filesystem::path>& paths,
                         const ScanOptions& options, const ScanSink& sink);

/// @brief Status of one file given the row found for it, if any
[[nodiscard]] ScanStatus classifyRow(const store::CacheRow* row, const fs::FileStat& stat,
                                     const image::TargetSize& thumbnail);

}  // namespace lumen::engine
