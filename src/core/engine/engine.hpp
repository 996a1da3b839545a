/// @file engine.hpp
/// @brief Facade tying the loader, caches, store and pump together
///
/// Requests first consult the memory cache, then the folder's persistent store,
/// and only then the loader. Decoded thumbnails are written back to the store
/// and the memory cache. All bookkeeping lives on the engine's serial thread;
/// callbacks and events are invoked there. Paths are made absolute and
/// lexically normal on entry, so "a/./b.png" and "a/b.png" name one file.

#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../cache/memory_cache.hpp"
#include "../config/settings.hpp"
#include "../decode/decode_executor.hpp"
#include "../fs/directory.hpp"
#include "../loader/loader.hpp"
#include "../store/thumb_store.hpp"
#include "../util/serial_executor.hpp"
#include "../util/thread_pool.hpp"
#include "bulk_scan.hpp"
#include "missing_pump.hpp"

namespace lumen::engine {

enum class EngineErrorCode {
    Decode,     // decode holds the reason
    Cancelled,  // Invalidated or superseded before a result arrived
    ShutDown,
    NoStore,    // Operation needs an open folder
};

[[nodiscard]] constexpr std::string_view to_string(EngineErrorCode code) noexcept {
    switch (code) {
    case EngineErrorCode::Decode:
        return "Decode failed";
    case EngineErrorCode::Cancelled:
        return "Request cancelled";
    case EngineErrorCode::ShutDown:
        return "Engine shut down";
    case EngineErrorCode::NoStore:
        return "No folder open";
    }
    return "Unknown engine error";
}

struct EngineError {
    EngineErrorCode code = EngineErrorCode::Decode;
    std::optional<image::DecodeError> decode;

    [[nodiscard]] std::string format() const;
};

using ViewResult = std::expected<cache::ViewImage, EngineError>;
using ThumbnailResult = std::expected<cache::ThumbnailImage, EngineError>;

using ViewCallback = std::function<void(ViewResult)>;
using ThumbnailCallback = std::function<void(ThumbnailResult)>;

/// @brief Result of listing a folder, reported before any thumbnail work starts
struct FolderSnapshot {
    std::filesystem::path folder;
    std::vector<fs::DirectoryEntry> entries;
    bool store_created = false;
    std::optional<fs::FsError> list_error;
    std::optional<store::StoreError> store_error;  // Thumbnails still decode, unpersisted
};

/// @brief Optional observers, called on the engine thread
struct EngineEvents {
    std::function<void(const FolderSnapshot&)> folder_opened;
    std::function<void(const std::vector<ScanItem>&)> scan_chunk;
    std::function<void(ScanProgress)> scan_progress;
    std::function<void(const ScanSummary&)> scan_finished;

    /// Every thumbnail decoded this session, requested or pumped
    std::function<void(const std::filesystem::path&, const cache::ThumbnailImage&)>
        thumbnail_ready;
    std::function<void(const std::filesystem::path&, const EngineError&)> thumbnail_failed;
};

struct EngineOptions {
    config::Settings settings;

    /// Runs decodes; null selects one from settings.loader.isolation
    std::shared_ptr<decode::DecodeExecutor> executor;

    EngineEvents events;
};

class Engine {
public:
    explicit Engine(EngineOptions options);

    /// @brief Shuts down; outstanding callbacks receive ShutDown
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @brief Full resolution image of a file
    void requestView(const std::filesystem::path& path, ViewCallback callback);

    /// @brief Thumbnail of a file at the configured size
    ///
    /// A request for a thumbnail that is already being made joins it.
    void requestThumbnail(const std::filesystem::path& path, ThumbnailCallback callback);

    /// @brief Forget everything known about a file
    ///
    /// Drops memory cache entries, cancels outstanding requests and the
    /// pumped entry, and removes the store row if the file is gone.
    void invalidate(const std::filesystem::path& path);

    /// @brief List a folder, open its store and start generating missing thumbnails
    ///
    /// A new store gets metadata rows for every image and every image is
    /// pumped. An existing store is scanned first and only images without a
    /// valid thumbnail are pumped.
    void openFolder(const std::filesystem::path& folder);

    /// @brief Classify paths against the open store
    ///
    /// Events are delivered on the engine thread. Starting a scan (here or in
    /// openFolder) drops the events of any scan still running.
    void scanExisting(std::vector<std::filesystem::path> paths, ScanSink sink);

    /// @brief Stop all work
    ///
    /// Must not be called from a callback or event handler.
    void shutdown();

    [[nodiscard]] const loader::LoaderStats& loaderStats() const noexcept {
        return loader_.stats();
    }

    [[nodiscard]] std::future<cache::MemoryCacheStats> memoryStats();

    [[nodiscard]] image::TargetSize thumbnailSize() const noexcept { return thumbnail_size_; }

private:
    struct ThumbnailJob {
        uint64_t ticket = 0;
        fs::FileStat stat;
        std::vector<ThumbnailCallback> waiters;
    };

    struct ViewJob {
        uint64_t ticket = 0;
        std::vector<ViewCallback> waiters;
    };

    /// @brief Inputs a finished thumbnail was made from
    struct DoneStamp {
        fs::FileStat stat;
        image::TargetSize thumbnail;

        [[nodiscard]] bool operator==(const DoneStamp&) const = default;
    };

    // Engine thread only
    void startThumbnail(const std::filesystem::path& path, ThumbnailCallback callback);
    void pumpThumbnail(const std::filesystem::path& path);
    void readStoredThumbnail(const std::filesystem::path& path, uint64_t ticket,
                             const fs::FileStat& stat);
    void onStoredThumbnail(const std::filesystem::path& path, uint64_t ticket,
                           store::StoreResult<std::optional<image::EncodedImage>> result);
    void submitThumbnail(const std::filesystem::path& path, uint64_t ticket);
    void onThumbnailDecoded(const std::filesystem::path& path, uint64_t ticket,
                            loader::LoadOutcome outcome);
    void persistThumbnail(const std::filesystem::path& path, const fs::FileStat& requested,
                          const cache::ThumbnailImage& image);
    void startView(const std::filesystem::path& path, ViewCallback callback);
    void onViewDecoded(const std::filesystem::path& path, uint64_t ticket,
                       loader::LoadOutcome outcome);
    void doInvalidate(const std::filesystem::path& path);
    void doOpenFolder(const std::filesystem::path& folder);
    void startScan(std::vector<std::filesystem::path> paths, uint64_t generation, ScanSink sink);
    void onFolderScanChunk(std::vector<ScanItem> items);
    void onFolderScanFinished(const ScanSummary& summary);
    void failThumbnailJob(ThumbnailJob& job, const EngineError& error);
    void failViewJob(ViewJob& job, const EngineError& error);

    [[nodiscard]] loader::CacheKey thumbnailKey(const std::filesystem::path& path) const;
    [[nodiscard]] bool storeCovers(const std::filesystem::path& path) const;

    /// @brief True when this session already made the thumbnail for this stat
    [[nodiscard]] bool doneFor(const std::filesystem::path& path, const fs::FileStat& stat) const;

    /// @brief Wrap a sink so its events reach the engine thread while the scan is current
    [[nodiscard]] ScanSink engineSink(uint64_t generation, ScanSink target);

    config::Settings settings_;
    EngineEvents events_;
    image::TargetSize thumbnail_size_;

    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> scan_generation_{0};

    loader::Loader loader_;
    ThreadPool scan_pool_;

    // Owned by strand_
    cache::MemoryCache memory_;
    std::shared_ptr<store::ThumbStore> store_;
    std::unordered_map<std::filesystem::path, ThumbnailJob, loader::PathHash> thumbnail_jobs_;
    std::unordered_map<std::filesystem::path, ViewJob, loader::PathHash> view_jobs_;
    std::unordered_map<std::filesystem::path, DoneStamp, loader::PathHash> thumbnail_done_;
    std::vector<std::filesystem::path> scan_backlog_;
    std::unique_ptr<MissingPump> pump_;
    uint64_t next_ticket_ = 1;

    // Last member: its thread must stop before the state it touches goes away
    SerialExecutor strand_;
};

}  // namespace lumen::engine
