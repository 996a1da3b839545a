/// @file engine.cpp
/// @brief Engine implementation

#include "engine.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <fmt/format.h>

#include "../util/logger.hpp"
#include "../util/metrics.hpp"
#include "../util/string_utils.hpp"

namespace lumen::engine {

namespace {

constexpr size_t kBytesPerMegabyte = 1024 * 1024;

std::shared_ptr<decode::DecodeExecutor> make_executor(config::IsolationMode mode) {
    switch (mode) {
    case config::IsolationMode::InProcess:
        return std::make_shared<decode::InProcessDecodeExecutor>();
    case config::IsolationMode::Process:
        break;
    }
    return std::make_shared<decode::ProcessDecodeExecutor>();
}

loader::LoaderConfig loader_config(const config::Settings& settings) {
    return loader::LoaderConfig{.io_slots = settings.loader.io_slots,
                                .decode_workers = settings.loader.decode_workers};
}

cache::MemoryCacheConfig memory_config(const config::Settings& settings) {
    return cache::MemoryCacheConfig{
        .view_budget_bytes = static_cast<size_t>(settings.cache.view_budget_mb * kBytesPerMegabyte),
        .thumbnail_budget_bytes =
            static_cast<size_t>(settings.cache.thumbnail_budget_mb * kBytesPerMegabyte),
    };
}

store::ThumbStoreOptions store_options(const config::Settings& settings) {
    return store::ThumbStoreOptions{
        .file_name = settings.store.file_name,
        .busy_timeout_ms = settings.store.busy_timeout_ms,
        .max_attempts = settings.store.max_attempts,
        .backoff_base = std::chrono::milliseconds(settings.store.backoff_base_ms),
    };
}

store::ReadPolicy read_policy(config::ScanReadPolicy policy) {
    return policy == config::ScanReadPolicy::Direct ? store::ReadPolicy::DirectConnection
                                                    : store::ReadPolicy::ThroughOperator;
}

image::DecodeError fs_to_decode_error(fs::FsError error) {
    switch (error) {
    case fs::FsError::NotFound:
    case fs::FsError::NotADirectory:
        return image::DecodeError::FileNotFound;
    case fs::FsError::AccessDenied:
        return image::DecodeError::AccessDenied;
    case fs::FsError::IoError:
        break;
    }
    return image::DecodeError::InternalError;
}

EngineError decode_failure(image::DecodeError error) {
    return EngineError{.code = EngineErrorCode::Decode, .decode = error};
}

EngineError cancelled_or_shut_down(bool stopped) {
    return EngineError{.code = stopped ? EngineErrorCode::ShutDown : EngineErrorCode::Cancelled};
}

template <typename Callback, typename Result>
void invoke_callback(Callback& callback, Result result) {
    if (!callback) {
        return;
    }
    try {
        callback(std::move(result));
    } catch (const std::exception& e) {
        LOG_ERROR("Engine callback threw: {}", e.what());
    }
}

template <typename Handler, typename... Args>
void notify(const Handler& handler, Args&&... args) {
    if (!handler) {
        return;
    }
    try {
        handler(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_ERROR("Engine event handler threw: {}", e.what());
    }
}

void log_store_failure(std::string_view what, const std::filesystem::path& path,
                       const store::StoreResult<void>& result) {
    if (!result) {
        LOG_WARN("{} for {} failed: {}", what, pathToUtf8(path), result.error().format());
    }
}

/// Caches, jobs and the store all key on this form of a path
std::filesystem::path engine_path(const std::filesystem::path& path) {
    return std::filesystem::path(store::normalizeStorePath(path));
}

}  // namespace

std::string EngineError::format() const {
    if (decode) {
        return fmt::format("{}: {}", to_string(code), image::to_string(*decode));
    }
    return std::string(to_string(code));
}

Engine::Engine(EngineOptions options)
    : settings_(std::move(options.settings)),
      events_(std::move(options.events)),
      thumbnail_size_{settings_.thumbnails.width, settings_.thumbnails.height},
      loader_(loader_config(settings_), options.executor
                                            ? std::move(options.executor)
                                            : make_executor(settings_.loader.isolation)),
      scan_pool_(ThreadPoolConfig{.num_threads = 1, .name_prefix = "lumen-scan"}),
      memory_(memory_config(settings_)),
      strand_("lumen-engine") {
    pump_ = std::make_unique<MissingPump>(
        strand_,
        PumpConfig{.batch_size = settings_.pump.batch_size,
                   .interval = std::chrono::milliseconds(settings_.pump.interval_ms)},
        [this](const std::filesystem::path& path) { pumpThumbnail(path); });

    LOG_INFO("Engine started: thumbnails {}x{}, decoder {}, scan reads {}", thumbnail_size_.width,
             thumbnail_size_.height, loader_.executor().name(),
             config::to_string(settings_.scan.read_policy));
}

Engine::~Engine() {
    shutdown();
}

// ============================================================================
// Public API
// ============================================================================

void Engine::requestThumbnail(const std::filesystem::path& requested,
                              ThumbnailCallback callback) {
    auto path = engine_path(requested);
    if (stopped_ ||
        !strand_.post([this, path, callback] { startThumbnail(path, callback); })) {
        invoke_callback(callback, ThumbnailResult(std::unexpected(
                                      EngineError{.code = EngineErrorCode::ShutDown})));
    }
}

void Engine::requestView(const std::filesystem::path& requested, ViewCallback callback) {
    auto path = engine_path(requested);
    if (stopped_ || !strand_.post([this, path, callback] { startView(path, callback); })) {
        invoke_callback(callback,
                        ViewResult(std::unexpected(EngineError{.code = EngineErrorCode::ShutDown})));
    }
}

void Engine::invalidate(const std::filesystem::path& requested) {
    if (!stopped_) {
        strand_.post([this, path = engine_path(requested)] { doInvalidate(path); });
    }
}

void Engine::openFolder(const std::filesystem::path& folder) {
    if (!stopped_) {
        strand_.post([this, folder = engine_path(folder)] { doOpenFolder(folder); });
    }
}

void Engine::scanExisting(std::vector<std::filesystem::path> paths, ScanSink sink) {
    for (auto& path : paths) {
        path = engine_path(path);
    }
    auto shared_paths = std::make_shared<std::vector<std::filesystem::path>>(std::move(paths));
    bool posted = !stopped_ && strand_.post([this, shared_paths, sink] {
        if (!store_) {
            ScanSummary summary;
            summary.total = shared_paths->size();
            summary.error = store::StoreError(store::StoreErrorCode::NotFound, "no folder open");
            notify(sink.finished, summary);
            return;
        }
        uint64_t generation = ++scan_generation_;
        startScan(std::move(*shared_paths), generation, engineSink(generation, sink));
    });

    if (!posted) {
        ScanSummary summary;
        summary.total = shared_paths->size();
        summary.cancelled = true;
        summary.error = store::StoreError(store::StoreErrorCode::ShutDown);
        notify(sink.finished, summary);
    }
}

std::future<cache::MemoryCacheStats> Engine::memoryStats() {
    auto promise = std::make_shared<std::promise<cache::MemoryCacheStats>>();
    auto future = promise->get_future();
    if (!strand_.post([this, promise] { promise->set_value(memory_.stats()); })) {
        // The engine thread has stopped; nothing else touches the cache now
        promise->set_value(memory_.stats());
    }
    return future;
}

void Engine::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    LOG_DEBUG("Engine shutting down");

    ++scan_generation_;
    scan_pool_.shutdown();

    // Superseded outcomes of pending decodes are posted to the engine thread
    loader_.shutdown();

    std::promise<std::shared_ptr<store::ThumbStore>> store_promise;
    auto store_future = store_promise.get_future();
    if (strand_.post([this, &store_promise] {
            pump_->clear();
            store_promise.set_value(std::move(store_));
        })) {
        if (auto store = store_future.get()) {
            // Completions of queued reads still reach the engine thread
            store->shutdown();
        }
    }

    strand_.shutdown();

    // The engine thread is gone; what is left can be settled here
    const EngineError shut_down{.code = EngineErrorCode::ShutDown};
    for (auto& [path, job] : thumbnail_jobs_) {
        failThumbnailJob(job, shut_down);
    }
    thumbnail_jobs_.clear();
    for (auto& [path, job] : view_jobs_) {
        failViewJob(job, shut_down);
    }
    view_jobs_.clear();
    store_.reset();

    LOG_INFO("Engine stopped: {} decoded, {} failed, {} superseded", loader_.stats().decoded.load(),
             loader_.stats().failed.load(), loader_.stats().superseded.load());
}

// ============================================================================
// Thumbnails
// ============================================================================

loader::CacheKey Engine::thumbnailKey(const std::filesystem::path& path) const {
    return loader::CacheKey::thumbnail(path, thumbnail_size_.width, thumbnail_size_.height);
}

void Engine::startThumbnail(const std::filesystem::path& path, ThumbnailCallback callback) {
    if (auto hit = memory_.getThumbnail(thumbnailKey(path))) {
        metrics().increment("engine.thumbnail.memory_hit");
        invoke_callback(callback, ThumbnailResult(std::move(hit)));
        return;
    }

    if (auto it = thumbnail_jobs_.find(path); it != thumbnail_jobs_.end()) {
        metrics().increment("engine.thumbnail.joined");
        it->second.waiters.push_back(std::move(callback));
        return;
    }

    auto stat = fs::statFile(path);
    if (!stat) {
        invoke_callback(callback,
                        ThumbnailResult(std::unexpected(decode_failure(fs_to_decode_error(stat.error())))));
        return;
    }

    uint64_t ticket = next_ticket_++;
    ThumbnailJob& job = thumbnail_jobs_[path];
    job.ticket = ticket;
    job.stat = *stat;
    job.waiters.push_back(std::move(callback));

    if (store_ && storeCovers(path)) {
        readStoredThumbnail(path, ticket, *stat);
    } else {
        submitThumbnail(path, ticket);
    }
}

void Engine::pumpThumbnail(const std::filesystem::path& path) {
    if (thumbnail_jobs_.contains(path)) {
        return;
    }

    auto stat = fs::statFile(path);
    if (!stat) {
        LOG_DEBUG("Pump: {} is gone: {}", pathToUtf8(path), fs::to_string(stat.error()));
        return;
    }

    if (doneFor(path, *stat)) {
        metrics().increment("engine.thumbnail.already_done");
        return;
    }

    uint64_t ticket = next_ticket_++;
    ThumbnailJob& job = thumbnail_jobs_[path];
    job.ticket = ticket;
    job.stat = *stat;

    // The scan already found no usable row, so the store is not asked again
    submitThumbnail(path, ticket);
}

void Engine::readStoredThumbnail(const std::filesystem::path& path, uint64_t ticket,
                                 const fs::FileStat& stat) {
    store_->readThumbnail(
        path, stat, thumbnail_size_,
        [this, path, ticket](store::StoreResult<std::optional<image::EncodedImage>> result) {
            auto shared = std::make_shared<decltype(result)>(std::move(result));
            strand_.post([this, path, ticket, shared] {
                onStoredThumbnail(path, ticket, std::move(*shared));
            });
        });
}

void Engine::onStoredThumbnail(const std::filesystem::path& path, uint64_t ticket,
                               store::StoreResult<std::optional<image::EncodedImage>> result) {
    auto it = thumbnail_jobs_.find(path);
    if (it == thumbnail_jobs_.end() || it->second.ticket != ticket) {
        return;
    }

    if (!result) {
        LOG_WARN("Reading stored thumbnail of {} failed, decoding instead: {}", pathToUtf8(path),
                 result.error().format());
    } else if (*result) {
        metrics().increment("engine.thumbnail.store_hit");
        auto image = std::make_shared<const image::EncodedImage>(std::move(**result));
        memory_.put(thumbnailKey(path), cache::ThumbnailImage(image));
        thumbnail_done_.insert_or_assign(path, DoneStamp{it->second.stat, thumbnail_size_});

        ThumbnailJob job = std::move(it->second);
        thumbnail_jobs_.erase(it);
        for (auto& waiter : job.waiters) {
            invoke_callback(waiter, ThumbnailResult(image));
        }
        return;
    }

    submitThumbnail(path, ticket);
}

void Engine::submitThumbnail(const std::filesystem::path& path, uint64_t ticket) {
    loader_.submit(thumbnailKey(path), [this, path, ticket](loader::LoadOutcome outcome) {
        auto shared = std::make_shared<loader::LoadOutcome>(std::move(outcome));
        strand_.post([this, path, ticket, shared] {
            onThumbnailDecoded(path, ticket, std::move(*shared));
        });
    });
}

void Engine::onThumbnailDecoded(const std::filesystem::path& path, uint64_t ticket,
                                loader::LoadOutcome outcome) {
    auto it = thumbnail_jobs_.find(path);
    if (it == thumbnail_jobs_.end() || it->second.ticket != ticket) {
        return;
    }
    ThumbnailJob job = std::move(it->second);
    thumbnail_jobs_.erase(it);

    if (outcome.superseded()) {
        failThumbnailJob(job, cancelled_or_shut_down(stopped_));
        return;
    }

    if (!outcome.decoded()) {
        EngineError error = decode_failure(outcome.error.value_or(image::DecodeError::InternalError));
        LOG_DEBUG("Thumbnail of {} failed: {}", pathToUtf8(path), error.format());
        notify(events_.thumbnail_failed, path, error);
        failThumbnailJob(job, error);
        return;
    }

    auto* encoded = outcome.output ? std::get_if<image::EncodedImage>(&*outcome.output) : nullptr;
    if (!encoded) {
        LOG_ERROR("Thumbnail decode of {} produced pixels instead of encoded bytes",
                  pathToUtf8(path));
        failThumbnailJob(job, decode_failure(image::DecodeError::InternalError));
        return;
    }

    auto image = std::make_shared<const image::EncodedImage>(std::move(*encoded));
    memory_.put(thumbnailKey(path), cache::ThumbnailImage(image));
    persistThumbnail(path, job.stat, image);

    for (auto& waiter : job.waiters) {
        invoke_callback(waiter, ThumbnailResult(image));
    }
    notify(events_.thumbnail_ready, path, image);
}

void Engine::persistThumbnail(const std::filesystem::path& path, const fs::FileStat& requested,
                              const cache::ThumbnailImage& image) {
    auto current = fs::statFile(path);
    if (!current || *current != requested) {
        metrics().increment("engine.thumbnail.stale_skipped");
        LOG_DEBUG("{} changed while decoding, thumbnail not stored", pathToUtf8(path));
        return;
    }

    thumbnail_done_.insert_or_assign(path, DoneStamp{requested, thumbnail_size_});
    if (!store_ || !storeCovers(path)) {
        return;
    }

    store::CacheEntry entry{
        .path = pathToUtf8(path),
        .stat = requested,
        .width = image->source_width > 0 ? std::optional<uint32_t>(image->source_width)
                                         : std::nullopt,
        .height = image->source_height > 0 ? std::optional<uint32_t>(image->source_height)
                                           : std::nullopt,
        .thumb_width = thumbnail_size_.width,
        .thumb_height = thumbnail_size_.height,
        .thumbnail = image->bytes,
    };
    store_->putThumbnail(std::move(entry), [path](store::StoreResult<void> result) {
        log_store_failure("Storing thumbnail", path, result);
    });
}

void Engine::failThumbnailJob(ThumbnailJob& job, const EngineError& error) {
    for (auto& waiter : job.waiters) {
        invoke_callback(waiter, ThumbnailResult(std::unexpected(error)));
    }
    job.waiters.clear();
}

bool Engine::storeCovers(const std::filesystem::path& path) const {
    return store::normalizeStorePath(path.parent_path()) ==
           store::normalizeStorePath(store_->dbPath().parent_path());
}

bool Engine::doneFor(const std::filesystem::path& path, const fs::FileStat& stat) const {
    auto done = thumbnail_done_.find(path);
    return done != thumbnail_done_.end() && done->second == DoneStamp{stat, thumbnail_size_};
}

// ============================================================================
// Views
// ============================================================================

void Engine::startView(const std::filesystem::path& path, ViewCallback callback) {
    auto key = loader::CacheKey::full(path);
    if (auto hit = memory_.getView(key)) {
        metrics().increment("engine.view.memory_hit");
        invoke_callback(callback, ViewResult(std::move(hit)));
        return;
    }

    if (auto it = view_jobs_.find(path); it != view_jobs_.end()) {
        it->second.waiters.push_back(std::move(callback));
        return;
    }

    uint64_t ticket = next_ticket_++;
    ViewJob& job = view_jobs_[path];
    job.ticket = ticket;
    job.waiters.push_back(std::move(callback));

    loader_.submit(std::move(key), [this, path, ticket](loader::LoadOutcome outcome) {
        auto shared = std::make_shared<loader::LoadOutcome>(std::move(outcome));
        strand_.post(
            [this, path, ticket, shared] { onViewDecoded(path, ticket, std::move(*shared)); });
    });
}

void Engine::onViewDecoded(const std::filesystem::path& path, uint64_t ticket,
                           loader::LoadOutcome outcome) {
    auto it = view_jobs_.find(path);
    if (it == view_jobs_.end() || it->second.ticket != ticket) {
        return;
    }
    ViewJob job = std::move(it->second);
    view_jobs_.erase(it);

    if (outcome.superseded()) {
        failViewJob(job, cancelled_or_shut_down(stopped_));
        return;
    }
    if (!outcome.decoded()) {
        failViewJob(job, decode_failure(outcome.error.value_or(image::DecodeError::InternalError)));
        return;
    }

    auto* pixels = outcome.output ? std::get_if<image::DecodedImage>(&*outcome.output) : nullptr;
    if (!pixels) {
        failViewJob(job, decode_failure(image::DecodeError::InternalError));
        return;
    }

    auto image = std::make_shared<const image::DecodedImage>(std::move(*pixels));
    memory_.put(loader::CacheKey::full(path), cache::ViewImage(image));
    for (auto& waiter : job.waiters) {
        invoke_callback(waiter, ViewResult(image));
    }
}

void Engine::failViewJob(ViewJob& job, const EngineError& error) {
    for (auto& waiter : job.waiters) {
        invoke_callback(waiter, ViewResult(std::unexpected(error)));
    }
    job.waiters.clear();
}

// ============================================================================
// Invalidation
// ============================================================================

void Engine::doInvalidate(const std::filesystem::path& path) {
    size_t dropped = memory_.invalidate(path);
    loader_.cancelAllFor(path);
    pump_->remove(path);
    thumbnail_done_.erase(path);

    const EngineError cancelled{.code = EngineErrorCode::Cancelled};
    if (auto it = thumbnail_jobs_.find(path); it != thumbnail_jobs_.end()) {
        failThumbnailJob(it->second, cancelled);
        thumbnail_jobs_.erase(it);
    }
    if (auto it = view_jobs_.find(path); it != view_jobs_.end()) {
        failViewJob(it->second, cancelled);
        view_jobs_.erase(it);
    }

    LOG_DEBUG("Invalidated {} ({} cached entries)", pathToUtf8(path), dropped);

    if (!store_ || !storeCovers(path)) {
        return;
    }
    auto stat = fs::statFile(path);
    if (!stat && stat.error() == fs::FsError::NotFound) {
        store_->remove(path, [path](store::StoreResult<bool> removed) {
            if (!removed) {
                LOG_WARN("Removing row of {} failed: {}", pathToUtf8(path),
                         removed.error().format());
            }
        });
    }
}

// ============================================================================
// Folders
// ============================================================================

void Engine::doOpenFolder(const std::filesystem::path& folder) {
    uint64_t generation = ++scan_generation_;
    pump_->clear();
    scan_backlog_.clear();
    thumbnail_done_.clear();

    FolderSnapshot snapshot{.folder = folder};

    fs::DirectoryFilter filter{
        .include_hidden = false,
        .images_only = true,
        .exclude = [](const std::filesystem::path& path) { return store::isStoreArtifact(path); },
    };
    auto entries = fs::scanDirectory(folder, filter);
    if (!entries) {
        LOG_WARN("Cannot list {}: {}", pathToUtf8(folder), fs::to_string(entries.error()));
        snapshot.list_error = entries.error();
        notify(events_.folder_opened, snapshot);
        return;
    }
    snapshot.entries = std::move(*entries);

    std::vector<std::filesystem::path> paths;
    paths.reserve(snapshot.entries.size());
    for (const auto& entry : snapshot.entries) {
        paths.push_back(entry.path);
    }

    // The previous folder's store drains its queued writes here
    store_.reset();
    auto opened = store::ThumbStore::open(folder, store_options(settings_));
    if (!opened) {
        LOG_ERROR("Cannot open thumbnail store in {}: {}", pathToUtf8(folder),
                  opened.error().format());
        snapshot.store_error = opened.error();
        notify(events_.folder_opened, snapshot);
        pump_->enqueue(paths);
        return;
    }
    store_ = std::shared_ptr<store::ThumbStore>(std::move(*opened));
    snapshot.store_created = store_->created();

    LOG_INFO("Opened {}: {} images, store {}", pathToUtf8(folder), snapshot.entries.size(),
             snapshot.store_created ? "created" : "existing");
    notify(events_.folder_opened, snapshot);

    if (snapshot.store_created) {
        // Nothing to look up: every image gets a metadata row and a decode
        std::vector<store::CacheEntry> rows;
        rows.reserve(snapshot.entries.size());
        for (const auto& entry : snapshot.entries) {
            rows.push_back(store::CacheEntry{.path = pathToUtf8(entry.path),
                                             .stat = entry.stat,
                                             .thumb_width = thumbnail_size_.width,
                                             .thumb_height = thumbnail_size_.height});
        }
        store_->upsertMeta(std::move(rows), [folder](store::StoreResult<void> result) {
            log_store_failure("Writing metadata rows", folder, result);
        });
        pump_->enqueue(paths);
        return;
    }

    ScanSink internal{
        .chunk = [this](std::vector<ScanItem> items) { onFolderScanChunk(std::move(items)); },
        .progress = [this](ScanProgress progress) { notify(events_.scan_progress, progress); },
        .finished = [this](ScanSummary summary) { onFolderScanFinished(summary); },
    };
    startScan(std::move(paths), generation, engineSink(generation, std::move(internal)));
}

void Engine::startScan(std::vector<std::filesystem::path> paths, uint64_t generation,
                       ScanSink sink) {
    ScanOptions options{
        .chunk_size = settings_.scan.chunk_size,
        .policy = read_policy(settings_.scan.read_policy),
        .thumbnail = thumbnail_size_,
        .generation = generation,
        .cancelled = [this, generation] {
            return stopped_.load() || scan_generation_.load() != generation;
        },
    };

    // Qualified: the member scanExisting hides the free function here
    scan_pool_.post([store = store_, paths = std::move(paths), options = std::move(options),
                     sink = std::move(sink)] {
        engine::scanExisting(*store, paths, options, sink);
    });
}

ScanSink Engine::engineSink(uint64_t generation, ScanSink target) {
    auto shared = std::make_shared<const ScanSink>(std::move(target));
    auto current = [this, generation] { return scan_generation_.load() == generation; };

    return ScanSink{
        .chunk =
            [this, shared, current](std::vector<ScanItem> items) {
                auto moved = std::make_shared<std::vector<ScanItem>>(std::move(items));
                strand_.post([shared, current, moved] {
                    if (current()) {
                        notify(shared->chunk, std::move(*moved));
                    }
                });
            },
        .progress =
            [this, shared, current](ScanProgress progress) {
                strand_.post([shared, current, progress] {
                    if (current()) {
                        notify(shared->progress, progress);
                    }
                });
            },
        .finished =
            [this, shared, current](ScanSummary summary) {
                strand_.post([shared, current, summary] {
                    if (current()) {
                        notify(shared->finished, summary);
                    }
                });
            },
    };
}

void Engine::onFolderScanChunk(std::vector<ScanItem> items) {
    std::vector<store::CacheEntry> stale;
    for (const auto& item : items) {
        switch (item.status) {
        case ScanStatus::Valid:
            thumbnail_done_.insert_or_assign(item.path, DoneStamp{item.stat, thumbnail_size_});
            break;
        case ScanStatus::Missing:
            // A request made since the scan read the row owns this path now
            if (thumbnail_jobs_.contains(item.path) || doneFor(item.path, item.stat)) {
                metrics().increment("engine.scan.missing_already_handled");
                break;
            }
            stale.push_back(store::CacheEntry{.path = pathToUtf8(item.path),
                                              .stat = item.stat,
                                              .thumb_width = thumbnail_size_.width,
                                              .thumb_height = thumbnail_size_.height});
            scan_backlog_.push_back(item.path);
            break;
        case ScanStatus::Pending:
            scan_backlog_.push_back(item.path);
            break;
        }
    }

    if (!stale.empty() && store_) {
        store_->upsertMeta(std::move(stale), [](store::StoreResult<void> result) {
            if (!result) {
                LOG_WARN("Writing metadata rows failed: {}", result.error().format());
            }
        });
    }
    notify(events_.scan_chunk, items);
}

void Engine::onFolderScanFinished(const ScanSummary& summary) {
    size_t limit = std::min<size_t>(settings_.scan.prefetch_limit, kMaxPrefetchLimit);
    size_t ahead = pump_->enqueueFront(scan_backlog_, limit);
    LOG_DEBUG("Scan {} done: {} to decode, {} first", summary.generation, scan_backlog_.size(),
              ahead);
    scan_backlog_.clear();
    notify(events_.scan_finished, summary);
}

}  // namespace lumen::engine
