/// @file loader.cpp
/// @brief Loader implementation

#include "loader.hpp"

#include <vector>

#include "../fs/file_metadata.hpp"
#include "../util/logger.hpp"
#include "../util/metrics.hpp"

namespace lumen::loader {

namespace {

[[nodiscard]] image::DecodeError fs_to_decode_error(fs::FsError error) noexcept {
    switch (error) {
    case fs::FsError::NotFound:
    case fs::FsError::NotADirectory:
        return image::DecodeError::FileNotFound;
    case fs::FsError::AccessDenied:
        return image::DecodeError::AccessDenied;
    case fs::FsError::IoError:
        return image::DecodeError::InternalError;
    }
    return image::DecodeError::InternalError;
}

[[nodiscard]] LoadOutcome superseded_outcome(RequestHandle handle, DecodeRequest request) {
    return LoadOutcome{.kind = OutcomeKind::Superseded,
                       .handle = handle,
                       .request = std::move(request),
                       .output = std::nullopt,
                       .error = std::nullopt};
}

}  // namespace

Loader::Loader(LoaderConfig config, std::shared_ptr<decode::DecodeExecutor> executor)
    : executor_(std::move(executor)),
      io_pool_(ThreadPoolConfig{.num_threads = config.io_slots, .name_prefix = "lumen-io"}),
      decode_pool_(
          ThreadPoolConfig{.num_threads = config.decode_workers, .name_prefix = "lumen-dec"}),
      strand_("lumen-loader") {
    LOG_INFO("Loader started: {} io slots, {} decode workers, executor={}",
             io_pool_.workerCount(), decode_pool_.workerCount(), executor_->name());
}

Loader::~Loader() {
    shutdown();
}

RequestHandle Loader::submit(CacheKey key, LoadCallback callback) {
    DecodeRequest request{.key = std::move(key),
                          .generation = next_generation_.fetch_add(1),
                          .submitted_at = std::chrono::steady_clock::now()};

    if (stopped_.load()) {
        stats_.superseded.fetch_add(1);
        deliver(callback, superseded_outcome(kInvalidHandle, std::move(request)));
        return kInvalidHandle;
    }

    RequestHandle handle = next_handle_.fetch_add(1);
    stats_.submitted.fetch_add(1);
    LOG_TRACE("Loader::submit: {} gen={} handle={}", describe(request.key), request.generation,
              handle);

    auto shared_callback = std::make_shared<LoadCallback>(std::move(callback));
    auto shared_request = std::make_shared<DecodeRequest>(std::move(request));
    bool posted = strand_.post([this, handle, shared_request, shared_callback] {
        admit(std::move(*shared_request), handle, std::move(*shared_callback));
    });
    if (!posted) {
        stats_.superseded.fetch_add(1);
        deliver(*shared_callback, superseded_outcome(handle, std::move(*shared_request)));
    }
    return handle;
}

void Loader::admit(DecodeRequest request, RequestHandle handle, LoadCallback callback) {
    Identity identity = request.key.identity();
    auto it = table_.find(identity);

    if (it != table_.end() && request.generation < it->second.request.generation) {
        // Posted late by a racing submitter; a newer request already owns the identity
        LOG_DEBUG("Loader: gen {} arrived after gen {} for {}", request.generation,
                  it->second.request.generation, describe(request.key));
        stats_.superseded.fetch_add(1);
        deliver(callback, superseded_outcome(handle, std::move(request)));
        return;
    }

    if (it == table_.end()) {
        JobId job = startJob(identity, request.key);
        handles_.emplace(handle, identity);
        table_.emplace(std::move(identity), Pending{.request = std::move(request),
                                                    .handle = handle,
                                                    .job = job,
                                                    .callback = std::move(callback)});
        return;
    }

    Pending& pending = it->second;
    bool adopt = pending.request.key == request.key;

    LoadCallback previous_callback = std::move(pending.callback);
    RequestHandle previous_handle = pending.handle;
    DecodeRequest previous_request = std::move(pending.request);
    handles_.erase(previous_handle);

    if (adopt) {
        stats_.coalesced.fetch_add(1);
        metrics().increment("loader.coalesced");
    } else {
        retireJob(pending.job);
        pending.job = startJob(identity, request.key);
    }

    pending.request = std::move(request);
    pending.handle = handle;
    pending.callback = std::move(callback);
    handles_.emplace(handle, identity);

    stats_.superseded.fetch_add(1);
    metrics().increment("loader.superseded");
    deliver(previous_callback, superseded_outcome(previous_handle, std::move(previous_request)));
}

Loader::JobId Loader::startJob(const Identity& identity, const CacheKey& key) {
    JobId job = next_job_.fetch_add(1);
    {
        std::lock_guard lock(live_mutex_);
        live_jobs_.insert(job);
    }
    io_pool_.post([this, identity, job, key] { runPreCheck(identity, job, key); });
    return job;
}

void Loader::runPreCheck(Identity identity, JobId job, CacheKey key) {
    if (!jobLive(job)) {
        return;
    }

    auto stat = fs::statFile(key.path);
    if (!stat) {
        auto result = std::make_shared<decode::DecodeResult>(
            std::unexpected(fs_to_decode_error(stat.error())));
        strand_.post([this, identity, job, result] { onJobFinished(identity, job, result); });
        return;
    }

    decode_pool_.post([this, identity = std::move(identity), job, key = std::move(key)] {
        runDecode(identity, job, key);
    });
}

void Loader::runDecode(Identity identity, JobId job, CacheKey key) {
    if (!jobLive(job)) {
        return;
    }

    std::shared_ptr<decode::DecodeResult> result;
    {
        ScopedTimer timer("decode.time");
        result = std::make_shared<decode::DecodeResult>(executor_->run(key.toJob()));
    }

    if (*result) {
        metrics().increment("decode.ok");
    } else {
        metrics().increment("decode.failed");
        LOG_DEBUG("Decode failed for {}: {}", describe(key), image::to_string(result->error()));
    }

    strand_.post([this, identity = std::move(identity), job, result] {
        onJobFinished(identity, job, result);
    });
}

void Loader::onJobFinished(const Identity& identity, JobId job,
                           std::shared_ptr<decode::DecodeResult> result) {
    auto it = table_.find(identity);
    if (it == table_.end() || it->second.job != job) {
        stats_.stale_dropped.fetch_add(1);
        metrics().increment("loader.stale_dropped");
        return;
    }

    Pending pending = std::move(it->second);
    erasePending(it);

    LoadOutcome outcome{.kind = OutcomeKind::Decoded,
                        .handle = pending.handle,
                        .request = std::move(pending.request),
                        .output = std::nullopt,
                        .error = std::nullopt};
    if (*result) {
        stats_.decoded.fetch_add(1);
        outcome.output = std::move(**result);
    } else {
        stats_.failed.fetch_add(1);
        outcome.kind = OutcomeKind::Failed;
        outcome.error = result->error();
    }
    deliver(pending.callback, std::move(outcome));
}

void Loader::supersede(Pending& pending) {
    retireJob(pending.job);
    stats_.superseded.fetch_add(1);
    metrics().increment("loader.superseded");
    deliver(pending.callback, superseded_outcome(pending.handle, std::move(pending.request)));
}

void Loader::erasePending(std::unordered_map<Identity, Pending, IdentityHash>::iterator it) {
    retireJob(it->second.job);
    handles_.erase(it->second.handle);
    table_.erase(it);
}

void Loader::cancel(RequestHandle handle) {
    strand_.post([this, handle] {
        auto handle_it = handles_.find(handle);
        if (handle_it == handles_.end()) {
            return;
        }
        auto it = table_.find(handle_it->second);
        if (it == table_.end()) {
            handles_.erase(handle_it);
            return;
        }
        Pending pending = std::move(it->second);
        erasePending(it);
        supersede(pending);
    });
}

void Loader::cancelAllFor(const std::filesystem::path& path) {
    strand_.post([this, path] {
        for (auto mode : {decode::DecodeMode::Thumbnail, decode::DecodeMode::Full}) {
            auto it = table_.find(Identity{path, mode});
            if (it == table_.end()) {
                continue;
            }
            Pending pending = std::move(it->second);
            erasePending(it);
            supersede(pending);
        }
    });
}

void Loader::cancelAll() {
    strand_.post([this] {
        std::vector<Pending> dropped;
        dropped.reserve(table_.size());
        for (auto& [identity, pending] : table_) {
            dropped.push_back(std::move(pending));
        }
        table_.clear();
        handles_.clear();
        LOG_DEBUG("Loader::cancelAll: dropping {} requests", dropped.size());
        for (auto& pending : dropped) {
            supersede(pending);
        }
    });
}

void Loader::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    LOG_DEBUG("Loader::shutdown");

    {
        std::lock_guard lock(live_mutex_);
        live_jobs_.clear();
    }

    // Running decodes finish and post their completions to the strand
    io_pool_.shutdown();
    decode_pool_.shutdown();

    cancelAll();
    strand_.shutdown();
}

bool Loader::jobLive(JobId job) const {
    std::lock_guard lock(live_mutex_);
    return live_jobs_.contains(job);
}

void Loader::retireJob(JobId job) {
    std::lock_guard lock(live_mutex_);
    live_jobs_.erase(job);
}

void Loader::deliver(LoadCallback& callback, LoadOutcome outcome) {
    if (!callback) {
        return;
    }
    try {
        callback(std::move(outcome));
    } catch (const std::exception& e) {
        LOG_ERROR("Loader callback threw: {}", e.what());
    }
}

}  // namespace lumen::loader
