/// @file loader.hpp
/// @brief Decode work dispatcher with request supersession
///
/// Requests are admitted on the loader's serial thread, which owns the
/// generation table. Admitted jobs go through the IO pool (file pre-checks)
/// to the decode pool, where the DecodeExecutor runs them. Completions are
/// posted back to the serial thread and delivered only if the job still
/// belongs to the newest request of its identity.

#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "../decode/decode_executor.hpp"
#include "../util/serial_executor.hpp"
#include "../util/thread_pool.hpp"
#include "cache_key.hpp"
#include "decode_request.hpp"

namespace lumen::loader {

struct LoaderConfig {
    size_t io_slots = 2;
    size_t decode_workers = 0;  // 0 = hardware_concurrency()
};

/// @brief Counters for loader activity
struct LoaderStats {
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> decoded{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> superseded{0};
    std::atomic<uint64_t> coalesced{0};
    std::atomic<uint64_t> stale_dropped{0};  // Completions of jobs nobody waits for
};

class Loader {
public:
    Loader(LoaderConfig config, std::shared_ptr<decode::DecodeExecutor> executor);

    /// @brief Shuts down; pending requests receive Superseded
    ~Loader();

    Loader(const Loader&) = delete;
    Loader& operator=(const Loader&) = delete;
    Loader(Loader&&) = delete;
    Loader& operator=(Loader&&) = delete;

    /// @brief Admit a request
    ///
    /// Any earlier request for the same (path, mode) receives Superseded.
    /// If the earlier request's job has exactly the same key, the new request
    /// adopts it instead of starting another decode.
    /// @return Handle for cancel(); after shutdown the callback receives
    ///         Superseded right away and kInvalidHandle is returned
    RequestHandle submit(CacheKey key, LoadCallback callback);

    /// @brief Drop one request; its subscriber receives Superseded
    void cancel(RequestHandle handle);

    /// @brief Drop all requests for a path, any mode and size
    void cancelAllFor(const std::filesystem::path& path);

    /// @brief Drop every pending request
    void cancelAll();

    /// @brief Finish running decodes, supersede the rest and stop all threads
    ///
    /// Must not be called from a LoadCallback.
    void shutdown();

    [[nodiscard]] const LoaderStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const decode::DecodeExecutor& executor() const noexcept { return *executor_; }

private:
    using JobId = uint64_t;

    /// @brief Newest admitted request of one identity
    struct Pending {
        DecodeRequest request;
        RequestHandle handle = kInvalidHandle;
        JobId job = 0;
        LoadCallback callback;
    };

    // Serial thread only
    void admit(DecodeRequest request, RequestHandle handle, LoadCallback callback);
    void onJobFinished(const Identity& identity, JobId job,
                       std::shared_ptr<decode::DecodeResult> result);
    void supersede(Pending& pending);
    void erasePending(std::unordered_map<Identity, Pending, IdentityHash>::iterator it);

    // Any thread
    [[nodiscard]] JobId startJob(const Identity& identity, const CacheKey& key);
    void runPreCheck(Identity identity, JobId job, CacheKey key);
    void runDecode(Identity identity, JobId job, CacheKey key);
    [[nodiscard]] bool jobLive(JobId job) const;
    void retireJob(JobId job);

    static void deliver(LoadCallback& callback, LoadOutcome outcome);

    std::shared_ptr<decode::DecodeExecutor> executor_;
    LoaderStats stats_;

    std::atomic<Generation> next_generation_{1};
    std::atomic<RequestHandle> next_handle_{1};
    std::atomic<JobId> next_job_{1};
    std::atomic<bool> stopped_{false};

    // Jobs whose result is still wanted; consulted by the pools to skip dead work
    mutable std::mutex live_mutex_;
    std::unordered_set<JobId> live_jobs_;

    // Owned by strand_
    std::unordered_map<Identity, Pending, IdentityHash> table_;
    std::unordered_map<RequestHandle, Identity> handles_;

    ThreadPool io_pool_;
    ThreadPool decode_pool_;

    // Last member: its thread must stop before the tables it touches go away
    SerialExecutor strand_;
};

}  // namespace lumen::loader
