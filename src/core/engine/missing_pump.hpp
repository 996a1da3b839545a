/// @file missing_pump.hpp
/// @brief Timer-driven drain of paths that still need a thumbnail
///
/// A folder scan can report thousands of missing thumbnails at once. The pump
/// holds them in a FIFO and hands them to the decoder a few at a time, so the
/// loader queue never holds the whole folder.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <unordered_set>
#include <vector>

#include "../loader/cache_key.hpp"
#include "../util/serial_executor.hpp"

namespace lumen::engine {

/// @brief Upper bound for the number of paths queued ahead of the rest
inline constexpr size_t kMaxPrefetchLimit = 256;

struct PumpConfig {
    size_t batch_size = 8;
    std::chrono::milliseconds interval{0};
};

/// @brief Called for each drained path, on the owning executor
using PumpSubmit = std::function<void(const std::filesystem::path&)>;

/// @brief FIFO of paths with a seen-set, drained in batches by a timer
///
/// Every method must be called on the owning executor's thread; ticks run
/// there as well. A path is queued at most once until it is drained.
class MissingPump {
public:
    MissingPump(SerialExecutor& owner, PumpConfig config, PumpSubmit submit);

    MissingPump(const MissingPump&) = delete;
    MissingPump& operator=(const MissingPump&) = delete;

    /// @brief Append a path
    /// @return false if it is already queued
    bool enqueue(const std::filesystem::path& path);

    /// @return Number of paths appended
    size_t enqueue(const std::vector<std::filesystem::path>& paths);

    /// @brief Queue up to limit paths ahead of everything else, the rest at the back
    ///
    /// Paths already queued are moved. The limit is capped at kMaxPrefetchLimit.
    /// @return Number of paths placed at the head
    size_t enqueueFront(const std::vector<std::filesystem::path>& paths, size_t limit);

    /// @return Whether the path was queued
    bool remove(const std::filesystem::path& path);

    /// @brief Drop every queued path
    /// @return Number of paths dropped
    size_t clear();

    [[nodiscard]] size_t size() const noexcept { return queue_.size(); }
    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }
    [[nodiscard]] bool contains(const std::filesystem::path& path) const {
        return seen_.contains(path);
    }

    /// @brief True while a tick is scheduled
    [[nodiscard]] bool armed() const noexcept { return armed_; }

    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_; }
    [[nodiscard]] uint64_t drained() const noexcept { return drained_; }

private:
    void arm();
    void tick();

    SerialExecutor& owner_;
    PumpConfig config_;
    PumpSubmit submit_;

    std::deque<std::filesystem::path> queue_;
    std::unordered_set<std::filesystem::path, loader::PathHash> seen_;

    bool armed_ = false;
    uint64_t ticks_ = 0;
    uint64_t drained_ = 0;
};

}  // namespace lumen::engine
