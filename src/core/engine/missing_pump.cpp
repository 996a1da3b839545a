/// @file missing_pump.cpp
/// @brief MissingPump implementation

#include "missing_pump.hpp"

#include <algorithm>

#include "../util/logger.hpp"

namespace lumen::engine {

MissingPump::MissingPump(SerialExecutor& owner, PumpConfig config, PumpSubmit submit)
    : owner_(owner), config_(config), submit_(std::move(submit)) {
    if (config_.batch_size == 0) {
        config_.batch_size = 1;
    }
}

bool MissingPump::enqueue(const std::filesystem::path& path) {
    if (!seen_.insert(path).second) {
        return false;
    }
    queue_.push_back(path);
    arm();
    return true;
}

size_t MissingPump::enqueue(const std::vector<std::filesystem::path>& paths) {
    size_t added = 0;
    for (const auto& path : paths) {
        if (enqueue(path)) {
            ++added;
        }
    }
    return added;
}

size_t MissingPump::enqueueFront(const std::vector<std::filesystem::path>& paths, size_t limit) {
    limit = std::min({limit, kMaxPrefetchLimit, paths.size()});

    // Inserted back to front so the head keeps the caller's order
    for (size_t i = limit; i-- > 0;) {
        const auto& path = paths[i];
        if (!seen_.insert(path).second) {
            queue_.erase(std::find(queue_.begin(), queue_.end(), path));
        }
        queue_.push_front(path);
    }
    for (size_t i = limit; i < paths.size(); ++i) {
        if (seen_.insert(paths[i]).second) {
            queue_.push_back(paths[i]);
        }
    }

    LOG_DEBUG("Pump: {} paths at the head, {} queued", limit, queue_.size());
    arm();
    return limit;
}

bool MissingPump::remove(const std::filesystem::path& path) {
    if (seen_.erase(path) == 0) {
        return false;
    }
    queue_.erase(std::find(queue_.begin(), queue_.end(), path));
    return true;
}

size_t MissingPump::clear() {
    size_t dropped = queue_.size();
    queue_.clear();
    seen_.clear();
    return dropped;
}

void MissingPump::arm() {
    if (armed_ || queue_.empty()) {
        return;
    }
    armed_ = owner_.postAfter(config_.interval, [this] { tick(); });
}

void MissingPump::tick() {
    armed_ = false;
    ++ticks_;

    for (size_t i = 0; i < config_.batch_size && !queue_.empty(); ++i) {
        std::filesystem::path path = std::move(queue_.front());
        queue_.pop_front();
        seen_.erase(path);
        ++drained_;

        try {
            submit_(path);
        } catch (const std::exception& e) {
            LOG_ERROR("Pump: submit failed for {}: {}", path.string(), e.what());
        }
    }

    arm();
}

}  // namespace lumen::engine
