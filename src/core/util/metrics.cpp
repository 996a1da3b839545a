/// @file metrics.cpp
/// @brief Metrics registry implementation

#include "metrics.hpp"

#include <algorithm>

namespace lumen {

void Metrics::increment(std::string_view name, uint64_t delta) {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) {
        counters_.emplace(std::string(name), delta);
    } else {
        it->second += delta;
    }
}

void Metrics::record(std::string_view name, std::chrono::duration<double, std::milli> elapsed) {
    std::lock_guard lock(mutex_);
    auto it = timings_.find(name);
    if (it == timings_.end()) {
        it = timings_.emplace(std::string(name), TimingStats{}).first;
    }
    auto& stats = it->second;
    double ms = elapsed.count();
    ++stats.count;
    stats.total_ms += ms;
    stats.max_ms = std::max(stats.max_ms, ms);
}

uint64_t Metrics::counter(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = counters_.find(name);
    return it != counters_.end() ? it->second : 0;
}

MetricsSnapshot Metrics::snapshot() const {
    std::lock_guard lock(mutex_);
    return MetricsSnapshot{.counters = counters_, .timings = timings_};
}

void Metrics::reset() {
    std::lock_guard lock(mutex_);
    counters_.clear();
    timings_.clear();
}

Metrics& metrics() {
    static Metrics registry;
    return registry;
}

}  // namespace lumen
