/// @file metrics.hpp
/// @brief In-process counters and timings
///
/// Counters are keyed by dotted names such as "decode.ok" or "store.retry".
/// Nothing is exported; callers take a snapshot for logging or tests.

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace lumen {

/// @brief Aggregated duration samples for one timing name
struct TimingStats {
    uint64_t count = 0;
    double total_ms = 0.0;
    double max_ms = 0.0;

    [[nodiscard]] double meanMs() const noexcept {
        return count > 0 ? total_ms / static_cast<double>(count) : 0.0;
    }
};

struct MetricsSnapshot {
    std::map<std::string, uint64_t, std::less<>> counters;
    std::map<std::string, TimingStats, std::less<>> timings;

    [[nodiscard]] uint64_t counter(std::string_view name) const {
        auto it = counters.find(name);
        return it != counters.end() ? it->second : 0;
    }
};

class Metrics {
public:
    void increment(std::string_view name, uint64_t delta = 1);
    void record(std::string_view name, std::chrono::duration<double, std::milli> elapsed);

    [[nodiscard]] uint64_t counter(std::string_view name) const;
    [[nodiscard]] MetricsSnapshot snapshot() const;
    void reset();

private:
    mutable std::mutex mutex_;
    std::map<std::string, uint64_t, std::less<>> counters_;
    std::map<std::string, TimingStats, std::less<>> timings_;
};

/// @brief Process-wide metrics registry
[[nodiscard]] Metrics& metrics();

/// @brief Records the lifetime of the object under a timing name
class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, Metrics& sink = metrics())
        : name_(name), sink_(sink), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() { sink_.record(name_, std::chrono::steady_clock::now() - start_); }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    Metrics& sink_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace lumen
