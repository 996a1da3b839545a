/// @file settings.hpp
/// @brief Engine settings structure definitions

#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>

namespace lumen::config {

/// @brief Where decodes run
enum class IsolationMode {
    Process,    // One forked worker per decode
    InProcess,  // Decode on the pool thread
};

/// @brief Get string representation of IsolationMode
[[nodiscard]] constexpr std::string_view to_string(IsolationMode mode) noexcept {
    switch (mode) {
    case IsolationMode::Process:
        return "process";
    case IsolationMode::InProcess:
        return "in_process";
    }
    return "process";
}

/// @brief Parse IsolationMode from string
[[nodiscard]] constexpr IsolationMode isolationModeFromString(std::string_view str) noexcept {
    if (str == "in_process")
        return IsolationMode::InProcess;
    return IsolationMode::Process;
}

/// @brief How the folder scan reads existing rows
enum class ScanReadPolicy {
    Operator,  // Queued behind pending writes
    Direct,    // Read-only connection on the scanning thread
};

/// @brief Get string representation of ScanReadPolicy
[[nodiscard]] constexpr std::string_view to_string(ScanReadPolicy policy) noexcept {
    switch (policy) {
    case ScanReadPolicy::Operator:
        return "operator";
    case ScanReadPolicy::Direct:
        return "direct";
    }
    return "operator";
}

/// @brief Parse ScanReadPolicy from string
[[nodiscard]] constexpr ScanReadPolicy scanReadPolicyFromString(std::string_view str) noexcept {
    if (str == "direct")
        return ScanReadPolicy::Direct;
    return ScanReadPolicy::Operator;
}

[[nodiscard]] inline uint32_t hardwareThreads() noexcept {
    unsigned int n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

/// @brief Thumbnail box
struct ThumbnailSettings {
    uint32_t width = 256;
    uint32_t height = 195;
};

/// @brief Loader pools
struct LoaderSettings {
    uint32_t io_slots = std::max(2u, std::min(4u, hardwareThreads()));
    uint32_t decode_workers = hardwareThreads();
    IsolationMode isolation = IsolationMode::Process;
};

/// @brief Persistent store access
struct StoreSettings {
    std::string file_name = "SwiftView_thumbs.db";
    int busy_timeout_ms = 5000;
    int max_attempts = 3;
    int backoff_base_ms = 50;
};

/// @brief Folder scan
struct ScanSettings {
    uint32_t chunk_size = 800;
    ScanReadPolicy read_policy = ScanReadPolicy::Operator;
    uint32_t prefetch_limit = 48;  // Missing items queued ahead of the rest, at most 256
};

/// @brief Missing-item pump
struct PumpSettings {
    uint32_t batch_size = 8;
    uint32_t interval_ms = 0;
};

/// @brief Memory cache budgets, 0 = unbounded
struct CacheSettings {
    uint64_t view_budget_mb = 0;
    uint64_t thumbnail_budget_mb = 0;
};

struct LoggingSettings {
    std::string level = "info";
    std::filesystem::path file;  // Empty = console only
    bool console = true;
};

/// @brief Complete engine settings
struct Settings {
    ThumbnailSettings thumbnails;
    LoaderSettings loader;
    StoreSettings store;
    ScanSettings scan;
    PumpSettings pump;
    CacheSettings cache;
    LoggingSettings logging;

    /// @brief Create default settings
    [[nodiscard]] static Settings defaults() { return Settings{}; }
};

}  // namespace lumen::config
