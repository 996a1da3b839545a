/// @file memory_cache.hpp
/// @brief Process-local cache of ready-to-render results
///
/// Two tiers separated by purpose: decoded pixel buffers for viewing and
/// encoded thumbnails. Owned by the engine's serial context; no locking.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <variant>

#include "../image/decoded_image.hpp"
#include "../loader/cache_key.hpp"
#include "lru_cache.hpp"

namespace lumen::cache {

using ViewImage = std::shared_ptr<const image::DecodedImage>;
using ThumbnailImage = std::shared_ptr<const image::EncodedImage>;

/// @brief A cached value; ViewImage for Full keys, ThumbnailImage for Thumbnail keys
using CachedValue = std::variant<ViewImage, ThumbnailImage>;

struct MemoryCacheConfig {
    size_t view_budget_bytes = 0;       // 0 = unbounded
    size_t thumbnail_budget_bytes = 0;  // 0 = unbounded
};

struct TierStats {
    size_t entries = 0;
    size_t bytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

struct MemoryCacheStats {
    TierStats view;
    TierStats thumbnail;
};

class MemoryCache {
public:
    explicit MemoryCache(MemoryCacheConfig config = {});

    /// @brief Look up a key in the tier matching its mode
    [[nodiscard]] std::optional<CachedValue> get(const loader::CacheKey& key);

    /// @brief Store a value
    /// @return false if the value kind does not match the key's mode
    bool put(const loader::CacheKey& key, CachedValue value);

    [[nodiscard]] ViewImage getView(const loader::CacheKey& key);
    [[nodiscard]] ThumbnailImage getThumbnail(const loader::CacheKey& key);

    /// @brief Drop every entry for a path, all modes and sizes
    /// @return Number of entries removed
    size_t invalidate(const std::filesystem::path& path);

    void clear();

    [[nodiscard]] MemoryCacheStats stats() const;

private:
    using KeySet = std::unordered_set<loader::CacheKey, loader::CacheKeyHash>;

    void index(const loader::CacheKey& key);
    void unindex(const loader::CacheKey& key);

    LruCache<loader::CacheKey, ViewImage, loader::CacheKeyHash> view_;
    LruCache<loader::CacheKey, ThumbnailImage, loader::CacheKeyHash> thumbnails_;
    std::unordered_map<std::filesystem::path, KeySet, loader::PathHash> by_path_;

    TierStats view_counts_;
    TierStats thumbnail_counts_;
};

}  // namespace lumen::cache
