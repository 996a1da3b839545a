/// @file memory_cache.cpp
/// @brief Memory cache implementation

#include "memory_cache.hpp"

#include "../util/logger.hpp"

namespace lumen::cache {

namespace {

[[nodiscard]] size_t weigh_view(const ViewImage& image) {
    return image ? image->sizeBytes() : 0;
}

[[nodiscard]] size_t weigh_thumbnail(const ThumbnailImage& image) {
    return image ? image->bytes.size() : 0;
}

}  // namespace

MemoryCache::MemoryCache(MemoryCacheConfig config)
    : view_(config.view_budget_bytes, weigh_view),
      thumbnails_(config.thumbnail_budget_bytes, weigh_thumbnail) {
}

std::optional<CachedValue> MemoryCache::get(const loader::CacheKey& key) {
    if (key.mode == decode::DecodeMode::Full) {
        if (auto view = getView(key)) {
            return CachedValue(std::move(view));
        }
        return std::nullopt;
    }
    if (auto thumbnail = getThumbnail(key)) {
        return CachedValue(std::move(thumbnail));
    }
    return std::nullopt;
}

ViewImage MemoryCache::getView(const loader::CacheKey& key) {
    if (key.mode != decode::DecodeMode::Full) {
        return nullptr;
    }
    auto value = view_.get(key);
    if (!value) {
        ++view_counts_.misses;
        return nullptr;
    }
    ++view_counts_.hits;
    return *value;
}

ThumbnailImage MemoryCache::getThumbnail(const loader::CacheKey& key) {
    if (key.mode != decode::DecodeMode::Thumbnail) {
        return nullptr;
    }
    auto value = thumbnails_.get(key);
    if (!value) {
        ++thumbnail_counts_.misses;
        return nullptr;
    }
    ++thumbnail_counts_.hits;
    return *value;
}

bool MemoryCache::put(const loader::CacheKey& key, CachedValue value) {
    std::vector<loader::CacheKey> evicted;

    if (key.mode == decode::DecodeMode::Full) {
        auto* view = std::get_if<ViewImage>(&value);
        if (!view || !*view) {
            LOG_WARN("MemoryCache::put: no pixel buffer for {}", loader::describe(key));
            return false;
        }
        evicted = view_.put(key, std::move(*view));
    } else {
        auto* thumbnail = std::get_if<ThumbnailImage>(&value);
        if (!thumbnail || !*thumbnail) {
            LOG_WARN("MemoryCache::put: no thumbnail for {}", loader::describe(key));
            return false;
        }
        evicted = thumbnails_.put(key, std::move(*thumbnail));
    }

    index(key);
    for (const auto& old : evicted) {
        unindex(old);
    }
    if (!evicted.empty()) {
        LOG_TRACE("MemoryCache: evicted {} entries", evicted.size());
    }
    return true;
}

size_t MemoryCache::invalidate(const std::filesystem::path& path) {
    auto it = by_path_.find(path);
    if (it == by_path_.end()) {
        return 0;
    }

    size_t removed = 0;
    for (const auto& key : it->second) {
        bool erased = key.mode == decode::DecodeMode::Full ? view_.remove(key)
                                                           : thumbnails_.remove(key);
        if (erased) {
            ++removed;
        }
    }
    by_path_.erase(it);
    return removed;
}

void MemoryCache::clear() {
    view_.clear();
    thumbnails_.clear();
    by_path_.clear();
}

MemoryCacheStats MemoryCache::stats() const {
    MemoryCacheStats result{view_counts_, thumbnail_counts_};
    result.view.entries = view_.size();
    result.view.bytes = view_.bytes();
    result.view.evictions = view_.evictions();
    result.thumbnail.entries = thumbnails_.size();
    result.thumbnail.bytes = thumbnails_.bytes();
    result.thumbnail.evictions = thumbnails_.evictions();
    return result;
}

void MemoryCache::index(const loader::CacheKey& key) {
    by_path_[key.path].insert(key);
}

void MemoryCache::unindex(const loader::CacheKey& key) {
    auto it = by_path_.find(key.path);
    if (it == by_path_.end()) {
        return;
    }
    it->second.erase(key);
    if (it->second.empty()) {
        by_path_.erase(it);
    }
}

}  // namespace lumen::cache
