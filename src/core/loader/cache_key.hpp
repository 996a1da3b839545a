/// @file cache_key.hpp
/// @brief Keys identifying decode results

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "../decode/decode_job.hpp"

namespace lumen::loader {

/// @brief A path and mode, ignoring target size
///
/// The loader keeps at most one live request per identity.
struct Identity {
    std::filesystem::path path;
    decode::DecodeMode mode = decode::DecodeMode::Full;

    [[nodiscard]] bool operator==(const Identity&) const = default;
};

/// @brief Full key of a decode result
///
/// A Full key never satisfies a Thumbnail lookup, nor the reverse, even for
/// the same path and size.
struct CacheKey {
    std::filesystem::path path;
    std::optional<uint32_t> target_width;
    std::optional<uint32_t> target_height;
    decode::DecodeMode mode = decode::DecodeMode::Full;

    [[nodiscard]] static CacheKey thumbnail(std::filesystem::path path, uint32_t width,
                                            uint32_t height) {
        return CacheKey{std::move(path), width, height, decode::DecodeMode::Thumbnail};
    }

    [[nodiscard]] static CacheKey full(std::filesystem::path path) {
        return CacheKey{std::move(path), std::nullopt, std::nullopt, decode::DecodeMode::Full};
    }

    [[nodiscard]] Identity identity() const { return Identity{path, mode}; }

    /// @brief Target box, present only when both dimensions are set
    [[nodiscard]] std::optional<image::TargetSize> target() const noexcept {
        if (!target_width || !target_height) {
            return std::nullopt;
        }
        return image::TargetSize{*target_width, *target_height};
    }

    [[nodiscard]] decode::DecodeJob toJob() const {
        return decode::DecodeJob{.path = path, .target = target(), .mode = mode};
    }

    [[nodiscard]] bool operator==(const CacheKey&) const = default;
};

namespace detail {

inline void hash_combine(size_t& seed, size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace detail

struct PathHash {
    [[nodiscard]] size_t operator()(const std::filesystem::path& path) const noexcept {
        return std::filesystem::hash_value(path);
    }
};

struct IdentityHash {
    [[nodiscard]] size_t operator()(const Identity& id) const noexcept {
        size_t seed = std::filesystem::hash_value(id.path);
        detail::hash_combine(seed, static_cast<size_t>(id.mode));
        return seed;
    }
};

struct CacheKeyHash {
    [[nodiscard]] size_t operator()(const CacheKey& key) const noexcept {
        size_t seed = std::filesystem::hash_value(key.path);
        detail::hash_combine(seed, static_cast<size_t>(key.mode));
        detail::hash_combine(seed, key.target_width ? *key.target_width + 1 : 0);
        detail::hash_combine(seed, key.target_height ? *key.target_height + 1 : 0);
        return seed;
    }
};

/// @brief Human readable form for logs
[[nodiscard]] inline std::string describe(const CacheKey& key) {
    if (auto box = key.target()) {
        return fmt::format("{} [{} {}x{}]", key.path.string(), decode::to_string(key.mode),
                           box->width, box->height);
    }
    return fmt::format("{} [{}]", key.path.string(), decode::to_string(key.mode));
}

}  // namespace lumen::loader
