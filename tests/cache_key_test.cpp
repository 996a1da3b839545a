#include <unordered_set>

#include <catch2/catch.hpp>

#include "core/loader/cache_key.hpp"

using lumen::decode::DecodeMode;
using lumen::loader::CacheKey;
using lumen::loader::CacheKeyHash;
using lumen::loader::IdentityHash;

TEST_CASE("CacheKey equality", "[CacheKey]") {
    SECTION("Equal when every field matches") {
        REQUIRE(CacheKey::thumbnail("/a/b.png", 256, 195) == CacheKey::thumbnail("/a/b.png", 256, 195));
    }

    SECTION("Size and path both take part") {
        CHECK(CacheKey::thumbnail("/a/b.png", 256, 195) != CacheKey::thumbnail("/a/b.png", 128, 195));
        CHECK(CacheKey::thumbnail("/a/b.png", 256, 195) != CacheKey::thumbnail("/a/c.png", 256, 195));
    }

    SECTION("Full never matches a thumbnail") {
        CacheKey full{"/a/b.png", 256, 195, DecodeMode::Full};
        CacheKey thumb = CacheKey::thumbnail("/a/b.png", 256, 195);
        CHECK(full != thumb);
        CHECK(full.identity() != thumb.identity());
    }
}

TEST_CASE("CacheKey identity ignores the target size", "[CacheKey]") {
    auto small = CacheKey::thumbnail("/a/b.png", 64, 64);
    auto large = CacheKey::thumbnail("/a/b.png", 512, 512);
    REQUIRE(small.identity() == large.identity());
    REQUIRE(IdentityHash{}(small.identity()) == IdentityHash{}(large.identity()));
}

TEST_CASE("CacheKey works as an unordered_set key", "[CacheKey]") {
    std::unordered_set<CacheKey, CacheKeyHash> keys;
    keys.insert(CacheKey::full("/a/b.png"));
    keys.insert(CacheKey::full("/a/b.png"));
    keys.insert(CacheKey::thumbnail("/a/b.png", 256, 195));
    REQUIRE(keys.size() == 2);
}

TEST_CASE("CacheKey target needs both dimensions", "[CacheKey]") {
    CacheKey key{"/a/b.png", 100, std::nullopt, DecodeMode::Thumbnail};
    CHECK_FALSE(key.target().has_value());

    auto job = CacheKey::thumbnail("/a/b.png", 100, 80).toJob();
    REQUIRE(job.target.has_value());
    CHECK(job.target->width == 100);
    CHECK(job.target->height == 80);
    CHECK(job.mode == DecodeMode::Thumbnail);
}
