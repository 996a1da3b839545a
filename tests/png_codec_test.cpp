#include <cstring>
#include <vector>

#include <catch2/catch.hpp>

#include "core/image/png_codec.hpp"
#include "test_support.hpp"

using namespace lumen::image;

TEST_CASE("PNG encode then decode keeps every pixel", "[PngCodec]") {
    auto source = lumen::test::makeGradient(37, 21);
    auto png = encodePng(source);
    REQUIRE(png.has_value());

    PngDecoder decoder;
    REQUIRE(decoder.canDecode(*png));

    auto decoded = decoder.decodeFromMemory(*png, {});
    REQUIRE(decoded.has_value());
    CHECK(decoded->width() == 37);
    CHECK(decoded->height() == 21);
    REQUIRE(decoded->format() == PixelFormat::RGBA32);
    for (uint32_t y = 0; y < source.height(); ++y) {
        INFO("row " << y);
        CHECK(std::memcmp(decoded->row(y), source.row(y), source.width() * 4) == 0);
    }
}

TEST_CASE("PNG header info", "[PngCodec]") {
    auto png = encodePng(lumen::test::makeGradient(64, 48));
    REQUIRE(png.has_value());

    auto info = PngDecoder{}.getInfoFromMemory(*png);
    REQUIRE(info.has_value());
    CHECK(info->width == 64);
    CHECK(info->height == 48);
    CHECK(info->has_alpha);
}

TEST_CASE("PNG decoder failures", "[PngCodec]") {
    SECTION("Truncated data is corrupt") {
        auto png = encodePng(lumen::test::makeGradient(64, 48));
        REQUIRE(png.has_value());
        std::vector<uint8_t> truncated(png->begin(), png->begin() + png->size() / 2);

        auto decoded = PngDecoder{}.decodeFromMemory(truncated, {});
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error() == DecodeError::CorruptedData);
    }

    SECTION("JPEG magic is not claimed") {
        std::vector<uint8_t> jpeg_magic{0xFF, 0xD8, 0xFF, 0xE0, 0, 0, 0, 0};
        REQUIRE_FALSE(PngDecoder{}.canDecode(jpeg_magic));
    }
}
