#include <catch2/catch.hpp>

#include "core/image/decoder.hpp"
#include "core/image/png_codec.hpp"
#include "test_support.hpp"

using namespace lumen::image;

namespace {

struct DecoderFixture {
    lumen::test::TempDir dir;
    Decoder decoder;
};

}  // namespace

TEST_CASE_METHOD(DecoderFixture, "Decoder probe reads header dimensions", "[Decoder]") {
    auto png = dir / "a.png";
    auto jpg = dir / "b.jpg";
    lumen::test::writePng(png, 120, 80);
    lumen::test::writeJpeg(jpg, 640, 360);

    auto png_info = decoder.probe(png);
    REQUIRE(png_info.has_value());
    CHECK(png_info->width == 120);
    CHECK(png_info->height == 80);

    auto jpg_info = decoder.probe(jpg);
    REQUIRE(jpg_info.has_value());
    CHECK(jpg_info->width == 640);
    CHECK(jpg_info->height == 360);
    CHECK_FALSE(jpg_info->has_alpha);
}

TEST_CASE_METHOD(DecoderFixture, "Decoder output sizes", "[Decoder]") {
    SECTION("Full decode keeps the source size") {
        auto jpg = dir / "photo.jpg";
        lumen::test::writeJpeg(jpg, 333, 222);

        auto image = decoder.decode(jpg);
        REQUIRE(image.has_value());
        CHECK(image->width() == 333);
        CHECK(image->height() == 222);
    }

    SECTION("Targeted decode fits the box") {
        auto jpg = dir / "photo.jpg";
        lumen::test::writeJpeg(jpg, 2000, 1000);

        auto image = decoder.decode(jpg, TargetSize{256, 195});
        REQUIRE(image.has_value());
        CHECK(image->width() == 256);
        CHECK(image->height() <= 195);
    }

    SECTION("Small sources are not upscaled") {
        auto png = dir / "tiny.png";
        lumen::test::writePng(png, 40, 30);

        auto image = decoder.decode(png, TargetSize{256, 195});
        REQUIRE(image.has_value());
        CHECK(image->width() == 40);
        CHECK(image->height() == 30);
    }

    SECTION("decodeMemory fits the box") {
        auto png = encodePng(lumen::test::makeGradient(400, 400));
        REQUIRE(png.has_value());

        auto image = decoder.decodeMemory(*png, TargetSize{100, 50});
        REQUIRE(image.has_value());
        CHECK(image->width() == 50);
        CHECK(image->height() == 50);
    }
}

TEST_CASE_METHOD(DecoderFixture, "Encoded thumbnails carry the source size", "[Decoder]") {
    auto png = dir / "wide.png";
    lumen::test::writePng(png, 1024, 512);

    auto encoded = decoder.decodeToEncodedBytes(png, TargetSize{256, 195});
    REQUIRE(encoded.has_value());
    CHECK(encoded->source_width == 1024);
    CHECK(encoded->source_height == 512);
    CHECK(encoded->width == 256);
    CHECK(encoded->height == 128);

    auto info = PngDecoder{}.getInfoFromMemory(encoded->bytes);
    REQUIRE(info.has_value());
    CHECK(info->width == 256);
    CHECK(info->height == 128);
    CHECK_FALSE(info->has_alpha);
}

TEST_CASE_METHOD(DecoderFixture, "Decoder errors", "[Decoder]") {
    SECTION("Format comes from content, not the extension") {
        auto txt = dir / "notes.png";
        lumen::test::writeBytes(txt, "these are not pixels");

        auto image = decoder.decode(txt);
        REQUIRE_FALSE(image.has_value());
        CHECK(image.error() == DecodeError::UnsupportedFormat);
    }

    SECTION("Missing file") {
        auto image = decoder.decode(dir / "absent.jpg");
        REQUIRE_FALSE(image.has_value());
        CHECK(image.error() == DecodeError::FileNotFound);
    }
}
