#include <cstring>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include "core/decode/wire_format.hpp"
#include "test_support.hpp"

using namespace lumen::decode;
using lumen::image::DecodeError;
using lumen::image::DecodedImage;
using lumen::image::EncodedImage;

TEST_CASE("Reply frames", "[WireFormat]") {
    SECTION("Error") {
        auto frame = encodeReply(std::unexpected(DecodeError::CorruptedData));
        auto length = readFrameLength(frame);
        REQUIRE(length.has_value());
        CHECK(*length == frame.size() - kFrameHeaderSize);

        auto result = decodeReply(frame);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DecodeError::CorruptedData);
    }

    SECTION("Pixel buffer") {
        DecodeResult sent = DecodeOutput{lumen::test::makeGradient(7, 5)};
        auto frame = encodeReply(sent);

        auto result = decodeReply(frame);
        REQUIRE(result.has_value());
        auto* image = std::get_if<DecodedImage>(&*result);
        REQUIRE(image != nullptr);
        const auto& original = std::get<DecodedImage>(*sent);
        CHECK(image->width() == 7);
        CHECK(image->height() == 5);
        CHECK(image->format() == original.format());
        REQUIRE(image->sizeBytes() == original.sizeBytes());
        CHECK(std::memcmp(image->data(), original.data(), original.sizeBytes()) == 0);
    }

    SECTION("Encoded image") {
        EncodedImage encoded;
        encoded.bytes = {1, 2, 3, 4, 5};
        encoded.width = 10;
        encoded.height = 8;
        encoded.source_width = 100;
        encoded.source_height = 80;

        auto result = decodeReply(encodeReply(DecodeOutput{encoded}));
        REQUIRE(result.has_value());
        auto* decoded = std::get_if<EncodedImage>(&*result);
        REQUIRE(decoded != nullptr);
        CHECK(decoded->bytes == encoded.bytes);
        CHECK(decoded->width == 10);
        CHECK(decoded->source_height == 80);
    }
}

TEST_CASE("Damaged frames mean the worker crashed", "[WireFormat]") {
    SECTION("Truncated") {
        EncodedImage encoded;
        encoded.bytes.assign(64, 0xAB);
        encoded.width = encoded.height = 4;
        auto frame = encodeReply(DecodeOutput{encoded});

        for (size_t cut : {size_t{0}, size_t{3}, kFrameHeaderSize, frame.size() - 1}) {
            INFO("cut at " << cut);
            std::vector<uint8_t> partial(frame.begin(), frame.begin() + static_cast<long>(cut));
            auto result = decodeReply(partial);
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error() == DecodeError::WorkerCrashed);
        }
    }

    SECTION("Garbage") {
        std::vector<uint8_t> garbage{2, 0, 0, 0, 0, 0, 0, 0, 0x7F, 0x7F};
        auto result = decodeReply(garbage);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == DecodeError::WorkerCrashed);
    }

    SECTION("A short header has no length") {
        std::vector<uint8_t> header{1, 2, 3};
        CHECK_FALSE(readFrameLength(header).has_value());
    }
}
