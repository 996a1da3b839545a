/// @file png_codec.hpp
/// @brief PNG decoding and encoding using libpng
///
/// PNG is also the storage format for thumbnails, so the encoder lives here
/// next to the decoder that reads them back.

#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "image_decoder.hpp"

namespace lumen::image {

class PngDecoder final : public IImageDecoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "png"; }

    [[nodiscard]] bool canDecode(std::span<const uint8_t> data) const noexcept override;

    [[nodiscard]] std::expected<ImageInfo, DecodeError>
    getInfoFromMemory(std::span<const uint8_t> data) const override;

    /// Hints are ignored; PNG has no reduced-resolution decode.
    [[nodiscard]] std::expected<DecodedImage, DecodeError>
    decodeFromMemory(std::span<const uint8_t> data, const DecodeHints& hints) const override;
};

/// @brief Encode an RGB24 or RGBA32 image as PNG
/// @param image Source image
/// @param compression_level zlib level 0-9
/// @return PNG file bytes or error
[[nodiscard]] std::expected<std::vector<uint8_t>, DecodeError>
encodePng(const DecodedImage& image, int compression_level = 6);

}  // namespace lumen::image
