/// @file jpeg_decoder.hpp
/// @brief JPEG decoding using libjpeg

#pragma once

#include "image_decoder.hpp"

namespace lumen::image {

/// @brief JPEG decoder
///
/// When hints are given, the IDCT scales the image by 1/2, 1/4 or 1/8 during
/// decoding, choosing the smallest factor that still covers the target box.
class JpegDecoder final : public IImageDecoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "jpeg"; }

    [[nodiscard]] bool canDecode(std::span<const uint8_t> data) const noexcept override;

    [[nodiscard]] std::expected<ImageInfo, DecodeError>
    getInfoFromMemory(std::span<const uint8_t> data) const override;

    [[nodiscard]] std::expected<DecodedImage, DecodeError>
    decodeFromMemory(std::span<const uint8_t> data, const DecodeHints& hints) const override;
};

/// @brief Pick the libjpeg scale denominator for a target box
/// @return 1, 2, 4 or 8
[[nodiscard]] unsigned int chooseJpegScaleDenom(uint32_t source_width, uint32_t source_height,
                                                const DecodeHints& hints) noexcept;

}  // namespace lumen::image
