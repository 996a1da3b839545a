/// @file image_scaler.hpp
/// @brief Image scaling for thumbnail generation and display
///
/// Box-filter resampling on the CPU. Downscaling averages every source pixel
/// that falls into a destination pixel; upscaling degrades to nearest
/// neighbour.

#pragma once

#include <cstdint>
#include <expected>
#include <utility>

#include "decoded_image.hpp"
#include "image_decoder.hpp"

namespace lumen::image {

/// @brief Fit mode for scaling to target dimensions
enum class FitMode {
    Fill,       // Fill target exactly (may distort)
    Contain,    // Fit inside target (preserve aspect)
    Cover,      // Cover target (preserve aspect, may exceed it)
    ScaleDown,  // Like Contain, but never scale up
};

/// @brief Scale an image to exact dimensions
/// @param source Source image (RGB24 or RGBA32)
/// @param target_width Target width in pixels
/// @param target_height Target height in pixels
/// @return Scaled image in the source format, or error
[[nodiscard]] std::expected<DecodedImage, DecodeError>
scaleImage(const DecodedImage& source, uint32_t target_width, uint32_t target_height);

/// @brief Calculate scaled dimensions preserving aspect ratio
/// @param source_width Source width
/// @param source_height Source height
/// @param max_width Maximum target width
/// @param max_height Maximum target height
/// @param fit Fit mode
/// @return Pair of (width, height)
[[nodiscard]] std::pair<uint32_t, uint32_t>
calculateScaledDimensions(uint32_t source_width, uint32_t source_height, uint32_t max_width,
                          uint32_t max_height, FitMode fit = FitMode::Contain);

/// @brief Composite an RGBA image over an opaque background colour
/// @return RGB24 image; RGB24 input is returned as a copy
[[nodiscard]] std::expected<DecodedImage, DecodeError>
flattenAlpha(const DecodedImage& source, uint8_t background = 0);

/// @brief Generate an opaque thumbnail that fits inside the box
/// @param source Source image
/// @param max_width Box width
/// @param max_height Box height
/// @return RGB24 thumbnail, never larger than the source
[[nodiscard]] std::expected<DecodedImage, DecodeError>
generateThumbnail(const DecodedImage& source, uint32_t max_width, uint32_t max_height);

}  // namespace lumen::image
