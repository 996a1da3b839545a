/// @file image_scaler.cpp
/// @brief Box-filter image scaling

#include "image_scaler.hpp"

#include <algorithm>
#include <cmath>
#include <new>
#include <vector>

namespace lumen::image {

namespace {

[[nodiscard]] DecodedImage copy_image(const DecodedImage& source) {
    std::vector<uint8_t> pixels(source.pixels().begin(), source.pixels().end());
    return DecodedImage(source.width(), source.height(), source.format(), source.stride(),
                        std::move(pixels));
}

/// @brief Source span [begin, end) covered by destination index i
[[nodiscard]] std::pair<uint32_t, uint32_t> source_span(uint32_t i, uint32_t dst_size,
                                                        uint32_t src_size) noexcept {
    auto begin = static_cast<uint32_t>(static_cast<uint64_t>(i) * src_size / dst_size);
    auto end = static_cast<uint32_t>(static_cast<uint64_t>(i + 1) * src_size / dst_size);
    end = std::max(end, begin + 1);
    return {begin, std::min(end, src_size)};
}

}  // namespace

std::pair<uint32_t, uint32_t> calculateScaledDimensions(uint32_t source_width,
                                                        uint32_t source_height, uint32_t max_width,
                                                        uint32_t max_height, FitMode fit) {
    if (source_width == 0 || source_height == 0) {
        return {0, 0};
    }
    if (max_width == 0 || max_height == 0) {
        return {source_width, source_height};
    }

    double source_aspect = static_cast<double>(source_width) / source_height;
    double target_aspect = static_cast<double>(max_width) / max_height;

    uint32_t result_width = max_width;
    uint32_t result_height = max_height;

    switch (fit) {
    case FitMode::Fill:
        break;

    case FitMode::ScaleDown:
        if (source_width <= max_width && source_height <= max_height) {
            return {source_width, source_height};
        }
        [[fallthrough]];

    case FitMode::Contain:
        if (source_aspect > target_aspect) {
            // Width-constrained
            result_width = max_width;
            result_height = static_cast<uint32_t>(std::round(max_width / source_aspect));
        } else {
            // Height-constrained
            result_height = max_height;
            result_width = static_cast<uint32_t>(std::round(max_height * source_aspect));
        }
        break;

    case FitMode::Cover:
        if (source_aspect > target_aspect) {
            result_height = max_height;
            result_width = static_cast<uint32_t>(std::round(max_height * source_aspect));
        } else {
            result_width = max_width;
            result_height = static_cast<uint32_t>(std::round(max_width / source_aspect));
        }
        break;
    }

    // Ensure at least 1x1
    result_width = std::max(result_width, 1u);
    result_height = std::max(result_height, 1u);

    return {result_width, result_height};
}

std::expected<DecodedImage, DecodeError> scaleImage(const DecodedImage& source,
                                                    uint32_t target_width,
                                                    uint32_t target_height) {
    if (!source.valid() || target_width == 0 || target_height == 0) {
        return std::unexpected(DecodeError::InternalError);
    }
    const uint32_t channels = bytesPerPixel(source.format());
    if (channels == 0) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    if (target_width == source.width() && target_height == source.height()) {
        return copy_image(source);
    }

    try {
        DecodedImage result(target_width, target_height, source.format());

        // Column spans are the same for every row
        std::vector<std::pair<uint32_t, uint32_t>> columns(target_width);
        for (uint32_t x = 0; x < target_width; ++x) {
            columns[x] = source_span(x, target_width, source.width());
        }

        std::vector<uint64_t> sums(channels);
        for (uint32_t y = 0; y < target_height; ++y) {
            auto [y0, y1] = source_span(y, target_height, source.height());
            uint8_t* out = result.row(y);

            for (uint32_t x = 0; x < target_width; ++x) {
                auto [x0, x1] = columns[x];
                std::fill(sums.begin(), sums.end(), 0);

                for (uint32_t sy = y0; sy < y1; ++sy) {
                    const uint8_t* in = source.row(sy) + static_cast<size_t>(x0) * channels;
                    for (uint32_t sx = x0; sx < x1; ++sx) {
                        for (uint32_t c = 0; c < channels; ++c) {
                            sums[c] += in[c];
                        }
                        in += channels;
                    }
                }

                uint64_t count = static_cast<uint64_t>(x1 - x0) * (y1 - y0);
                for (uint32_t c = 0; c < channels; ++c) {
                    out[c] = static_cast<uint8_t>((sums[c] + count / 2) / count);
                }
                out += channels;
            }
        }

        return result;
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecodeError::OutOfMemory);
    }
}

std::expected<DecodedImage, DecodeError> flattenAlpha(const DecodedImage& source,
                                                      uint8_t background) {
    if (!source.valid()) {
        return std::unexpected(DecodeError::InternalError);
    }
    if (source.format() == PixelFormat::RGB24) {
        return copy_image(source);
    }
    if (source.format() != PixelFormat::RGBA32) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    try {
        DecodedImage result(source.width(), source.height(), PixelFormat::RGB24);
        for (uint32_t y = 0; y < source.height(); ++y) {
            const uint8_t* in = source.row(y);
            uint8_t* out = result.row(y);
            for (uint32_t x = 0; x < source.width(); ++x) {
                uint32_t alpha = in[3];
                for (int c = 0; c < 3; ++c) {
                    out[c] = static_cast<uint8_t>(
                        (in[c] * alpha + background * (255 - alpha) + 127) / 255);
                }
                in += 4;
                out += 3;
            }
        }
        return result;
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecodeError::OutOfMemory);
    }
}

std::expected<DecodedImage, DecodeError>
generateThumbnail(const DecodedImage& source, uint32_t max_width, uint32_t max_height) {
    auto [width, height] = calculateScaledDimensions(source.width(), source.height(), max_width,
                                                     max_height, FitMode::ScaleDown);

    // Scale first so the alpha pass touches fewer pixels
    auto scaled = scaleImage(source, width, height);
    if (!scaled) {
        return std::unexpected(scaled.error());
    }
    if (scaled->format() == PixelFormat::RGB24) {
        return scaled;
    }
    return flattenAlpha(*scaled);
}

}  // namespace lumen::image
