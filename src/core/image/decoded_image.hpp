/// @file decoded_image.hpp
/// @brief Decoded image data container
///
/// Holds pixel data after decoding, and the encoded form of a thumbnail.

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace lumen::image {

/// @brief Pixel format enumeration
enum class PixelFormat : uint8_t {
    Unknown = 0,
    RGBA32 = 1,  // 32-bit RGBA, straight alpha
    RGB24 = 2,   // 24-bit RGB
};

/// @brief Get bytes per pixel for a pixel format
[[nodiscard]] constexpr uint32_t bytesPerPixel(PixelFormat format) noexcept {
    switch (format) {
    case PixelFormat::RGBA32:
        return 4;
    case PixelFormat::RGB24:
        return 3;
    default:
        return 0;
    }
}

/// @brief Check if pixel format has alpha channel
[[nodiscard]] constexpr bool hasAlpha(PixelFormat format) noexcept {
    return format == PixelFormat::RGBA32;
}

/// @brief Decoded image data
///
/// Owns the pixel data buffer. Rows are tightly packed.
class DecodedImage {
public:
    /// @brief Construct empty image
    DecodedImage() = default;

    /// @brief Construct zero-filled image with dimensions and format
    DecodedImage(uint32_t width, uint32_t height, PixelFormat format)
        : width_(width), height_(height), format_(format), stride_(width * bytesPerPixel(format)),
          pixels_(static_cast<size_t>(stride_) * height) {}

    /// @brief Construct image with existing pixel data (takes ownership)
    /// @param width Image width in pixels
    /// @param height Image height in pixels
    /// @param format Pixel format
    /// @param stride Row stride in bytes
    /// @param pixels Pixel data (moved)
    DecodedImage(uint32_t width, uint32_t height, PixelFormat format, uint32_t stride,
                 std::vector<uint8_t> pixels)
        : width_(width), height_(height), format_(format), stride_(stride),
          pixels_(std::move(pixels)) {}

    // Move-only type
    DecodedImage(const DecodedImage&) = delete;
    DecodedImage& operator=(const DecodedImage&) = delete;
    DecodedImage(DecodedImage&&) noexcept = default;
    DecodedImage& operator=(DecodedImage&&) noexcept = default;

    ~DecodedImage() = default;

    /// @brief Check if image is valid (has data)
    [[nodiscard]] bool valid() const noexcept {
        return width_ > 0 && height_ > 0 && !pixels_.empty();
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

    [[nodiscard]] uint32_t width() const noexcept { return width_; }
    [[nodiscard]] uint32_t height() const noexcept { return height_; }
    [[nodiscard]] PixelFormat format() const noexcept { return format_; }
    [[nodiscard]] uint32_t stride() const noexcept { return stride_; }

    /// @brief Get total size of pixel data in bytes
    [[nodiscard]] size_t sizeBytes() const noexcept { return pixels_.size(); }

    [[nodiscard]] std::span<const uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<uint8_t> pixels() noexcept { return pixels_; }

    [[nodiscard]] const uint8_t* data() const noexcept { return pixels_.data(); }
    [[nodiscard]] uint8_t* data() noexcept { return pixels_.data(); }

    /// @brief Get pointer to specific row
    [[nodiscard]] const uint8_t* row(uint32_t row) const noexcept {
        return pixels_.data() + static_cast<size_t>(row) * stride_;
    }

    [[nodiscard]] uint8_t* row(uint32_t row) noexcept {
        return pixels_.data() + static_cast<size_t>(row) * stride_;
    }

    /// @brief Release ownership of pixel data
    [[nodiscard]] std::vector<uint8_t> release() noexcept {
        width_ = 0;
        height_ = 0;
        format_ = PixelFormat::Unknown;
        stride_ = 0;
        return std::move(pixels_);
    }

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    PixelFormat format_ = PixelFormat::Unknown;
    uint32_t stride_ = 0;
    std::vector<uint8_t> pixels_;
};

/// @brief A thumbnail in its stored form (PNG bytes) with both sizes
struct EncodedImage {
    std::vector<uint8_t> bytes;
    uint32_t width = 0;          // Encoded (thumbnail) width
    uint32_t height = 0;         // Encoded (thumbnail) height
    uint32_t source_width = 0;   // Dimensions of the image it was made from
    uint32_t source_height = 0;

    [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
};

/// @brief Image metadata (dimensions, format info)
struct ImageInfo {
    uint32_t width = 0;
    uint32_t height = 0;
    PixelFormat format = PixelFormat::Unknown;
    bool has_alpha = false;
};

}  // namespace lumen::image
