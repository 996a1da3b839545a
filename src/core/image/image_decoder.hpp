/// @file image_decoder.hpp
/// @brief Abstract image decoder interface
///
/// Defines the interface for format decoders registered with the Decoder
/// facade. Decoders work on an in-memory copy of the file.

#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

#include "decoded_image.hpp"

namespace lumen::image {

/// @brief Image decoding errors
///
/// Values are fixed because they cross the process boundary.
enum class DecodeError : uint8_t {
    FileNotFound = 1,
    AccessDenied = 2,
    UnsupportedFormat = 3,
    CorruptedData = 4,
    OutOfMemory = 5,
    WorkerCrashed = 6,  // Isolated worker died or returned garbage
    InternalError = 7,
};

/// @brief Get string representation of decode error
[[nodiscard]] constexpr std::string_view to_string(DecodeError error) noexcept {
    switch (error) {
    case DecodeError::FileNotFound:
        return "File not found";
    case DecodeError::AccessDenied:
        return "Access denied";
    case DecodeError::UnsupportedFormat:
        return "Unsupported image format";
    case DecodeError::CorruptedData:
        return "Corrupted image data";
    case DecodeError::OutOfMemory:
        return "Out of memory";
    case DecodeError::WorkerCrashed:
        return "Decode worker crashed";
    case DecodeError::InternalError:
        return "Internal decoder error";
    }
    return "Unknown decode error";
}

/// @brief Largest dimension accepted from any header (guards huge allocations)
inline constexpr uint32_t kMaxImageDimension = 65535;

/// @brief Optional size the caller intends to display at
///
/// Decoders may use it to decode at a reduced resolution; the result is never
/// smaller than the box in both dimensions unless the source already is.
struct DecodeHints {
    uint32_t max_width = 0;   // 0 = full resolution
    uint32_t max_height = 0;

    [[nodiscard]] bool fullResolution() const noexcept {
        return max_width == 0 || max_height == 0;
    }
};

/// @brief Abstract image decoder interface
///
/// Implementations should be stateless and thread-safe.
class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    /// @brief Get decoder name for debugging/logging
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// @brief Check if this decoder can decode the given data
    /// @param data First few bytes of file (for magic number detection)
    [[nodiscard]] virtual bool canDecode(std::span<const uint8_t> data) const noexcept = 0;

    /// @brief Get image info from the header only
    [[nodiscard]] virtual std::expected<ImageInfo, DecodeError>
    getInfoFromMemory(std::span<const uint8_t> data) const = 0;

    /// @brief Decode image from memory
    /// @param data Complete file contents
    /// @param hints Optional reduced-resolution request
    /// @return RGBA32 or RGB24 image, or error
    [[nodiscard]] virtual std::expected<DecodedImage, DecodeError>
    decodeFromMemory(std::span<const uint8_t> data, const DecodeHints& hints) const = 0;

protected:
    IImageDecoder() = default;
    IImageDecoder(const IImageDecoder&) = default;
    IImageDecoder& operator=(const IImageDecoder&) = default;
    IImageDecoder(IImageDecoder&&) = default;
    IImageDecoder& operator=(IImageDecoder&&) = default;
};

}  // namespace lumen::image
