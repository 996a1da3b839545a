/// @file decoder.hpp
/// @brief Format-independent decode entry points
///
/// The Decoder owns one instance of every format decoder and picks one by the
/// file's magic bytes. It has no mutable state and performs no logging, so it
/// is safe to call from a freshly forked worker process.

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "decoded_image.hpp"
#include "image_decoder.hpp"

namespace lumen::image {

/// @brief Approximate box a decoded image should fit into
struct TargetSize {
    uint32_t width = 0;
    uint32_t height = 0;

    [[nodiscard]] bool operator==(const TargetSize&) const = default;
};

class Decoder {
public:
    Decoder();
    ~Decoder();

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;
    Decoder(Decoder&&) noexcept;
    Decoder& operator=(Decoder&&) noexcept;

    /// @brief Decode a file to pixels
    /// @param path Image file
    /// @param target Box to fit into (aspect preserved, never upscaled); nullopt = full size
    [[nodiscard]] std::expected<DecodedImage, DecodeError>
    decode(const std::filesystem::path& path, std::optional<TargetSize> target = std::nullopt) const;

    /// @brief Decode a file and re-encode it as PNG
    ///
    /// With a target the result is an opaque RGB thumbnail; without one the
    /// full image is encoded, alpha included.
    [[nodiscard]] std::expected<EncodedImage, DecodeError>
    decodeToEncodedBytes(const std::filesystem::path& path,
                         std::optional<TargetSize> target = std::nullopt) const;

    /// @brief Decode an in-memory image (e.g. a stored thumbnail)
    [[nodiscard]] std::expected<DecodedImage, DecodeError>
    decodeMemory(std::span<const uint8_t> data,
                 std::optional<TargetSize> target = std::nullopt) const;

    /// @brief Read only the header of a file
    [[nodiscard]] std::expected<ImageInfo, DecodeError>
    probe(const std::filesystem::path& path) const;

    /// @brief Find the decoder whose magic bytes match
    /// @return Decoder or nullptr
    [[nodiscard]] const IImageDecoder* findDecoder(std::span<const uint8_t> header) const noexcept;

private:
    std::vector<std::unique_ptr<IImageDecoder>> decoders_;
};

/// @brief Read a whole file into memory
[[nodiscard]] std::expected<std::vector<uint8_t>, DecodeError>
readFileBytes(const std::filesystem::path& path);

}  // namespace lumen::image
