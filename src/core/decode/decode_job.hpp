/// @file decode_job.hpp
/// @brief Unit of decode work and its outcome

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>

#include "../image/decoded_image.hpp"
#include "../image/decoder.hpp"
#include "../image/image_decoder.hpp"

namespace lumen::decode {

/// @brief What a decode produces
enum class DecodeMode : uint8_t {
    Thumbnail = 0,  // Encoded PNG bytes
    Full = 1,       // Pixel buffer for viewing
};

[[nodiscard]] constexpr std::string_view to_string(DecodeMode mode) noexcept {
    switch (mode) {
    case DecodeMode::Thumbnail:
        return "thumbnail";
    case DecodeMode::Full:
        return "full";
    }
    return "unknown";
}

struct DecodeJob {
    std::filesystem::path path;
    std::optional<image::TargetSize> target;
    DecodeMode mode = DecodeMode::Full;
};

/// Full jobs yield DecodedImage, thumbnail jobs EncodedImage
using DecodeOutput = std::variant<image::DecodedImage, image::EncodedImage>;
using DecodeResult = std::expected<DecodeOutput, image::DecodeError>;

/// @brief The work an executor runs for a job
using DecodeFunction = std::function<DecodeResult(const DecodeJob&)>;

/// @brief Default decode function backed by image::Decoder
[[nodiscard]] DecodeResult runDecodeJob(const DecodeJob& job);

}  // namespace lumen::decode
