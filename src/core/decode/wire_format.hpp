/// @file wire_format.hpp
/// @brief Byte encoding of decode results for the worker pipe
///
/// Frame layout (all integers little-endian):
///   u64 payload_length
///   u8  tag          0 = error, 1 = pixels, 2 = encoded
///   error:   u8 DecodeError
///   pixels:  u32 width, u32 height, u8 format, u32 stride, u64 n, n bytes
///   encoded: u32 width, u32 height, u32 source_width, u32 source_height, u64 n, n bytes

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "decode_job.hpp"

namespace lumen::decode {

/// @brief Size of the length prefix in front of every frame
inline constexpr size_t kFrameHeaderSize = 8;

/// @brief Serialize a result into one complete frame
[[nodiscard]] std::vector<uint8_t> encodeReply(const DecodeResult& result);

/// @brief Read the payload length from a frame header
/// @return Length, or nullopt if fewer than kFrameHeaderSize bytes are given
[[nodiscard]] std::optional<uint64_t> readFrameLength(std::span<const uint8_t> header) noexcept;

/// @brief Parse a complete frame
///
/// Anything short, oversized or otherwise malformed is reported as
/// DecodeError::WorkerCrashed, since only a dying worker produces it.
[[nodiscard]] DecodeResult decodeReply(std::span<const uint8_t> frame);

}  // namespace lumen::decode
