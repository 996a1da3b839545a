/// @file wire_format.cpp
/// @brief Decode result frame encoding

#include "wire_format.hpp"

#include <new>

namespace lumen::decode {

namespace {

enum class ReplyTag : uint8_t {
    Error = 0,
    Pixels = 1,
    Encoded = 2,
};

class ByteWriter {
public:
    void putU8(uint8_t value) { bytes_.push_back(value); }

    void putU32(uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void putU64(uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            bytes_.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }

    void putBlob(std::span<const uint8_t> data) {
        putU64(data.size());
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    void reserve(size_t n) { bytes_.reserve(n); }

    /// @brief Patch the leading length field and hand out the frame
    [[nodiscard]] std::vector<uint8_t> finish() && {
        uint64_t payload = bytes_.size() - kFrameHeaderSize;
        for (size_t i = 0; i < kFrameHeaderSize; ++i) {
            bytes_[i] = static_cast<uint8_t>(payload >> (8 * i));
        }
        return std::move(bytes_);
    }

private:
    std::vector<uint8_t> bytes_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] std::optional<uint8_t> u8() {
        if (remaining() < 1) {
            return std::nullopt;
        }
        return data_[pos_++];
    }

    [[nodiscard]] std::optional<uint32_t> u32() {
        if (remaining() < 4) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    [[nodiscard]] std::optional<uint64_t> u64() {
        if (remaining() < 8) {
            return std::nullopt;
        }
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(data_[pos_++]) << (8 * i);
        }
        return value;
    }

    [[nodiscard]] std::optional<std::vector<uint8_t>> blob() {
        auto size = u64();
        if (!size || *size > remaining()) {
            return std::nullopt;
        }
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(pos_);
        std::vector<uint8_t> out(first, first + static_cast<std::ptrdiff_t>(*size));
        pos_ += static_cast<size_t>(*size);
        return out;
    }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

[[nodiscard]] bool valid_decode_error(uint8_t value) noexcept {
    return value >= static_cast<uint8_t>(image::DecodeError::FileNotFound) &&
           value <= static_cast<uint8_t>(image::DecodeError::InternalError);
}

[[nodiscard]] DecodeResult crashed() {
    return std::unexpected(image::DecodeError::WorkerCrashed);
}

}  // namespace

std::vector<uint8_t> encodeReply(const DecodeResult& result) {
    ByteWriter writer;
    writer.putU64(0);  // Length, patched by finish()

    if (!result) {
        writer.putU8(static_cast<uint8_t>(ReplyTag::Error));
        writer.putU8(static_cast<uint8_t>(result.error()));
        return std::move(writer).finish();
    }

    if (const auto* pixels = std::get_if<image::DecodedImage>(&*result)) {
        writer.reserve(kFrameHeaderSize + 32 + pixels->sizeBytes());
        writer.putU8(static_cast<uint8_t>(ReplyTag::Pixels));
        writer.putU32(pixels->width());
        writer.putU32(pixels->height());
        writer.putU8(static_cast<uint8_t>(pixels->format()));
        writer.putU32(pixels->stride());
        writer.putBlob(pixels->pixels());
    } else {
        const auto& encoded = std::get<image::EncodedImage>(*result);
        writer.reserve(kFrameHeaderSize + 32 + encoded.bytes.size());
        writer.putU8(static_cast<uint8_t>(ReplyTag::Encoded));
        writer.putU32(encoded.width);
        writer.putU32(encoded.height);
        writer.putU32(encoded.source_width);
        writer.putU32(encoded.source_height);
        writer.putBlob(encoded.bytes);
    }
    return std::move(writer).finish();
}

std::optional<uint64_t> readFrameLength(std::span<const uint8_t> header) noexcept {
    if (header.size() < kFrameHeaderSize) {
        return std::nullopt;
    }
    uint64_t length = 0;
    for (size_t i = 0; i < kFrameHeaderSize; ++i) {
        length |= static_cast<uint64_t>(header[i]) << (8 * i);
    }
    return length;
}

DecodeResult decodeReply(std::span<const uint8_t> frame) {
    auto length = readFrameLength(frame);
    if (!length || *length != frame.size() - kFrameHeaderSize) {
        return crashed();
    }

    try {
        ByteReader reader(frame.subspan(kFrameHeaderSize));
        auto tag = reader.u8();
        if (!tag) {
            return crashed();
        }

        switch (static_cast<ReplyTag>(*tag)) {
        case ReplyTag::Error: {
            auto code = reader.u8();
            if (!code || !valid_decode_error(*code) || reader.remaining() != 0) {
                return crashed();
            }
            return std::unexpected(static_cast<image::DecodeError>(*code));
        }
        case ReplyTag::Pixels: {
            auto width = reader.u32();
            auto height = reader.u32();
            auto format = reader.u8();
            auto stride = reader.u32();
            auto pixels = reader.blob();
            if (!width || !height || !format || !stride || !pixels || reader.remaining() != 0) {
                return crashed();
            }
            auto pixel_format = static_cast<image::PixelFormat>(*format);
            if (image::bytesPerPixel(pixel_format) == 0 ||
                pixels->size() != static_cast<size_t>(*stride) * *height) {
                return crashed();
            }
            return DecodeOutput(std::in_place_type<image::DecodedImage>, *width, *height,
                                pixel_format, *stride, std::move(*pixels));
        }
        case ReplyTag::Encoded: {
            auto width = reader.u32();
            auto height = reader.u32();
            auto source_width = reader.u32();
            auto source_height = reader.u32();
            auto bytes = reader.blob();
            if (!width || !height || !source_width || !source_height || !bytes ||
                reader.remaining() != 0) {
                return crashed();
            }
            return DecodeOutput(image::EncodedImage{
                .bytes = std::move(*bytes),
                .width = *width,
                .height = *height,
                .source_width = *source_width,
                .source_height = *source_height,
            });
        }
        }
        return crashed();
    } catch (const std::bad_alloc&) {
        return std::unexpected(image::DecodeError::OutOfMemory);
    }
}

}  // namespace lumen::decode
