/// @file png_codec.cpp
/// @brief libpng based PNG codec

#include "png_codec.hpp"

#include <png.h>

#include <array>
#include <csetjmp>
#include <cstring>
#include <new>

namespace lumen::image {

namespace {

constexpr std::array<uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

struct MemoryReader {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t offset = 0;
};

struct VectorWriter {
    std::vector<uint8_t>* out = nullptr;
    bool failed = false;
};

void read_from_memory(png_structp png, png_bytep out, size_t length) {
    auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
    if (reader->size - reader->offset < length) {
        png_error(png, "read beyond end of data");
    }
    std::memcpy(out, reader->data + reader->offset, length);
    reader->offset += length;
}

void write_to_vector(png_structp png, png_bytep data, size_t length) {
    auto* writer = static_cast<VectorWriter*>(png_get_io_ptr(png));
    if (writer->failed) {
        return;
    }
    try {
        writer->out->insert(writer->out->end(), data, data + length);
    } catch (const std::bad_alloc&) {
        writer->failed = true;
    }
}

void flush_noop(png_structp) {
}

void on_png_error(png_structp png, png_const_charp) {
    png_longjmp(png, 1);
}

// Ancillary chunk complaints (bad iCCP, sRGB mismatch) are not decode failures
void on_png_warning(png_structp, png_const_charp) {
}

/// @brief Owns the libpng read structures
class PngReadHandle {
public:
    PngReadHandle() {
        png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
        if (png) {
            info = png_create_info_struct(png);
        }
    }

    ~PngReadHandle() {
        if (png) {
            png_destroy_read_struct(&png, info ? &info : nullptr, nullptr);
        }
    }

    PngReadHandle(const PngReadHandle&) = delete;
    PngReadHandle& operator=(const PngReadHandle&) = delete;

    [[nodiscard]] bool valid() const noexcept { return png && info; }

    png_structp png = nullptr;
    png_infop info = nullptr;
};

/// @brief Owns the libpng write structures
class PngWriteHandle {
public:
    PngWriteHandle() {
        png =
            png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, on_png_error, on_png_warning);
        if (png) {
            info = png_create_info_struct(png);
        }
    }

    ~PngWriteHandle() {
        if (png) {
            png_destroy_write_struct(&png, info ? &info : nullptr);
        }
    }

    PngWriteHandle(const PngWriteHandle&) = delete;
    PngWriteHandle& operator=(const PngWriteHandle&) = delete;

    [[nodiscard]] bool valid() const noexcept { return png && info; }

    png_structp png = nullptr;
    png_infop info = nullptr;
};

struct PngLayout {
    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bit_depth = 0;
    int color_type = 0;
    int channels = 0;        // After transforms
    size_t row_bytes = 0;    // After transforms
};

// libpng reports errors with longjmp. The helpers below are the setjmp
// targets, so nothing with a non-trivial destructor may live in their frames.

bool read_header(png_structp png, png_infop info, PngLayout* layout) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }
    png_read_info(png, info);
    png_get_IHDR(png, info, &layout->width, &layout->height, &layout->bit_depth,
                 &layout->color_type, nullptr, nullptr, nullptr);
    return true;
}

bool apply_transforms(png_structp png, png_infop info, PngLayout* layout) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }
    if (layout->bit_depth == 16) {
        png_set_strip_16(png);
    }
    if (layout->color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_palette_to_rgb(png);
    }
    if (layout->color_type == PNG_COLOR_TYPE_GRAY && layout->bit_depth < 8) {
        png_set_expand_gray_1_2_4_to_8(png);
    }
    if (png_get_valid(png, info, PNG_INFO_tRNS)) {
        png_set_tRNS_to_alpha(png);
    }
    if (layout->color_type == PNG_COLOR_TYPE_GRAY ||
        layout->color_type == PNG_COLOR_TYPE_GRAY_ALPHA) {
        png_set_gray_to_rgb(png);
    }
    png_set_interlace_handling(png);
    png_read_update_info(png, info);

    layout->channels = png_get_channels(png, info);
    layout->row_bytes = png_get_rowbytes(png, info);
    return true;
}

bool read_rows(png_structp png, png_bytepp rows) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }
    png_read_image(png, rows);
    png_read_end(png, nullptr);
    return true;
}

bool write_png(png_structp png, png_infop info, const PngLayout* layout, png_bytepp rows,
               int compression_level) {
    if (setjmp(png_jmpbuf(png))) {
        return false;
    }
    png_set_IHDR(png, info, layout->width, layout->height, 8, layout->color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_set_compression_level(png, compression_level);
    png_write_info(png, info);
    png_write_image(png, rows);
    png_write_end(png, nullptr);
    return true;
}

[[nodiscard]] bool plausible_dimensions(png_uint_32 width, png_uint_32 height) noexcept {
    return width > 0 && height > 0 && width <= kMaxImageDimension && height <= kMaxImageDimension;
}

}  // namespace

bool PngDecoder::canDecode(std::span<const uint8_t> data) const noexcept {
    return data.size() >= kPngSignature.size() &&
           std::memcmp(data.data(), kPngSignature.data(), kPngSignature.size()) == 0;
}

std::expected<ImageInfo, DecodeError>
PngDecoder::getInfoFromMemory(std::span<const uint8_t> data) const {
    if (!canDecode(data)) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    PngReadHandle handle;
    if (!handle.valid()) {
        return std::unexpected(DecodeError::OutOfMemory);
    }

    MemoryReader reader{.data = data.data(), .size = data.size(), .offset = 0};
    png_set_read_fn(handle.png, &reader, read_from_memory);

    PngLayout layout;
    if (!read_header(handle.png, handle.info, &layout) ||
        !plausible_dimensions(layout.width, layout.height)) {
        return std::unexpected(DecodeError::CorruptedData);
    }

    bool alpha = (layout.color_type & PNG_COLOR_MASK_ALPHA) != 0 ||
                 png_get_valid(handle.png, handle.info, PNG_INFO_tRNS) != 0;
    return ImageInfo{
        .width = layout.width,
        .height = layout.height,
        .format = alpha ? PixelFormat::RGBA32 : PixelFormat::RGB24,
        .has_alpha = alpha,
    };
}

std::expected<DecodedImage, DecodeError>
PngDecoder::decodeFromMemory(std::span<const uint8_t> data, const DecodeHints&) const {
    if (!canDecode(data)) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    PngReadHandle handle;
    if (!handle.valid()) {
        return std::unexpected(DecodeError::OutOfMemory);
    }

    MemoryReader reader{.data = data.data(), .size = data.size(), .offset = 0};
    png_set_read_fn(handle.png, &reader, read_from_memory);

    PngLayout layout;
    if (!read_header(handle.png, handle.info, &layout) ||
        !plausible_dimensions(layout.width, layout.height) ||
        !apply_transforms(handle.png, handle.info, &layout)) {
        return std::unexpected(DecodeError::CorruptedData);
    }

    PixelFormat format;
    if (layout.channels == 4) {
        format = PixelFormat::RGBA32;
    } else if (layout.channels == 3) {
        format = PixelFormat::RGB24;
    } else {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    try {
        DecodedImage image(layout.width, layout.height, format);
        if (layout.row_bytes != image.stride()) {
            return std::unexpected(DecodeError::InternalError);
        }

        std::vector<png_bytep> rows(layout.height);
        for (png_uint_32 y = 0; y < layout.height; ++y) {
            rows[y] = image.row(y);
        }
        if (!read_rows(handle.png, rows.data())) {
            return std::unexpected(DecodeError::CorruptedData);
        }
        return image;
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecodeError::OutOfMemory);
    }
}

std::expected<std::vector<uint8_t>, DecodeError> encodePng(const DecodedImage& image,
                                                           int compression_level) {
    if (!image.valid()) {
        return std::unexpected(DecodeError::InternalError);
    }

    PngLayout layout;
    layout.width = image.width();
    layout.height = image.height();
    switch (image.format()) {
    case PixelFormat::RGBA32:
        layout.color_type = PNG_COLOR_TYPE_RGB_ALPHA;
        break;
    case PixelFormat::RGB24:
        layout.color_type = PNG_COLOR_TYPE_RGB;
        break;
    default:
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    PngWriteHandle handle;
    if (!handle.valid()) {
        return std::unexpected(DecodeError::OutOfMemory);
    }

    try {
        std::vector<uint8_t> out;
        out.reserve(image.sizeBytes() / 2 + 1024);
        VectorWriter writer{.out = &out, .failed = false};
        png_set_write_fn(handle.png, &writer, write_to_vector, flush_noop);

        std::vector<png_bytep> rows(image.height());
        for (uint32_t y = 0; y < image.height(); ++y) {
            rows[y] = const_cast<png_bytep>(image.row(y));
        }

        if (!write_png(handle.png, handle.info, &layout, rows.data(), compression_level)) {
            return std::unexpected(DecodeError::InternalError);
        }
        if (writer.failed) {
            return std::unexpected(DecodeError::OutOfMemory);
        }
        return out;
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecodeError::OutOfMemory);
    }
}

}  // namespace lumen::image
