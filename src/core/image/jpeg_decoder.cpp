/// @file jpeg_decoder.cpp
/// @brief libjpeg based JPEG decoder

#include "jpeg_decoder.hpp"

// jpeglib.h needs size_t and FILE declared first
#include <cstddef>
#include <cstdio>

#include <jpeglib.h>

#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <new>
#include <vector>

namespace lumen::image {

namespace {

struct JpegErrorManager {
    jpeg_error_mgr pub;
    std::jmp_buf jump;
};

void on_jpeg_error(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    std::longjmp(err->jump, 1);
}

// Warnings (e.g. premature end of data in a truncated scan) are not printed
void on_jpeg_message(j_common_ptr) {
}

/// @brief Owns a decompress object and its error manager
struct JpegSession {
    jpeg_decompress_struct cinfo{};
    JpegErrorManager err{};
    bool created = false;

    JpegSession() {
        cinfo.err = jpeg_std_error(&err.pub);
        err.pub.error_exit = on_jpeg_error;
        err.pub.output_message = on_jpeg_message;
    }

    ~JpegSession() {
        if (created) {
            jpeg_destroy_decompress(&cinfo);
        }
    }

    JpegSession(const JpegSession&) = delete;
    JpegSession& operator=(const JpegSession&) = delete;
};

// libjpeg reports errors through longjmp. The helpers below are the setjmp
// targets, so nothing with a non-trivial destructor may live in their frames.

bool read_header(JpegSession* session, const uint8_t* data, size_t size) {
    if (setjmp(session->err.jump)) {
        return false;
    }
    jpeg_create_decompress(&session->cinfo);
    session->created = true;
    jpeg_mem_src(&session->cinfo, data, static_cast<unsigned long>(size));
    return jpeg_read_header(&session->cinfo, TRUE) == JPEG_HEADER_OK;
}

bool start_decompress(JpegSession* session, unsigned int scale_denom) {
    if (setjmp(session->err.jump)) {
        return false;
    }
    auto& cinfo = session->cinfo;
    cinfo.out_color_space = JCS_RGB;
    cinfo.scale_num = 1;
    cinfo.scale_denom = scale_denom;
    cinfo.dct_method = scale_denom > 1 ? JDCT_IFAST : JDCT_ISLOW;
    return jpeg_start_decompress(&cinfo) == TRUE;
}

bool read_scanlines(JpegSession* session, uint8_t* pixels, size_t stride) {
    if (setjmp(session->err.jump)) {
        return false;
    }
    auto& cinfo = session->cinfo;
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = pixels + static_cast<size_t>(cinfo.output_scanline) * stride;
        if (jpeg_read_scanlines(&cinfo, &row, 1) != 1) {
            return false;
        }
    }
    jpeg_finish_decompress(&cinfo);
    return true;
}

[[nodiscard]] bool supported_color_space(J_COLOR_SPACE space) noexcept {
    return space == JCS_GRAYSCALE || space == JCS_RGB || space == JCS_YCbCr;
}

}  // namespace

unsigned int chooseJpegScaleDenom(uint32_t source_width, uint32_t source_height,
                                  const DecodeHints& hints) noexcept {
    if (hints.fullResolution() || source_width == 0 || source_height == 0) {
        return 1;
    }

    // Size the final thumbnail will have after fitting into the box
    double fit = std::min({1.0, static_cast<double>(hints.max_width) / source_width,
                           static_cast<double>(hints.max_height) / source_height});
    double needed_w = std::ceil(source_width * fit);
    double needed_h = std::ceil(source_height * fit);

    // libjpeg rounds scaled dimensions up
    for (unsigned int denom : {8u, 4u, 2u}) {
        uint32_t scaled_w = (source_width + denom - 1) / denom;
        uint32_t scaled_h = (source_height + denom - 1) / denom;
        if (scaled_w >= needed_w && scaled_h >= needed_h) {
            return denom;
        }
    }
    return 1;
}

bool JpegDecoder::canDecode(std::span<const uint8_t> data) const noexcept {
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

std::expected<ImageInfo, DecodeError>
JpegDecoder::getInfoFromMemory(std::span<const uint8_t> data) const {
    if (!canDecode(data)) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    JpegSession session;
    if (!read_header(&session, data.data(), data.size())) {
        return std::unexpected(DecodeError::CorruptedData);
    }

    const auto& cinfo = session.cinfo;
    if (cinfo.image_width == 0 || cinfo.image_height == 0 ||
        cinfo.image_width > kMaxImageDimension || cinfo.image_height > kMaxImageDimension) {
        return std::unexpected(DecodeError::CorruptedData);
    }

    return ImageInfo{
        .width = cinfo.image_width,
        .height = cinfo.image_height,
        .format = PixelFormat::RGB24,
        .has_alpha = false,
    };
}

std::expected<DecodedImage, DecodeError>
JpegDecoder::decodeFromMemory(std::span<const uint8_t> data, const DecodeHints& hints) const {
    if (!canDecode(data)) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    JpegSession session;
    if (!read_header(&session, data.data(), data.size())) {
        return std::unexpected(DecodeError::CorruptedData);
    }

    auto& cinfo = session.cinfo;
    if (cinfo.image_width == 0 || cinfo.image_height == 0 ||
        cinfo.image_width > kMaxImageDimension || cinfo.image_height > kMaxImageDimension) {
        return std::unexpected(DecodeError::CorruptedData);
    }
    if (!supported_color_space(cinfo.jpeg_color_space)) {
        // CMYK and YCCK are not converted
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    unsigned int denom = chooseJpegScaleDenom(cinfo.image_width, cinfo.image_height, hints);
    if (!start_decompress(&session, denom)) {
        return std::unexpected(DecodeError::CorruptedData);
    }
    if (cinfo.output_components != 3) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    try {
        DecodedImage image(cinfo.output_width, cinfo.output_height, PixelFormat::RGB24);
        if (!read_scanlines(&session, image.data(), image.stride())) {
            return std::unexpected(DecodeError::CorruptedData);
        }
        return image;
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecodeError::OutOfMemory);
    }
}

}  // namespace lumen::image
