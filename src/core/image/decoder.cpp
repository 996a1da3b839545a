/// @file decoder.cpp
/// @brief Decoder facade implementation

#include "decoder.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <new>

#include "image_scaler.hpp"
#include "jpeg_decoder.hpp"
#include "png_codec.hpp"

namespace lumen::image {

namespace {

// Input files larger than this are rejected before allocation
constexpr off_t kMaxFileBytes = off_t{1} << 31;

[[nodiscard]] DecodeError errno_to_decode_error(int error_number) noexcept {
    switch (error_number) {
    case ENOENT:
    case ENOTDIR:
        return DecodeError::FileNotFound;
    case EACCES:
    case EPERM:
        return DecodeError::AccessDenied;
    case ENOMEM:
        return DecodeError::OutOfMemory;
    default:
        return DecodeError::InternalError;
    }
}

/// @brief Closes a file descriptor on scope exit
class FdGuard {
public:
    explicit FdGuard(int fd) noexcept : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

private:
    int fd_;
};

[[nodiscard]] DecodeHints to_hints(std::optional<TargetSize> target) noexcept {
    if (!target) {
        return {};
    }
    return DecodeHints{.max_width = target->width, .max_height = target->height};
}

}  // namespace

std::expected<std::vector<uint8_t>, DecodeError> readFileBytes(const std::filesystem::path& path) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        return std::unexpected(errno_to_decode_error(errno));
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        return std::unexpected(errno_to_decode_error(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(DecodeError::FileNotFound);
    }
    if (st.st_size > kMaxFileBytes) {
        return std::unexpected(DecodeError::OutOfMemory);
    }

    try {
        std::vector<uint8_t> bytes(static_cast<size_t>(st.st_size));
        size_t offset = 0;
        while (offset < bytes.size()) {
            ssize_t n = ::read(fd.get(), bytes.data() + offset, bytes.size() - offset);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(errno_to_decode_error(errno));
            }
            if (n == 0) {
                // File shrank while reading
                bytes.resize(offset);
                break;
            }
            offset += static_cast<size_t>(n);
        }
        return bytes;
    } catch (const std::bad_alloc&) {
        return std::unexpected(DecodeError::OutOfMemory);
    }
}

Decoder::Decoder() {
    decoders_.push_back(std::make_unique<JpegDecoder>());
    decoders_.push_back(std::make_unique<PngDecoder>());
}

Decoder::~Decoder() = default;
Decoder::Decoder(Decoder&&) noexcept = default;
Decoder& Decoder::operator=(Decoder&&) noexcept = default;

const IImageDecoder* Decoder::findDecoder(std::span<const uint8_t> header) const noexcept {
    for (const auto& decoder : decoders_) {
        if (decoder->canDecode(header)) {
            return decoder.get();
        }
    }
    return nullptr;
}

std::expected<DecodedImage, DecodeError> Decoder::decodeMemory(std::span<const uint8_t> data,
                                                               std::optional<TargetSize> target) const {
    const IImageDecoder* decoder = findDecoder(data);
    if (!decoder) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    auto decoded = decoder->decodeFromMemory(data, to_hints(target));
    if (!decoded || !target) {
        return decoded;
    }

    auto [width, height] = calculateScaledDimensions(decoded->width(), decoded->height(),
                                                     target->width, target->height,
                                                     FitMode::ScaleDown);
    if (width == decoded->width() && height == decoded->height()) {
        return decoded;
    }
    return scaleImage(*decoded, width, height);
}

std::expected<DecodedImage, DecodeError> Decoder::decode(const std::filesystem::path& path,
                                                         std::optional<TargetSize> target) const {
    auto bytes = readFileBytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return decodeMemory(*bytes, target);
}

std::expected<EncodedImage, DecodeError>
Decoder::decodeToEncodedBytes(const std::filesystem::path& path,
                              std::optional<TargetSize> target) const {
    auto bytes = readFileBytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    const IImageDecoder* decoder = findDecoder(*bytes);
    if (!decoder) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }

    // Source dimensions come from the header: a scaled JPEG decode is smaller
    auto info = decoder->getInfoFromMemory(*bytes);
    if (!info) {
        return std::unexpected(info.error());
    }

    auto decoded = decoder->decodeFromMemory(*bytes, to_hints(target));
    if (!decoded) {
        return std::unexpected(decoded.error());
    }

    std::expected<DecodedImage, DecodeError> prepared =
        target ? generateThumbnail(*decoded, target->width, target->height)
               : std::expected<DecodedImage, DecodeError>(std::move(*decoded));
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    auto png = encodePng(*prepared);
    if (!png) {
        return std::unexpected(png.error());
    }

    return EncodedImage{
        .bytes = std::move(*png),
        .width = prepared->width(),
        .height = prepared->height(),
        .source_width = info->width,
        .source_height = info->height,
    };
}

std::expected<ImageInfo, DecodeError> Decoder::probe(const std::filesystem::path& path) const {
    auto bytes = readFileBytes(path);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    const IImageDecoder* decoder = findDecoder(*bytes);
    if (!decoder) {
        return std::unexpected(DecodeError::UnsupportedFormat);
    }
    return decoder->getInfoFromMemory(*bytes);
}

}  // namespace lumen::image
