/// @file file_metadata.cpp
/// @brief File metadata implementation

#include "file_metadata.hpp"

#include <sys/stat.h>

#include <array>
#include <cerrno>

#include "../util/string_utils.hpp"

namespace lumen::fs {

namespace {

// Keep in step with the decoders registered in image::Decoder
constexpr std::array<std::string_view, 3> kImageExtensions = {".jpg", ".jpeg", ".png"};

}  // namespace

FsError errnoToFsError(int error_number) noexcept {
    switch (error_number) {
    case ENOENT:
        return FsError::NotFound;
    case EACCES:
    case EPERM:
        return FsError::AccessDenied;
    case ENOTDIR:
        return FsError::NotADirectory;
    default:
        return FsError::IoError;
    }
}

std::expected<FileStat, FsError> statFile(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return std::unexpected(errnoToFsError(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(FsError::NotFound);
    }

    int64_t mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 +
                       static_cast<int64_t>(st.st_mtim.tv_nsec);
    return FileStat{
        .mtime_ms = mtime_ns / 1'000'000,
        .size = static_cast<int64_t>(st.st_size),
    };
}

bool isImageExtension(std::string_view ext) noexcept {
    for (auto known : kImageExtensions) {
        if (equalsIcase(ext, known)) {
            return true;
        }
    }
    return false;
}

bool isImagePath(const std::filesystem::path& path) {
    return isImageExtension(path.extension().string());
}

}  // namespace lumen::fs
