/// @file file_metadata.hpp
/// @brief File stat values used for cache validation

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace lumen::fs {

/// @brief Filesystem errors
enum class FsError {
    NotFound,
    AccessDenied,
    NotADirectory,
    IoError,
};

/// @brief Convert error to string
[[nodiscard]] constexpr std::string_view to_string(FsError error) noexcept {
    switch (error) {
    case FsError::NotFound:
        return "Not found";
    case FsError::AccessDenied:
        return "Access denied";
    case FsError::NotADirectory:
        return "Not a directory";
    case FsError::IoError:
        return "I/O error";
    }
    return "Unknown filesystem error";
}

/// @brief The two stat values a cache row is validated against
struct FileStat {
    int64_t mtime_ms = 0;  // Modification time, milliseconds since the Unix epoch
    int64_t size = 0;      // Size in bytes

    [[nodiscard]] bool operator==(const FileStat&) const = default;
};

/// @brief Stat a regular file
/// @param path File path
/// @return Stat values or error (NotFound also for non-regular files)
[[nodiscard]] std::expected<FileStat, FsError> statFile(const std::filesystem::path& path);

/// @brief Check for a supported image extension
/// @param ext Extension including the dot, any case (".JPG")
[[nodiscard]] bool isImageExtension(std::string_view ext) noexcept;

/// @brief Check whether the path names an image by its extension
[[nodiscard]] bool isImagePath(const std::filesystem::path& path);

/// @brief Map an errno value to FsError
[[nodiscard]] FsError errnoToFsError(int error_number) noexcept;

}  // namespace lumen::fs
