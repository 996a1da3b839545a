/// @file directory.cpp
/// @brief Directory scanning implementation

#include "directory.hpp"

#include <algorithm>
#include <system_error>

#include "../util/logger.hpp"
#include "../util/string_utils.hpp"
#include "natural_sort.hpp"

namespace lumen::fs {

namespace {

[[nodiscard]] FsError error_code_to_fs_error(const std::error_code& ec) noexcept {
    if (ec == std::errc::no_such_file_or_directory) {
        return FsError::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return FsError::AccessDenied;
    }
    if (ec == std::errc::not_a_directory) {
        return FsError::NotADirectory;
    }
    return FsError::IoError;
}

[[nodiscard]] bool passes_filter(const std::filesystem::path& path,
                                 const DirectoryFilter& filter) {
    auto name = path.filename().string();
    if (!filter.include_hidden && !name.empty() && name.front() == '.') {
        return false;
    }
    if (filter.images_only && !isImagePath(path)) {
        return false;
    }
    if (filter.exclude && filter.exclude(path)) {
        return false;
    }
    return true;
}

}  // namespace

std::expected<std::vector<DirectoryEntry>, FsError>
scanDirectory(const std::filesystem::path& path, const DirectoryFilter& filter) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        if (ec) {
            return std::unexpected(error_code_to_fs_error(ec));
        }
        return std::unexpected(std::filesystem::exists(path, ec) ? FsError::NotADirectory
                                                                 : FsError::NotFound);
    }

    std::vector<DirectoryEntry> entries;
    std::filesystem::directory_iterator it(path, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& dir_entry = *it;
        std::error_code type_ec;
        if (!dir_entry.is_regular_file(type_ec)) {
            continue;
        }
        const auto& entry_path = dir_entry.path();
        if (!passes_filter(entry_path, filter)) {
            continue;
        }

        // A file removed between listing and stat is simply skipped
        auto stat = statFile(entry_path);
        if (!stat) {
            LOG_DEBUG("scanDirectory: skipping {}: {}", pathToUtf8(entry_path),
                      to_string(stat.error()));
            continue;
        }
        entries.push_back(DirectoryEntry{.path = entry_path, .stat = *stat});
    }
    if (ec) {
        LOG_WARN("scanDirectory: {} failed: {}", pathToUtf8(path), ec.message());
        return std::unexpected(error_code_to_fs_error(ec));
    }

    std::ranges::sort(entries, FilenameOrder{}, &DirectoryEntry::path);

    return entries;
}

}  // namespace lumen::fs
