/// @file directory.hpp
/// @brief Directory scanning and file listing

#pragma once

#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "file_metadata.hpp"

namespace lumen::fs {

/// @brief Filter options for directory scanning
struct DirectoryFilter {
    bool include_hidden = false;
    bool images_only = true;

    /// Entries for which this returns true are skipped (e.g. store artifacts)
    std::function<bool(const std::filesystem::path&)> exclude;
};

/// @brief One regular file found by a scan, with the stat taken during the scan
struct DirectoryEntry {
    std::filesystem::path path;
    FileStat stat;
};

/// @brief Scan a directory (non-recursive) and return its regular files
/// @param path Directory path
/// @param filter Filter options
/// @return Entries in natural filename order, or error
[[nodiscard]] std::expected<std::vector<DirectoryEntry>, FsError>
scanDirectory(const std::filesystem::path& path, const DirectoryFilter& filter = {});

}  // namespace lumen::fs
