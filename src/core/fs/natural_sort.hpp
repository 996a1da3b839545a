/// @file natural_sort.hpp
/// @brief Natural sorting algorithm for filenames
///
/// Natural sort orders strings with embedded numbers in a human-friendly way:
/// "file1", "file2", "file10" instead of "file1", "file10", "file2"

#pragma once

#include <filesystem>
#include <string_view>

namespace lumen::fs {

/// @brief Three-way natural comparison of two UTF-8 names
///
/// ASCII letters compare case-insensitively and digit runs compare by value,
/// so "IMG_2" sorts before "img_10". Equal values with more leading zeros
/// sort later.
[[nodiscard]] int naturalCompare(std::string_view a, std::string_view b) noexcept;

/// @brief Orders paths by file name only, using naturalCompare
struct FilenameOrder {
    [[nodiscard]] bool operator()(const std::filesystem::path& a,
                                  const std::filesystem::path& b) const {
        return naturalCompare(a.filename().string(), b.filename().string()) < 0;
    }
};

}  // namespace lumen::fs
