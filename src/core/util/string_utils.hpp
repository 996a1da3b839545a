/// @file string_utils.hpp
/// @brief String conversion and manipulation utilities
///
/// Paths are carried as UTF-8 strings wherever they leave the filesystem
/// layer (store keys, wire format, log output).

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace lumen {

/// @brief Convert filesystem path to UTF-8 string
[[nodiscard]] std::string pathToUtf8(const std::filesystem::path& path);

/// @brief Convert UTF-8 string to filesystem path
[[nodiscard]] std::filesystem::path utf8ToPath(std::string_view utf8);

/// @brief Make string lowercase (ASCII only)
[[nodiscard]] std::string toLowercaseAscii(std::string_view str);

/// @brief Compare two strings ignoring ASCII case
[[nodiscard]] bool equalsIcase(std::string_view a, std::string_view b) noexcept;

/// @brief Check if string ends with suffix (case-insensitive, ASCII)
[[nodiscard]] bool endsWithIcase(std::string_view str, std::string_view suffix) noexcept;

}  // namespace lumen
