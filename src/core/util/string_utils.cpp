/// @file string_utils.cpp
/// @brief String utilities implementation

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace lumen {

namespace {

[[nodiscard]] bool icase_char_equal(unsigned char a, unsigned char b) noexcept {
    return std::tolower(a) == std::tolower(b);
}

}  // namespace

std::string pathToUtf8(const std::filesystem::path& path) {
    auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}

std::filesystem::path utf8ToPath(std::string_view utf8) {
    return std::filesystem::path(std::u8string(utf8.begin(), utf8.end()));
}

std::string toLowercaseAscii(std::string_view str) {
    std::string result(str);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool equalsIcase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::ranges::equal(a, b, icase_char_equal);
}

bool endsWithIcase(std::string_view str, std::string_view suffix) noexcept {
    if (str.size() < suffix.size()) {
        return false;
    }
    return std::ranges::equal(str.substr(str.size() - suffix.size()), suffix, icase_char_equal);
}

}  // namespace lumen
