/// @file test_support.hpp
/// @brief Shared helpers for the unit tests

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "core/image/decoded_image.hpp"

namespace lumen::test {

/// @brief A fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

/// @brief RGBA gradient with a half transparent right half
[[nodiscard]] image::DecodedImage makeGradient(uint32_t width, uint32_t height);

/// @brief Write a gradient PNG
void writePng(const std::filesystem::path& path, uint32_t width, uint32_t height);

/// @brief Write a gradient JPEG through libjpeg
void writeJpeg(const std::filesystem::path& path, uint32_t width, uint32_t height,
               int quality = 90);

void writeBytes(const std::filesystem::path& path, const std::string& bytes);

/// @brief Poll until the predicate holds or the timeout elapses
[[nodiscard]] bool waitFor(const std::function<bool()>& predicate,
                           std::chrono::milliseconds timeout = std::chrono::seconds(10));

}  // namespace lumen::test
