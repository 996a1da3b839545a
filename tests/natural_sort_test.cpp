#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "core/fs/natural_sort.hpp"

using lumen::fs::naturalCompare;

TEST_CASE("naturalCompare", "[NaturalSort]") {
    SECTION("Numbers compare by value") {
        CHECK(naturalCompare("img2.png", "img10.png") < 0);
        CHECK(naturalCompare("img10.png", "img2.png") > 0);
        CHECK(naturalCompare("img10.png", "img10.png") == 0);
    }

    SECTION("Letters compare case-insensitively") {
        CHECK(naturalCompare("Apple.jpg", "banana.jpg") < 0);
        CHECK(naturalCompare("apple.jpg", "Banana.jpg") < 0);
    }

    SECTION("Sorting a listing") {
        std::vector<std::string> names{"p10.jpg", "p1.jpg", "P3.jpg", "p02.jpg"};
        std::sort(names.begin(), names.end(),
                  [](const std::string& a, const std::string& b) { return naturalCompare(a, b) < 0; });
        CHECK(names == std::vector<std::string>{"p1.jpg", "p02.jpg", "P3.jpg", "p10.jpg"});
    }
}

TEST_CASE("FilenameOrder ignores parent folders", "[NaturalSort]") {
    lumen::fs::FilenameOrder less;
    CHECK(less(std::filesystem::path("/z/shot9.png"), std::filesystem::path("/a/shot10.png")));
    CHECK_FALSE(less(std::filesystem::path("/a/shot10.png"), std::filesystem::path("/z/shot9.png")));
}
