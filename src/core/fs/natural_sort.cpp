/// @file natural_sort.cpp
/// @brief Natural sorting algorithm implementation

#include "natural_sort.hpp"

#include <cstdint>

namespace lumen::fs {

namespace {

[[nodiscard]] constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr char to_lower(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return c;
}

struct NumberInfo {
    uint64_t value;
    size_t length;
    size_t leading_zeros;
};

[[nodiscard]] NumberInfo parse_number(std::string_view str, size_t start) noexcept {
    NumberInfo info{0, 0, 0};

    size_t pos = start;
    while (pos < str.size() && str[pos] == '0') {
        ++info.leading_zeros;
        ++pos;
    }

    while (pos < str.size() && is_digit(str[pos])) {
        // Saturate instead of overflowing
        if (info.value > (UINT64_MAX - 9) / 10) {
            info.value = UINT64_MAX;
        } else {
            info.value = info.value * 10 + static_cast<uint64_t>(str[pos] - '0');
        }
        ++pos;
    }

    info.length = pos - start;
    return info;
}

}  // namespace

int naturalCompare(std::string_view a, std::string_view b) noexcept {
    size_t i = 0;
    size_t j = 0;

    while (i < a.size() && j < b.size()) {
        char ca = a[i];
        char cb = b[j];

        if (is_digit(ca) && is_digit(cb)) {
            auto num_a = parse_number(a, i);
            auto num_b = parse_number(b, j);

            if (num_a.value != num_b.value) {
                return (num_a.value < num_b.value) ? -1 : 1;
            }

            // "01" < "001"
            if (num_a.leading_zeros != num_b.leading_zeros) {
                return (num_a.leading_zeros < num_b.leading_zeros) ? -1 : 1;
            }

            i += num_a.length;
            j += num_b.length;
            continue;
        }

        // Digits come before non-digits
        if (is_digit(ca) != is_digit(cb)) {
            return is_digit(ca) ? -1 : 1;
        }

        char lower_a = to_lower(ca);
        char lower_b = to_lower(cb);
        if (lower_a != lower_b) {
            return (static_cast<unsigned char>(lower_a) < static_cast<unsigned char>(lower_b))
                       ? -1
                       : 1;
        }

        ++i;
        ++j;
    }

    if (a.size() - i != b.size() - j) {
        return (a.size() - i < b.size() - j) ? -1 : 1;
    }
    return 0;
}

}  // namespace lumen::fs
