/// @file natural_sort.cpp
/// @brief Natural sorting algorithm implementation

#include "natural_sort.hpp"

#include <cstddef>
#include <cstdint>

namespace laxy::fs {

namespace {

[[nodiscard]] constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr unsigned char fold(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<unsigned char>(c + ('a' - 'A'));
    }
    return static_cast<unsigned char>(c);
}

struct DigitRun {
    std::string_view significant;  // Without leading zeros
    size_t leading_zeros = 0;
    size_t length = 0;
};

[[nodiscard]] DigitRun read_digits(std::string_view str, size_t start) noexcept {
    DigitRun run;
    size_t pos = start;
    while (pos < str.size() && str[pos] == '0') {
        ++run.leading_zeros;
        ++pos;
    }
    size_t digits_start = pos;
    while (pos < str.size() && is_digit(str[pos])) {
        ++pos;
    }
    run.significant = str.substr(digits_start, pos - digits_start);
    run.length = pos - start;
    return run;
}

// Compares arbitrarily long digit runs without overflow
[[nodiscard]] int compare_runs(const DigitRun& a, const DigitRun& b) noexcept {
    if (a.significant.size() != b.significant.size()) {
        return a.significant.size() < b.significant.size() ? -1 : 1;
    }
    if (int cmp = a.significant.compare(b.significant); cmp != 0) {
        return cmp < 0 ? -1 : 1;
    }
    if (a.leading_zeros != b.leading_zeros) {
        return a.leading_zeros < b.leading_zeros ? -1 : 1;
    }
    return 0;
}

}  // namespace

int naturalCompare(std::string_view a, std::string_view b) noexcept {
    size_t i = 0;
    size_t j = 0;

    while (i < a.size() && j < b.size()) {
        char ca = a[i];
        char cb = b[j];

        if (is_digit(ca) && is_digit(cb)) {
            auto run_a = read_digits(a, i);
            auto run_b = read_digits(b, j);
            if (int cmp = compare_runs(run_a, run_b); cmp != 0) {
                return cmp;
            }
            i += run_a.length;
            j += run_b.length;
            continue;
        }

        // Digits sort before everything else
        if (is_digit(ca) != is_digit(cb)) {
            return is_digit(ca) ? -1 : 1;
        }

        auto fa = fold(ca);
        auto fb = fold(cb);
        if (fa != fb) {
            return fa < fb ? -1 : 1;
        }

        ++i;
        ++j;
    }

    if (a.size() - i != b.size() - j) {
        return (a.size() - i) < (b.size() - j) ? -1 : 1;
    }

    // Case-only differences: fall back to byte order for a stable total order
    if (int cmp = a.compare(b); cmp != 0) {
        return cmp < 0 ? -1 : 1;
    }
    return 0;
}

}  // namespace laxy::fs
