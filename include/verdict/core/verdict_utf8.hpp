#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Verdict {

/**
 * @brief Counts the Unicode code points in a UTF-8 string.
 *
 * Well-formed sequences count once regardless of their byte width. Every byte
 * that does not start a well-formed sequence (stray continuation bytes,
 * overlong encodings, surrogates, truncated sequences) counts as one code
 * point on its own, so the count never exceeds the byte length.
 *
 * @param s The UTF-8 text.
 * @return std::size_t The number of code points.
 */
[[nodiscard]] constexpr std::size_t CountCodePoints(
    std::string_view s) noexcept {
    const auto continuation = [](uint8_t b) noexcept {
        return b >= 0x80 && b <= 0xBF;
    };

    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<uint8_t>(s[i]);
        const std::size_t left = s.size() - i;
        count++;

        if (lead < 0x80) {
            i += 1;
            continue;
        }

        // Range allowed for the second byte, per lead byte. Narrower ranges
        // reject overlong forms, surrogates and code points above U+10FFFF.
        std::size_t width = 0;
        uint8_t lo = 0x80;
        uint8_t hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            width = 2;
        } else if (lead == 0xE0) {
            width = 3;
            lo = 0xA0;
        } else if (lead == 0xED) {
            width = 3;
            hi = 0x9F;
        } else if (lead >= 0xE1 && lead <= 0xEF) {
            width = 3;
        } else if (lead == 0xF0) {
            width = 4;
            lo = 0x90;
        } else if (lead == 0xF4) {
            width = 4;
            hi = 0x8F;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            width = 4;
        }

        if (width == 0 || left < width) {
            i += 1;
            continue;
        }

        const auto second = static_cast<uint8_t>(s[i + 1]);
        bool valid = second >= lo && second <= hi;
        for (std::size_t k = 2; valid && k < width; ++k) {
            valid = continuation(static_cast<uint8_t>(s[i + k]));
        }
        i += valid ? width : 1;
    }
    return count;
}

}  // namespace Verdict
