#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <verdict/core/verdict_types.hpp>

/**
 * @brief Coercion of textual rule parameters into numbers.
 *
 * Integers accept an optional sign (signed parsing only), a base prefix
 * (0x, 0o, 0b, or a bare leading 0 for octal) and underscores between
 * digits. Floats accept decimal and hexadecimal (p-exponent) literals plus
 * inf, infinity and nan. Any failure, including overflow, is reported as
 * Error::bad_parameter().
 */
namespace Verdict::params {

/// @cond INTERNAL
namespace detail {

constexpr char Lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

constexpr bool IEquals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (Lower(a[i]) != Lower(b[i])) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Checks that every underscore in an unsigned literal sits between
 * digits, or between a base prefix and a digit.
 */
constexpr bool UnderscoresOk(std::string_view s) noexcept {
    // '^' start, '0' digit or prefix, '_' underscore, '!' anything else.
    char saw = '^';
    std::size_t i = 0;
    bool hex = false;
    if (s.size() >= 2 && s[0] == '0' &&
        (Lower(s[1]) == 'b' || Lower(s[1]) == 'o' || Lower(s[1]) == 'x')) {
        i = 2;
        saw = '0';
        hex = Lower(s[1]) == 'x';
    }
    for (; i < s.size(); ++i) {
        const char c = Lower(s[i]);
        if ((c >= '0' && c <= '9') || (hex && c >= 'a' && c <= 'f')) {
            saw = '0';
            continue;
        }
        if (c == '_') {
            if (saw != '0') {
                return false;
            }
            saw = '_';
            continue;
        }
        if (saw == '_') {
            return false;
        }
        saw = '!';
    }
    return saw != '_';
}

/**
 * @brief Validates digit separators and returns the text without them.
 */
inline std::expected<std::string, Error> StripUnderscores(
    std::string_view s) {
    if (s.find('_') == std::string_view::npos) {
        return std::string{s};
    }
    if (!UnderscoresOk(s)) {
        return std::unexpected(Error::bad_parameter());
    }
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (c != '_') {
            out.push_back(c);
        }
    }
    return out;
}

/**
 * @brief Tells an out-of-range float literal that is too small apart from one
 * that is too large.
 *
 * Estimates the magnitude from the position of the first significant digit
 * and the exponent. Out-of-range literals are hundreds of orders of magnitude
 * away from 1, so the estimate only needs the right sign.
 *
 * @param text Unsigned literal without underscores or hex prefix.
 * @param hex True for a hex mantissa with a binary exponent.
 */
constexpr bool Underflows(std::string_view text, bool hex) noexcept {
    const char marker = hex ? 'p' : 'e';
    int64_t lead = 0;
    bool point = false;
    bool significant = false;
    std::size_t i = 0;
    for (; i < text.size() && Lower(text[i]) != marker; ++i) {
        if (text[i] == '.') {
            point = true;
        } else if (!significant && text[i] == '0') {
            lead -= point ? 1 : 0;
        } else {
            significant = true;
            lead += point ? 0 : 1;
        }
    }

    int64_t exponent = 0;
    bool negative = false;
    if (i < text.size()) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            negative = text[i] == '-';
            ++i;
        }
        for (; i < text.size(); ++i) {
            // Saturate; anything this large is out of range either way.
            if (exponent < 1'000'000) {
                exponent = exponent * 10 + (text[i] - '0');
            }
        }
    }
    if (negative) {
        exponent = -exponent;
    }
    return (hex ? lead * 4 : lead) + exponent <= 0;
}

/**
 * @brief Parses an unsigned literal with optional base prefix.
 */
inline std::expected<uint64_t, Error> ParseMagnitude(std::string_view s) {
    if (s.empty()) {
        return std::unexpected(Error::bad_parameter());
    }
    auto stripped = StripUnderscores(s);
    if (!stripped) {
        return std::unexpected(stripped.error());
    }
    std::string_view digits{*stripped};

    int base = 10;
    if (digits.size() > 1 && digits[0] == '0') {
        switch (Lower(digits[1])) {
            case 'x':
                base = 16;
                digits.remove_prefix(2);
                break;
            case 'o':
                base = 8;
                digits.remove_prefix(2);
                break;
            case 'b':
                base = 2;
                digits.remove_prefix(2);
                break;
            default:
                base = 8;
                digits.remove_prefix(1);
                break;
        }
    }

    uint64_t value = 0;
    const char* end = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(Error::bad_parameter());
    }
    return value;
}

}  // namespace detail
/// @endcond

/**
 * @brief Parses a parameter as a signed 64-bit integer.
 *
 * @param param The rule parameter, e.g. "10", "-0x1F", "1_000".
 * @return The value, or Error::bad_parameter().
 */
[[nodiscard]] inline std::expected<int64_t, Error> ParseInt(
    std::string_view param) {
    bool negative = false;
    if (!param.empty() && (param[0] == '+' || param[0] == '-')) {
        negative = param[0] == '-';
        param.remove_prefix(1);
    }

    auto magnitude = detail::ParseMagnitude(param);
    if (!magnitude) {
        return std::unexpected(magnitude.error());
    }

    constexpr auto max = static_cast<uint64_t>(
        std::numeric_limits<int64_t>::max());
    if (negative) {
        if (*magnitude > max + 1) {
            return std::unexpected(Error::bad_parameter());
        }
        if (*magnitude == max + 1) {
            return std::numeric_limits<int64_t>::min();
        }
        return -static_cast<int64_t>(*magnitude);
    }
    if (*magnitude > max) {
        return std::unexpected(Error::bad_parameter());
    }
    return static_cast<int64_t>(*magnitude);
}

/**
 * @brief Parses a parameter as an unsigned 64-bit integer.
 *
 * No sign is accepted, so "-1" and "+1" are both bad parameters.
 */
[[nodiscard]] inline std::expected<uint64_t, Error> ParseUint(
    std::string_view param) {
    return detail::ParseMagnitude(param);
}

/**
 * @brief Parses a parameter as a 64-bit float.
 *
 * @param param The rule parameter, e.g. "1.5", "-2e3", "0x1p-2", "Inf".
 * @return The value, or Error::bad_parameter().
 */
[[nodiscard]] inline std::expected<double, Error> ParseFloat(
    std::string_view param) {
    bool negative = false;
    bool has_sign = false;
    if (!param.empty() && (param[0] == '+' || param[0] == '-')) {
        negative = param[0] == '-';
        has_sign = true;
        param.remove_prefix(1);
    }
    if (param.empty()) {
        return std::unexpected(Error::bad_parameter());
    }

    const double sign = negative ? -1.0 : 1.0;
    if (detail::IEquals(param, "inf") || detail::IEquals(param, "infinity")) {
        return sign * std::numeric_limits<double>::infinity();
    }
    if (detail::IEquals(param, "nan")) {
        if (has_sign) {
            return std::unexpected(Error::bad_parameter());
        }
        return std::numeric_limits<double>::quiet_NaN();
    }

    auto stripped = detail::StripUnderscores(param);
    if (!stripped) {
        return std::unexpected(stripped.error());
    }
    std::string_view text{*stripped};

    auto format = std::chars_format::general;
    if (text.size() > 2 && text[0] == '0' && detail::Lower(text[1]) == 'x') {
        text.remove_prefix(2);
        // Hexadecimal mantissas need a binary exponent.
        if (text.find_first_of("pP") == std::string_view::npos) {
            return std::unexpected(Error::bad_parameter());
        }
        format = std::chars_format::hex;
    }
    // from_chars also takes a '-' sign and nan(...) payloads; neither is
    // valid here.
    const bool hex = format == std::chars_format::hex;
    if (text.empty() ||
        !(std::isdigit(static_cast<unsigned char>(text[0])) ||
          text[0] == '.' ||
          (hex && std::isxdigit(static_cast<unsigned char>(text[0]))))) {
        return std::unexpected(Error::bad_parameter());
    }

    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value, format);
    if (ptr != end) {
        return std::unexpected(Error::bad_parameter());
    }
    if (ec == std::errc::result_out_of_range &&
        detail::Underflows(text, hex)) {
        // Too small to represent: rounds to zero.
        return sign * 0.0;
    }
    if (ec != std::errc{}) {
        return std::unexpected(Error::bad_parameter());
    }
    return sign * value;
}

}  // namespace Verdict::params
