#pragma once

#include <cstdint>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <string_view>
#include <variant>

namespace Verdict {

/**
 * @brief Error codes representing every way a rule can reject a value.
 *
 * The first six codes are sentinels and carry no payload. LengthMismatch,
 * BelowMinimum and AboveMaximum carry the expected bound and the observed
 * value. PatternMismatch carries the offending pattern.
 */
enum class ErrorCode : uint8_t {
    ZeroValue = 0,    ///< Absent/invalid value.
    ZeroValueEmpty,   ///< Empty string, null reference or empty collection.
    ZeroValueNumber,  ///< Numeric zero.
    ZeroValueBool,    ///< Boolean false.
    BadParameter,     ///< Rule parameter is malformed.
    Unsupported,      ///< Rule does not apply to this kind of value.
    LengthMismatch,   ///< Size differs from the expected length.
    BelowMinimum,     ///< Value (or size) is below the minimum.
    AboveMaximum,     ///< Value (or size) is above the maximum.
    PatternMismatch,  ///< String does not match the regular expression.
};

/**
 * @brief Value domain a comparison error was produced in.
 *
 * Only used to render the message; callers classifying errors should match
 * on the ErrorCode.
 */
enum class Domain : uint8_t {
    None = 0,
    String,      ///< Size is a code-point count.
    Collection,  ///< Size is an element count.
    Integer,     ///< Signed or unsigned integer value.
    Float,       ///< Floating-point value.
};

/**
 * @brief Expected bound and observed value of a failed comparison.
 */
template <typename T>
struct Bounds {
    T expected;
    T actual;

    [[nodiscard]] constexpr bool operator==(const Bounds&) const noexcept =
        default;
};

/**
 * @brief Represents a rule violation or a misapplied rule.
 *
 * Immutable once built; construct through the named factories.
 */
struct Error {
    ErrorCode code;
    Domain domain{Domain::None};
    std::variant<std::monostate, Bounds<int64_t>, Bounds<double>, std::string>
        detail{};

    [[nodiscard]] static Error zero_value() noexcept {
        return {ErrorCode::ZeroValue};
    }

    [[nodiscard]] static Error zero_value_empty() noexcept {
        return {ErrorCode::ZeroValueEmpty};
    }

    [[nodiscard]] static Error zero_value_number() noexcept {
        return {ErrorCode::ZeroValueNumber};
    }

    [[nodiscard]] static Error zero_value_bool() noexcept {
        return {ErrorCode::ZeroValueBool};
    }

    [[nodiscard]] static Error bad_parameter() noexcept {
        return {ErrorCode::BadParameter};
    }

    [[nodiscard]] static Error unsupported() noexcept {
        return {ErrorCode::Unsupported};
    }

    /**
     * @brief Creates a length mismatch for sizes or integer values.
     * @param domain String, Collection or Integer.
     * @param expected The length named by the rule parameter.
     * @param actual The observed length.
     */
    [[nodiscard]] static Error length_mismatch(Domain domain,
                                               int64_t expected,
                                               int64_t actual) noexcept {
        return {ErrorCode::LengthMismatch, domain,
                Bounds<int64_t>{expected, actual}};
    }

    [[nodiscard]] static Error length_mismatch(double expected,
                                               double actual) noexcept {
        return {ErrorCode::LengthMismatch, Domain::Float,
                Bounds<double>{expected, actual}};
    }

    [[nodiscard]] static Error below_minimum(Domain domain, int64_t expected,
                                             int64_t actual) noexcept {
        return {ErrorCode::BelowMinimum, domain,
                Bounds<int64_t>{expected, actual}};
    }

    [[nodiscard]] static Error below_minimum(double expected,
                                             double actual) noexcept {
        return {ErrorCode::BelowMinimum, Domain::Float,
                Bounds<double>{expected, actual}};
    }

    [[nodiscard]] static Error above_maximum(Domain domain, int64_t expected,
                                             int64_t actual) noexcept {
        return {ErrorCode::AboveMaximum, domain,
                Bounds<int64_t>{expected, actual}};
    }

    [[nodiscard]] static Error above_maximum(double expected,
                                             double actual) noexcept {
        return {ErrorCode::AboveMaximum, Domain::Float,
                Bounds<double>{expected, actual}};
    }

    /**
     * @brief Creates a pattern mismatch.
     * @param pattern The regular expression the value failed to match.
     */
    [[nodiscard]] static Error pattern_mismatch(std::string_view pattern) {
        return {ErrorCode::PatternMismatch, Domain::String,
                std::string{pattern}};
    }

    /**
     * @brief Integer bounds of a comparison error, or nullptr.
     */
    [[nodiscard]] const Bounds<int64_t>* int_bounds() const noexcept {
        return std::get_if<Bounds<int64_t>>(&detail);
    }

    /**
     * @brief Float bounds of a comparison error, or nullptr.
     */
    [[nodiscard]] const Bounds<double>* float_bounds() const noexcept {
        return std::get_if<Bounds<double>>(&detail);
    }

    /**
     * @brief Pattern text of a PatternMismatch, empty otherwise.
     */
    [[nodiscard]] std::string_view pattern() const noexcept {
        if (const auto* p = std::get_if<std::string>(&detail)) {
            return *p;
        }
        return {};
    }

    /**
     * @brief True for the four zero-value variants.
     */
    [[nodiscard]] constexpr bool is_zero_value() const noexcept {
        return code == ErrorCode::ZeroValue ||
               code == ErrorCode::ZeroValueEmpty ||
               code == ErrorCode::ZeroValueNumber ||
               code == ErrorCode::ZeroValueBool;
    }

    /**
     * @brief True when a length, minimum or maximum check failed, whatever
     * the domain.
     */
    [[nodiscard]] constexpr bool is_bound_violation() const noexcept {
        return code == ErrorCode::LengthMismatch ||
               code == ErrorCode::BelowMinimum ||
               code == ErrorCode::AboveMaximum;
    }

    /**
     * @brief True when the rule itself is misapplied (malformed parameter or
     * a kind the rule cannot handle).
     *
     * These point at a bug in rule setup. Every other code is feedback about
     * the value.
     */
    [[nodiscard]] constexpr bool is_configuration_error() const noexcept {
        return code == ErrorCode::BadParameter ||
               code == ErrorCode::Unsupported;
    }

    /**
     * @brief Renders the human-readable description of the error.
     */
    [[nodiscard]] std::string message() const {
        switch (code) {
            case ErrorCode::ZeroValue:
                return "zero value";
            case ErrorCode::ZeroValueEmpty:
                return "zero value: empty";
            case ErrorCode::ZeroValueNumber:
                return "zero value: number is zero";
            case ErrorCode::ZeroValueBool:
                return "zero value: boolean is false";
            case ErrorCode::BadParameter:
                return "bad parameter";
            case ErrorCode::Unsupported:
                return "unsupported type";
            case ErrorCode::LengthMismatch:
                return render_bounds("invalid length, expected");
            case ErrorCode::BelowMinimum:
                return render_bounds("less than min, expected at least");
            case ErrorCode::AboveMaximum:
                return render_bounds("greater than max, expected at most");
            case ErrorCode::PatternMismatch:
                return fmt::format("regular expression mismatch, pattern `{}`",
                                   pattern());
        }
        return "unknown error";
    }

    [[nodiscard]] bool operator==(const Error& other) const = default;

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] constexpr bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }

   private:
    [[nodiscard]] std::string render_bounds(std::string_view lead) const {
        std::string_view unit;
        if (domain == Domain::String) {
            unit = " characters";
        } else if (domain == Domain::Collection) {
            unit = " items";
        }
        if (const auto* b = int_bounds()) {
            return fmt::format("{} {}{} but got {}", lead, b->expected, unit,
                               b->actual);
        }
        if (const auto* b = float_bounds()) {
            return fmt::format("{} {} but got {}", lead, b->expected,
                               b->actual);
        }
        return std::string{lead.substr(0, lead.find(','))};
    }
};

}  // namespace Verdict

/**
 * @brief Lets an Error be passed straight to fmt::format and spdlog.
 */
template <>
struct fmt::formatter<Verdict::Error> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const Verdict::Error& err, FormatContext& ctx) const {
        const std::string text = err.message();
        return fmt::formatter<std::string_view>::format(text, ctx);
    }
};
