#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>
#include <verdict/core/verdict_types.hpp>
#include <verdict/core/verdict_utf8.hpp>
#include <verdict/core/verdict_value.hpp>
#include <verdict/params/verdict_params.hpp>

/**
 * @brief Internal implementation details shared by the bound rules.
 */
namespace Verdict::detail {

/**
 * @brief Comparison policy for the `len` rule.
 */
struct ExactBound {
    // cppcheck-suppress unusedStructMember
    static constexpr std::string_view rule = "len";

    template <typename T>
    [[nodiscard]] static constexpr bool violates(T actual,
                                                 T expected) noexcept {
        return actual != expected;
    }

    [[nodiscard]] static Error fail(Domain domain, int64_t expected,
                                    int64_t actual) noexcept {
        return Error::length_mismatch(domain, expected, actual);
    }

    [[nodiscard]] static Error fail(double expected, double actual) noexcept {
        return Error::length_mismatch(expected, actual);
    }
};

/**
 * @brief Comparison policy for the `min` rule.
 */
struct LowerBound {
    // cppcheck-suppress unusedStructMember
    static constexpr std::string_view rule = "min";

    template <typename T>
    [[nodiscard]] static constexpr bool violates(T actual,
                                                 T expected) noexcept {
        return actual < expected;
    }

    [[nodiscard]] static Error fail(Domain domain, int64_t expected,
                                    int64_t actual) noexcept {
        return Error::below_minimum(domain, expected, actual);
    }

    [[nodiscard]] static Error fail(double expected, double actual) noexcept {
        return Error::below_minimum(expected, actual);
    }
};

/**
 * @brief Comparison policy for the `max` rule.
 */
struct UpperBound {
    // cppcheck-suppress unusedStructMember
    static constexpr std::string_view rule = "max";

    template <typename T>
    [[nodiscard]] static constexpr bool violates(T actual,
                                                 T expected) noexcept {
        return actual > expected;
    }

    [[nodiscard]] static Error fail(Domain domain, int64_t expected,
                                    int64_t actual) noexcept {
        return Error::above_maximum(domain, expected, actual);
    }

    [[nodiscard]] static Error fail(double expected, double actual) noexcept {
        return Error::above_maximum(expected, actual);
    }
};

template <typename Policy>
concept BoundPolicy = requires(int64_t i, double d) {
    { Policy::rule } -> std::convertible_to<std::string_view>;
    { Policy::violates(i, i) } -> std::same_as<bool>;
    { Policy::fail(Domain::Integer, i, i) } -> std::same_as<Error>;
    { Policy::fail(d, d) } -> std::same_as<Error>;
};

inline Error BadParameter(std::string_view rule, std::string_view param) {
    spdlog::debug("verdict: rule '{}' cannot use parameter '{}'", rule, param);
    return Error::bad_parameter();
}

inline Error Unsupported(std::string_view rule, Kind kind) {
    spdlog::debug("verdict: rule '{}' does not apply to {} values", rule,
                  KindName(kind));
    return Error::unsupported();
}

/**
 * @brief Compares a signed size or value against a signed parameter.
 */
template <BoundPolicy Policy>
[[nodiscard]] std::optional<Error> CompareSigned(Domain domain, int64_t actual,
                                                 std::string_view param) {
    auto expected = params::ParseInt(param);
    if (!expected) {
        return BadParameter(Policy::rule, param);
    }
    if (Policy::violates(actual, *expected)) {
        return Policy::fail(domain, *expected, actual);
    }
    return std::nullopt;
}

/**
 * @brief Compares an unsigned value against an unsigned parameter.
 *
 * The comparison happens in unsigned space; both operands are converted to
 * int64_t only to build the error.
 */
template <BoundPolicy Policy>
[[nodiscard]] std::optional<Error> CompareUnsigned(uint64_t actual,
                                                   std::string_view param) {
    auto expected = params::ParseUint(param);
    if (!expected) {
        return BadParameter(Policy::rule, param);
    }
    if (Policy::violates(actual, *expected)) {
        return Policy::fail(Domain::Integer, static_cast<int64_t>(*expected),
                            static_cast<int64_t>(actual));
    }
    return std::nullopt;
}

template <BoundPolicy Policy>
[[nodiscard]] std::optional<Error> CompareFloat(double actual,
                                                std::string_view param) {
    auto expected = params::ParseFloat(param);
    if (!expected) {
        return BadParameter(Policy::rule, param);
    }
    if (Policy::violates(actual, *expected)) {
        return Policy::fail(*expected, actual);
    }
    return std::nullopt;
}

/**
 * @brief Runs a bound rule against every kind of value.
 *
 * Strings are measured in code points and collections in elements; numbers
 * are compared by value. Pointers pass without being inspected. Invalid,
 * boolean, record and opaque values are unsupported.
 *
 * @tparam Policy ExactBound, LowerBound or UpperBound.
 * @param value The value under validation.
 * @param param The textual bound.
 * @return std::nullopt on success, or an Error.
 */
template <BoundPolicy Policy>
[[nodiscard]] std::optional<Error> CheckBound(const Value& value,
                                              std::string_view param) {
    using Result = std::optional<Error>;
    return value.visit(Overloaded{
        [&](const Text& t) -> Result {
            return CompareSigned<Policy>(
                Domain::String, static_cast<int64_t>(CountCodePoints(t.data)),
                param);
        },
        [&](const Collection& c) -> Result {
            return CompareSigned<Policy>(Domain::Collection,
                                         static_cast<int64_t>(c.size), param);
        },
        [&](const Int& i) -> Result {
            return CompareSigned<Policy>(Domain::Integer, i.value, param);
        },
        [&](const Uint& u) -> Result {
            return CompareUnsigned<Policy>(u.value, param);
        },
        [&](const Float& f) -> Result {
            return CompareFloat<Policy>(f.value, param);
        },
        [](const Reference&) -> Result { return std::nullopt; },
        [](std::monostate) -> Result {
            return Unsupported(Policy::rule, Kind::Invalid);
        },
        [](const Bool&) -> Result {
            return Unsupported(Policy::rule, Kind::Bool);
        },
        [](const Record&) -> Result {
            return Unsupported(Policy::rule, Kind::Record);
        },
        [](const Opaque&) -> Result {
            return Unsupported(Policy::rule, Kind::Unsupported);
        },
    });
}

}  // namespace Verdict::detail
