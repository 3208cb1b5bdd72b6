#pragma once

#include <optional>
#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <string_view>
#include <verdict/core/verdict_types.hpp>
#include <verdict/core/verdict_utf8.hpp>
#include <verdict/core/verdict_value.hpp>
#include <verdict/verdict_detail.hpp>

namespace Verdict {

/**
 * @brief Concept defining a validation rule.
 *
 * Rules implement a static `Check` method that validates a value against a
 * textual parameter and returns std::nullopt on success or an Error on
 * failure.
 */
template <typename R>
concept Rule = requires(const Value& value, std::string_view param) {
    { R::Check(value, param) } -> std::same_as<std::optional<Error>>;
};

/**
 * @brief Presence rule (`nonzero`): rejects the zero value of every kind.
 *
 * Empty strings (no code points), null references and empty collections fail
 * with ZeroValueEmpty; numeric zero with ZeroValueNumber; false with
 * ZeroValueBool; an invalid value always fails with ZeroValue. Records always
 * pass. The parameter is ignored.
 */
struct Nonzero {
    [[nodiscard]] static auto Check(const Value& value,
                                    std::string_view = {}) noexcept
        -> std::optional<Error> {
        using Result = std::optional<Error>;
        return value.visit(Overloaded{
            [](std::monostate) -> Result { return Error::zero_value(); },
            [](const Text& t) -> Result {
                if (CountCodePoints(t.data) == 0) {
                    return Error::zero_value_empty();
                }
                return std::nullopt;
            },
            [](const Reference& r) -> Result {
                if (r.is_null) {
                    return Error::zero_value_empty();
                }
                return std::nullopt;
            },
            [](const Collection& c) -> Result {
                if (c.size == 0) {
                    return Error::zero_value_empty();
                }
                return std::nullopt;
            },
            [](const Int& i) -> Result {
                if (i.value == 0) {
                    return Error::zero_value_number();
                }
                return std::nullopt;
            },
            [](const Uint& u) -> Result {
                if (u.value == 0) {
                    return Error::zero_value_number();
                }
                return std::nullopt;
            },
            [](const Float& f) -> Result {
                if (f.value == 0.0) {
                    return Error::zero_value_number();
                }
                return std::nullopt;
            },
            [](const Bool& b) -> Result {
                if (!b.value) {
                    return Error::zero_value_bool();
                }
                return std::nullopt;
            },
            [](const Record&) -> Result { return std::nullopt; },
            [](const Opaque&) -> Result {
                return detail::Unsupported("nonzero", Kind::Unsupported);
            },
        });
    }
};

/**
 * @brief Length rule (`len`): the value's size must equal the parameter.
 *
 * Size is the code-point count of a string, the element count of a
 * collection, or the value itself for numbers.
 */
struct Len {
    [[nodiscard]] static auto Check(const Value& value, std::string_view param)
        -> std::optional<Error> {
        return detail::CheckBound<detail::ExactBound>(value, param);
    }
};

/**
 * @brief Minimum rule (`min`): the value (or its size) must be >= parameter.
 */
struct Min {
    [[nodiscard]] static auto Check(const Value& value, std::string_view param)
        -> std::optional<Error> {
        return detail::CheckBound<detail::LowerBound>(value, param);
    }
};

/**
 * @brief Maximum rule (`max`): the value (or its size) must be <= parameter.
 */
struct Max {
    [[nodiscard]] static auto Check(const Value& value, std::string_view param)
        -> std::optional<Error> {
        return detail::CheckBound<detail::UpperBound>(value, param);
    }
};

/**
 * @brief Pattern rule (`regexp`): a string must contain a match for the
 * parameter, compiled as an RE2 regular expression.
 *
 * Matching is UTF-8 aware and runs in time linear in the text. Anchors in
 * the pattern anchor the match. Non-strings are unsupported; a pattern that
 * does not compile is a bad parameter. The compiled pattern is not cached.
 */
struct Regexp {
    [[nodiscard]] static auto Check(const Value& value, std::string_view param)
        -> std::optional<Error> {
        const auto* text = value.get_if<Text>();
        if (text == nullptr) {
            return detail::Unsupported("regexp", value.kind());
        }

        const RE2 re(re2::StringPiece(param.data(), param.size()), RE2::Quiet);
        if (!re.ok()) {
            spdlog::warn("verdict: invalid pattern '{}', {}", param,
                         re.error());
            return Error::bad_parameter();
        }

        if (!RE2::PartialMatch(
                re2::StringPiece(text->data.data(), text->data.size()), re)) {
            return Error::pattern_mismatch(param);
        }
        return std::nullopt;
    }
};

static_assert(Rule<Nonzero>);
static_assert(Rule<Len>);
static_assert(Rule<Min>);
static_assert(Rule<Max>);
static_assert(Rule<Regexp>);

}  // namespace Verdict
