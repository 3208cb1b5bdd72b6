#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <verdict/core/verdict_types.hpp>
#include <verdict/core/verdict_value.hpp>
#include <verdict/params/verdict_params.hpp>
#include <verdict/validators/verdict_validators.hpp>

/**
 * @brief The public API for Verdict.
 *
 * Verdict checks one value against one rule at a time. Callers own rule
 * extraction (annotations, schemas), recursion into nested records and
 * aggregation of results; they hand the engine a value and a
 * (rule, parameter) pair and get back std::nullopt or an Error.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b Nonzero, @b Len, @b Min, @b Max, @b Regexp: the builtin rules, each
 *   exposing `Check(const Value&, std::string_view)`.
 * - @b BuiltinRules / @b FindBuiltin: the stable name -> function mapping
 *   (`nonzero`, `len`, `min`, `max`, `regexp`).
 * - @b Validate: normalises any C++ value and runs one rule on it.
 */

namespace Verdict {

/**
 * @brief Uniform signature shared by every rule, suitable for lookup tables.
 */
using ValidationFunc = std::optional<Error> (*)(const Value&,
                                                std::string_view);

/**
 * @brief A named builtin rule.
 */
struct BuiltinRule {
    std::string_view name;
    ValidationFunc func;
};

/**
 * @brief The builtin rules under their canonical names.
 */
inline constexpr std::array<BuiltinRule, 5> BuiltinRules{{
    {"nonzero", &Nonzero::Check},
    {"len", &Len::Check},
    {"min", &Min::Check},
    {"max", &Max::Check},
    {"regexp", &Regexp::Check},
}};

/**
 * @brief Looks up a builtin rule by name.
 *
 * @param name The rule name, e.g. "min".
 * @return The rule's function, or nullptr if no builtin has that name.
 */
[[nodiscard]] constexpr ValidationFunc FindBuiltin(
    std::string_view name) noexcept {
    for (const auto& rule : BuiltinRules) {
        if (rule.name == name) {
            return rule.func;
        }
    }
    return nullptr;
}

/**
 * @brief Validates any C++ value against a rule.
 *
 * The value is normalised with Value::of first, so numeric widths collapse
 * and containers are reduced to their sizes.
 *
 * @tparam R The rule (e.g. Min).
 * @tparam T The caller's value type (deduced).
 * @param value The value to validate.
 * @param param The rule parameter.
 * @return std::optional<Error> std::nullopt on success, or an Error.
 */
template <Rule R, typename T>
[[nodiscard]] auto Validate(const T& value, std::string_view param = {})
    -> std::optional<Error> {
    return R::Check(Value::of(value), param);
}

}  // namespace Verdict
