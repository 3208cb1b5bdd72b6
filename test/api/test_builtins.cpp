#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <verdict/verdict.hpp>

using namespace Verdict;

namespace {

struct Signup {
    std::string username;
    std::string email;
    uint8_t age;
    std::vector<std::string> tags;
};

// One (rule, parameter) pair taken from a field annotation.
struct RuleUse {
    std::string_view name;
    std::string_view param;
};

// Runs every rule against a single field and collects the failures in rule
// order.
std::vector<std::pair<std::string_view, Error>> RunRules(
    const Value& value, std::initializer_list<RuleUse> rules) {
    std::vector<std::pair<std::string_view, Error>> failures;
    for (const auto& rule : rules) {
        auto func = FindBuiltin(rule.name);
        REQUIRE(func != nullptr);
        if (auto err = func(value, rule.param)) {
            failures.emplace_back(rule.name, *err);
        }
    }
    return failures;
}

}  // namespace

TEST_CASE("FindBuiltin: canonical names", "[api][builtins]") {
    REQUIRE(FindBuiltin("nonzero") == &Nonzero::Check);
    REQUIRE(FindBuiltin("len") == &Len::Check);
    REQUIRE(FindBuiltin("min") == &Min::Check);
    REQUIRE(FindBuiltin("max") == &Max::Check);
    REQUIRE(FindBuiltin("regexp") == &Regexp::Check);
}

TEST_CASE("FindBuiltin: unknown names", "[api][builtins]") {
    REQUIRE(FindBuiltin("") == nullptr);
    REQUIRE(FindBuiltin("Min") == nullptr);
    REQUIRE(FindBuiltin("nonZero") == nullptr);
    REQUIRE(FindBuiltin("length") == nullptr);
    REQUIRE(FindBuiltin("min ") == nullptr);
}

TEST_CASE("BuiltinRules: five distinct entries", "[api][builtins]") {
    std::set<std::string_view> names;
    for (const auto& rule : BuiltinRules) {
        REQUIRE(rule.func != nullptr);
        names.insert(rule.name);
    }
    REQUIRE(names.size() == BuiltinRules.size());
    REQUIRE(names.size() == 5);
}

TEST_CASE("Lookup is usable at compile time", "[api][builtins]") {
    static_assert(FindBuiltin("len") != nullptr);
    static_assert(FindBuiltin("unknown") == nullptr);
    static_assert(BuiltinRules[0].name == "nonzero");
}

TEST_CASE("Validate: normalises before checking", "[api][validate]") {
    REQUIRE(Validate<Min>(5, "10") ==
            Error::below_minimum(Domain::Integer, 10, 5));
    REQUIRE_FALSE(Validate<Len>(std::vector<int>{1, 2, 3}, "3").has_value());
    REQUIRE(Validate<Nonzero>(std::string{}) == Error::zero_value_empty());
    REQUIRE(Validate<Max>(uint16_t{300}, "255") ==
            Error::above_maximum(Domain::Integer, 255, 300));
    REQUIRE(Validate<Regexp>("abc", "^a") == std::nullopt);
}

TEST_CASE("Rules compose on one field", "[api][compose]") {
    const Signup ok{"gopher", "gopher@example.com", 30, {"go", "c++"}};

    REQUIRE(RunRules(Value::of(ok.username),
                     {{"nonzero", ""}, {"min", "3"}, {"max", "16"}})
                .empty());
    REQUIRE(RunRules(Value::of(ok.email), {{"regexp", "^[^@]+@[^@]+$"}})
                .empty());
    REQUIRE(RunRules(Value::of(ok.age), {{"min", "18"}, {"max", "130"}})
                .empty());
    REQUIRE(RunRules(Value::of(ok.tags), {{"max", "4"}}).empty());

    const Signup bad{"", "nobody", 12, {"a", "b", "c", "d", "e"}};

    // Every rule runs; nothing short-circuits.
    auto username = RunRules(Value::of(bad.username),
                             {{"nonzero", ""}, {"min", "3"}, {"max", "16"}});
    REQUIRE(username.size() == 2);
    REQUIRE(username[0].first == "nonzero");
    REQUIRE(username[0].second == Error::zero_value_empty());
    REQUIRE(username[1].first == "min");
    REQUIRE(username[1].second ==
            Error::below_minimum(Domain::String, 3, 0));

    auto email = RunRules(Value::of(bad.email), {{"regexp", "^[^@]+@[^@]+$"}});
    REQUIRE(email.size() == 1);
    REQUIRE(email[0].second.code == ErrorCode::PatternMismatch);

    auto age = RunRules(Value::of(bad.age), {{"min", "18"}, {"max", "130"}});
    REQUIRE(age.size() == 1);
    REQUIRE(age[0].second == Error::below_minimum(Domain::Integer, 18, 12));

    auto tags = RunRules(Value::of(bad.tags), {{"max", "4"}});
    REQUIRE(tags.size() == 1);
    REQUIRE(tags[0].second.message() ==
            "greater than max, expected at most 4 items but got 5");
}

TEST_CASE("Configuration errors are separable from validation failures",
          "[api][errors]") {
    const auto value = Value::of(7);

    auto bad_param = FindBuiltin("max")(value, "seven");
    REQUIRE(bad_param.has_value());
    REQUIRE(bad_param->is_configuration_error());
    REQUIRE_FALSE(bad_param->is_bound_violation());

    auto unsupported = FindBuiltin("regexp")(value, ".*");
    REQUIRE(unsupported.has_value());
    REQUIRE(unsupported->is_configuration_error());

    auto violation = FindBuiltin("max")(value, "6");
    REQUIRE(violation.has_value());
    REQUIRE(violation->is_bound_violation());
    REQUIRE_FALSE(violation->is_configuration_error());

    auto zero = FindBuiltin("nonzero")(Value::of(0), "");
    REQUIRE(zero.has_value());
    REQUIRE(zero->is_zero_value());
    REQUIRE_FALSE(zero->is_configuration_error());
}

TEST_CASE("Rules are stateless", "[api]") {
    const auto value = Value::of("abc");
    auto first = FindBuiltin("len")(value, "2");
    auto second = FindBuiltin("len")(value, "2");
    REQUIRE(first == second);
    REQUIRE(FindBuiltin("len")(value, "3") == std::nullopt);
}

TEST_CASE("Validate: C strings need a string_view to be text",
          "[api][string]") {
    const char* greeting = "hello";
    // A bare const char* is a pointer: bounds pass, patterns do not apply.
    REQUIRE_FALSE(Validate<Len>(greeting, "99").has_value());
    REQUIRE(Validate<Regexp>(greeting, "h") == Error::unsupported());

    const std::string_view text{greeting};
    REQUIRE(Validate<Len>(text, "99") ==
            Error::length_mismatch(Domain::String, 99, 5));
    REQUIRE_FALSE(Validate<Regexp>(text, "^h").has_value());
}
