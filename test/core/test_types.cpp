#include <catch2/catch_test_macros.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <verdict/core/verdict_types.hpp>

using namespace Verdict;

TEST_CASE("Sentinel errors carry no payload", "[types][error]") {
    const Error sentinels[] = {
        Error::zero_value(),    Error::zero_value_empty(),
        Error::zero_value_number(), Error::zero_value_bool(),
        Error::bad_parameter(), Error::unsupported(),
    };
    for (const auto& err : sentinels) {
        REQUIRE(err.domain == Domain::None);
        REQUIRE(err.int_bounds() == nullptr);
        REQUIRE(err.float_bounds() == nullptr);
        REQUIRE(err.pattern().empty());
    }

    REQUIRE(Error::zero_value() == ErrorCode::ZeroValue);
    REQUIRE(Error::zero_value_empty() == ErrorCode::ZeroValueEmpty);
    REQUIRE(Error::zero_value_number() == ErrorCode::ZeroValueNumber);
    REQUIRE(Error::zero_value_bool() == ErrorCode::ZeroValueBool);
    REQUIRE(Error::bad_parameter() == ErrorCode::BadParameter);
    REQUIRE(Error::unsupported() == ErrorCode::Unsupported);
}

TEST_CASE("Comparison errors carry expected and actual", "[types][error]") {
    auto err = Error::length_mismatch(Domain::Collection, 2, 3);
    REQUIRE(err.code == ErrorCode::LengthMismatch);
    REQUIRE(err.domain == Domain::Collection);
    REQUIRE(err.int_bounds() != nullptr);
    REQUIRE(err.int_bounds()->expected == 2);
    REQUIRE(err.int_bounds()->actual == 3);
    REQUIRE(err.float_bounds() == nullptr);

    auto ferr = Error::below_minimum(2.5, 1.25);
    REQUIRE(ferr.code == ErrorCode::BelowMinimum);
    REQUIRE(ferr.domain == Domain::Float);
    REQUIRE(ferr.float_bounds() != nullptr);
    REQUIRE(ferr.float_bounds()->expected == 2.5);
    REQUIRE(ferr.float_bounds()->actual == 1.25);
    REQUIRE(ferr.int_bounds() == nullptr);

    auto perr = Error::pattern_mismatch("^a+$");
    REQUIRE(perr.code == ErrorCode::PatternMismatch);
    REQUIRE(perr.pattern() == "^a+$");
}

TEST_CASE("Error equality compares code, domain and payload",
          "[types][error]") {
    REQUIRE(Error::below_minimum(Domain::Integer, 10, 5) ==
            Error::below_minimum(Domain::Integer, 10, 5));
    REQUIRE_FALSE(Error::below_minimum(Domain::Integer, 10, 5) ==
                  Error::below_minimum(Domain::Integer, 10, 6));
    REQUIRE_FALSE(Error::below_minimum(Domain::Integer, 10, 5) ==
                  Error::below_minimum(Domain::String, 10, 5));
    REQUIRE_FALSE(Error::below_minimum(Domain::Integer, 10, 5) ==
                  Error::above_maximum(Domain::Integer, 10, 5));
    REQUIRE(Error::pattern_mismatch("x") == Error::pattern_mismatch("x"));
    REQUIRE_FALSE(Error::pattern_mismatch("x") ==
                  Error::pattern_mismatch("y"));
}

TEST_CASE("Error classification", "[types][error]") {
    REQUIRE(Error::zero_value().is_zero_value());
    REQUIRE(Error::zero_value_empty().is_zero_value());
    REQUIRE(Error::zero_value_number().is_zero_value());
    REQUIRE(Error::zero_value_bool().is_zero_value());
    REQUIRE_FALSE(Error::bad_parameter().is_zero_value());

    // Every domain of a bound error belongs to the same class.
    REQUIRE(Error::length_mismatch(Domain::String, 1, 2).is_bound_violation());
    REQUIRE(Error::length_mismatch(1.0, 2.0).is_bound_violation());
    REQUIRE(Error::below_minimum(Domain::Collection, 1, 0)
                .is_bound_violation());
    REQUIRE(Error::above_maximum(Domain::Integer, 1, 2).is_bound_violation());
    REQUIRE_FALSE(Error::pattern_mismatch("a").is_bound_violation());

    REQUIRE(Error::bad_parameter().is_configuration_error());
    REQUIRE(Error::unsupported().is_configuration_error());
    REQUIRE_FALSE(Error::zero_value().is_configuration_error());
    REQUIRE_FALSE(
        Error::above_maximum(Domain::Integer, 1, 2).is_configuration_error());
    REQUIRE_FALSE(Error::pattern_mismatch("a").is_configuration_error());
}

TEST_CASE("Error messages", "[types][error][message]") {
    REQUIRE(Error::zero_value().message() == "zero value");
    REQUIRE(Error::zero_value_empty().message() == "zero value: empty");
    REQUIRE(Error::zero_value_number().message() ==
            "zero value: number is zero");
    REQUIRE(Error::zero_value_bool().message() ==
            "zero value: boolean is false");
    REQUIRE(Error::bad_parameter().message() == "bad parameter");
    REQUIRE(Error::unsupported().message() == "unsupported type");

    REQUIRE(Error::length_mismatch(Domain::Collection, 2, 3).message() ==
            "invalid length, expected 2 items but got 3");
    REQUIRE(Error::length_mismatch(Domain::String, 4, 5).message() ==
            "invalid length, expected 4 characters but got 5");
    REQUIRE(Error::below_minimum(Domain::Integer, 10, 5).message() ==
            "less than min, expected at least 10 but got 5");
    REQUIRE(Error::above_maximum(Domain::String, 3, 5).message() ==
            "greater than max, expected at most 3 characters but got 5");
    REQUIRE(Error::above_maximum(1.5, 2.5).message() ==
            "greater than max, expected at most 1.5 but got 2.5");
    REQUIRE(Error::pattern_mismatch("^a$").message() ==
            "regular expression mismatch, pattern `^a$`");
}

TEST_CASE("Errors format through fmt", "[types][error][message]") {
    auto err = Error::below_minimum(Domain::Collection, 2, 1);
    REQUIRE(fmt::format("{}", err) == err.message());
    REQUIRE(fmt::format("[{}]", Error::unsupported()) == "[unsupported type]");
}

static_assert(Bounds<int64_t>{1, 2} == Bounds<int64_t>{1, 2});
static_assert(!(Bounds<double>{1.0, 2.0} == Bounds<double>{1.0, 3.0}));
