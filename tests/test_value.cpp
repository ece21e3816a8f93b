#include <parity/core/value.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <string>

using parity::DataType;
using parity::Value;

TEST_CASE("Value text forms", "[core][value]") {
    REQUIRE(parity::format_value(Value{}) == "");
    REQUIRE(parity::format_value(Value{std::int64_t{-42}}) == "-42");
    REQUIRE(parity::format_value(Value{std::uint64_t{18446744073709551615ULL}}) ==
            "18446744073709551615");
    REQUIRE(parity::format_value(Value{2.5}) == "2.5");
    REQUIRE(parity::format_value(Value{std::nan("")}) == "NaN");
    REQUIRE(parity::format_value(Value{true}) == "true");
    REQUIRE(parity::format_value(Value{parity::Duration{90'000'000'000}}) == "1m30s");
}

TEST_CASE("Value parsing by declared type", "[core][value]") {
    REQUIRE(std::get<std::int64_t>(*parity::parse_value(DataType::Int, "17")) == 17);
    REQUIRE(std::get<double>(*parity::parse_value(DataType::Float, "1e3")) == 1000.0);
    REQUIRE(std::isinf(std::get<double>(*parity::parse_value(DataType::Float, "+Inf"))));
    REQUIRE(std::get<bool>(*parity::parse_value(DataType::Bool, "false")) == false);
    REQUIRE(std::get<parity::Timestamp>(*parity::parse_value(DataType::Time, "1970-01-01T00:00:01Z"))
                .nanos == 1'000'000'000);

    REQUIRE_FALSE(parity::parse_value(DataType::Int, "1.5").has_value());
    REQUIRE_FALSE(parity::parse_value(DataType::Int, "").has_value());
    REQUIRE_FALSE(parity::parse_value(DataType::UInt, "-1").has_value());
    REQUIRE_FALSE(parity::parse_value(DataType::Bool, "yes").has_value());
}

TEST_CASE("Exact value equality", "[core][value]") {
    REQUIRE(parity::values_equal(Value{}, Value{}));
    REQUIRE(parity::values_equal(Value{std::nan("")}, Value{std::nan("")}));
    REQUIRE_FALSE(parity::values_equal(Value{0.1 + 0.2}, Value{0.3}));
    // Same number, different type.
    REQUIRE_FALSE(parity::values_equal(Value{std::int64_t{1}}, Value{1.0}));
    REQUIRE_FALSE(parity::values_equal(Value{std::int64_t{1}}, Value{}));
}

TEST_CASE("Predicate comparison across numeric types", "[core][value]") {
    auto cmp = parity::compare_values(Value{std::int64_t{2}}, Value{2.5});
    REQUIRE(cmp.has_value());
    REQUIRE(*cmp == std::partial_ordering::less);

    cmp = parity::compare_values(Value{std::int64_t{-1}},
                                 Value{std::numeric_limits<std::uint64_t>::max()});
    REQUIRE(*cmp == std::partial_ordering::less);

    REQUIRE_FALSE(parity::compare_values(Value{}, Value{std::int64_t{1}}).has_value());
    REQUIRE_FALSE(
        parity::compare_values(Value{std::string("a")}, Value{std::int64_t{1}}).has_value());
}

TEST_CASE("Total order puts null first and NaN last", "[core][value]") {
    REQUIRE(parity::value_order(Value{}, Value{std::int64_t{0}}) < 0);
    REQUIRE(parity::value_order(Value{std::nan("")}, Value{1e300}) > 0);
    REQUIRE(parity::value_order(Value{std::string("a")}, Value{std::string("b")}) < 0);
    REQUIRE(parity::value_order(Value{std::nan("")}, Value{std::nan("")}) == 0);
}
