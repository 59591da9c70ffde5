#include <catch2/catch.hpp>
#include <logtmpl/value.hpp>
#include <cmath>
#include <limits>

using namespace logtmpl;

TEST_CASE("default value is null", "[value]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.kind() == Value::Kind::Null);
    REQUIRE(Value(nullptr).is_null());
    REQUIRE(Value::null().to_string().empty());
}

TEST_CASE("integral construction picks signedness", "[value]") {
    REQUIRE(Value(42).kind() == Value::Kind::Int);
    REQUIRE(Value(-7L).as_int() == -7);
    REQUIRE(Value(42u).kind() == Value::Kind::UInt);
    REQUIRE(Value(uint64_t{18446744073709551615ULL}).as_uint() == 18446744073709551615ULL);
    REQUIRE(Value(short{3}).is_integer());
}

TEST_CASE("text construction", "[value]") {
    REQUIRE(Value("abc").is_text());
    REQUIRE(Value(std::string("abc")).as_text() == "abc");
    REQUIRE(Value(std::string_view("xy")).as_text() == "xy");
    REQUIRE(Value('c').as_text() == "c");
    REQUIRE_FALSE(Value("abc").is_list());
}

TEST_CASE("display form is invariant", "[value]") {
    REQUIRE(Value(true).to_string() == "True");
    REQUIRE(Value(false).to_string() == "False");
    REQUIRE(Value(-12345).to_string() == "-12345");
    REQUIRE(Value(2.5).to_string() == "2.5");
    REQUIRE(Value(0.1).to_string() == "0.1");
    REQUIRE(Value(1e20).to_string() == "1E+20");
    REQUIRE(Value(1e-7).to_string() == "1E-07");
    REQUIRE(Value(std::nan("")).to_string() == "NaN");
    REQUIRE(Value(std::numeric_limits<double>::infinity()).to_string() == "Infinity");
    REQUIRE(Value(-std::numeric_limits<double>::infinity()).to_string() == "-Infinity");
}

TEST_CASE("list display joins elements", "[value]") {
    auto v = Value::list({1, nullptr, 3});
    REQUIRE(v.is_list());
    REQUIRE(v.as_list().size() == 3);
    REQUIRE(v.to_string() == "1, (null), 3");
    REQUIRE(Value::list({}).to_string().empty());
}

TEST_CASE("join_list uses the given separator and marker", "[value]") {
    Value::List items{"a", Value::null(), Value::list({1, 2})};
    REQUIRE(join_list(items, "; ", "-") == "a; -; 1; 2");
}

TEST_CASE("value equality", "[value]") {
    REQUIRE(Value(1) == Value(1));
    REQUIRE(Value(1) != Value(1u));
    REQUIRE(Value("x") == Value(std::string("x")));
    REQUIRE(Value::list({1, "a"}) == Value::list({1, "a"}));
    REQUIRE(Value() == Value::null());
}

TEST_CASE("typed access on wrong kind throws", "[value]") {
    REQUIRE_THROWS_AS(Value(1).as_text(), std::bad_variant_access);
    REQUIRE_THROWS_AS(Value("x").as_int(), std::bad_variant_access);
}
