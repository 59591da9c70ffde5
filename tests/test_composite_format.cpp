#include <catch2/catch.hpp>
#include <logtmpl/composite_format.hpp>
#include <logtmpl/numeric_pattern.hpp>
#include <clocale>
#include <cmath>

using namespace logtmpl;

static std::string render(std::string_view fmt, const std::vector<Value>& args) {
    auto r = format_composite(fmt, args);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Items and escaping =====

TEST_CASE("positional items are substituted", "[composite]") {
    REQUIRE(render("{0}", {"x"}) == "x");
    REQUIRE(render("{1}-{0}-{1}", {"a", "b"}) == "b-a-b");
    REQUIRE(render("no items", {}) == "no items");
    REQUIRE(render("{ 0 }", {"v"}) == "v");
}

TEST_CASE("doubled braces render as single braces", "[composite]") {
    REQUIRE(render("{{escaped}}", {}) == "{escaped}");
    REQUIRE(render("{{{0}}}", {"v"}) == "{v}");
    REQUIRE(render("{{{0}", {"v"}) == "{v");
}

TEST_CASE("stray braces are copied through", "[composite]") {
    REQUIRE(render("a } b", {}) == "a } b");
    REQUIRE(render("Hello {Name", {}) == "Hello {Name");
    REQUIRE(render("{0}}", {"x"}) == "x}");
    REQUIRE(render("{ }", {}) == "{ }");
}

TEST_CASE("missing argument is an error", "[composite]") {
    auto r = format_composite("{0} {1}", {"only"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TemplateError::OutOfRange);
    REQUIRE(r.error().message.find("{1}") != std::string::npos);

    REQUIRE(format_composite("{0}", {}).is_err());
}

TEST_CASE("malformed alignment is an error", "[composite]") {
    auto r = format_composite("{0,abc}", {1});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TemplateError::Format);
    REQUIRE(format_composite("{0 x}", {1}).is_err());
}

// ===== Alignment =====

TEST_CASE("alignment pads with spaces", "[composite]") {
    REQUIRE(render("{0,5}", {42}) == "   42");
    REQUIRE(render("{0,-5}|", {42}) == "42   |");
    REQUIRE(render("{0,2}", {"long"}) == "long");
    REQUIRE(render("{0, 4}", {"a"}) == "   a");
}

TEST_CASE("parse_format_item fields", "[composite]") {
    auto r = parse_format_item("3,-10:N2");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().index == 3);
    REQUIRE(r.value().alignment == -10);
    REQUIRE(r.value().spec == "N2");

    auto big = parse_format_item("0,2000000");
    REQUIRE(big.is_err());
}

// ===== Numeric format strings =====

TEST_CASE("decimal format", "[composite]") {
    REQUIRE(render("{0:D4}", {42}) == "0042");
    REQUIRE(render("{0:D4}", {-42}) == "-0042");
    REQUIRE(render("{0:d}", {7u}) == "7");
    REQUIRE(render("{0,5:D2}", {7}) == "   07");
}

TEST_CASE("hexadecimal format", "[composite]") {
    REQUIRE(render("{0:X}", {255}) == "FF");
    REQUIRE(render("{0:x4}", {255}) == "00ff");
    REQUIRE(render("{0:X}", {-1}) == "FFFFFFFFFFFFFFFF");
}

TEST_CASE("fixed and number formats", "[composite]") {
    REQUIRE(render("{0:F2}", {3.14159}) == "3.14");
    REQUIRE(render("{0:F}", {2}) == "2.00");
    REQUIRE(render("{0:F0}", {2.4}) == "2");
    REQUIRE(render("{0:N0}", {1234567}) == "1,234,567");
    REQUIRE(render("{0:N2}", {1234.5}) == "1,234.50");
    REQUIRE(render("{0:N0}", {-1234}) == "-1,234");
}

TEST_CASE("exponent format uses three exponent digits", "[composite]") {
    REQUIRE(render("{0:E2}", {12345.678}) == "1.23E+004");
    REQUIRE(render("{0:e}", {0.5}) == "5.000000e-001");
}

TEST_CASE("general and percent formats", "[composite]") {
    REQUIRE(render("{0:G}", {1.5}) == "1.5");
    REQUIRE(render("{0:G}", {-3}) == "-3");
    REQUIRE(render("{0:P1}", {0.256}) == "25.6 %");
    REQUIRE(render("{0:P0}", {1}) == "100 %");
}

TEST_CASE("non-numeric values ignore the format string", "[composite]") {
    REQUIRE(render("{0:D2}", {"ab"}) == "ab");
    REQUIRE(render("{0:X}", {true}) == "True");
}

TEST_CASE("non-finite doubles ignore the format string", "[composite]") {
    REQUIRE(render("{0:F2}", {std::nan("")}) == "NaN");
}

TEST_CASE("unsupported standard format strings are errors", "[composite]") {
    auto d = format_composite("{0:D2}", {1.5});
    REQUIRE(d.is_err());
    REQUIRE(d.error().code == TemplateError::Format);

    REQUIRE(format_composite("{0:Q}", {1}).is_err());
    REQUIRE(format_composite("{0:X1000}", {1}).is_err());
}

// ===== Custom numeric patterns =====

TEST_CASE("digit placeholders and decimal point", "[composite]") {
    REQUIRE(render("took {0:0.00} ms", {12.345}) == "took 12.35 ms");
    REQUIRE(render("{0:0.0000}", {3.14159265}) == "3.1416");
    REQUIRE(render("{0:00000}", {42}) == "00042");
    REQUIRE(render("{0:0.00}", {0}) == "0.00");
    REQUIRE(render("{0:0.00}", {0.05}) == "0.05");
    REQUIRE(render("{0:0.00}", {-1.5}) == "-1.50");
    REQUIRE(render("{0:#.##}", {1.5}) == "1.5");
    REQUIRE(render("{0:#.##}", {2}) == "2");
}

TEST_CASE("grouping and scaling commas", "[composite]") {
    REQUIRE(render("count {0:#,##0}", {1234567}) == "count 1,234,567");
    REQUIRE(render("{0:#,##0.00}", {1234.5}) == "1,234.50");
    REQUIRE(render("{0:#,##0,K}", {1234567}) == "1,235K");
    REQUIRE(render("{0:0,,M}", {5600000u}) == "6M");
}

TEST_CASE("percent and exponent patterns", "[composite]") {
    REQUIRE(render("{0:0.0%}", {0.256}) == "25.6%");
    REQUIRE(render("{0:0.###E+00}", {12345}) == "1.235E+04");
    REQUIRE(render("{0:0.0e0}", {0.00123}) == "1.2e-3");
}

TEST_CASE("literals placed between digit placeholders", "[composite]") {
    REQUIRE(render("{0:(###) ###-####}", {5551234567LL}) == "(555) 123-4567");
    REQUIRE(render("{0:'n='0}", {5}) == "n=5");
    REQUIRE(render("{0:\\#0}", {7}) == "#7");
    REQUIRE(render("{0:F2x}", {1}) == "F2x");
}

TEST_CASE("pattern sections for negative and zero values", "[composite]") {
    const char* fmt = "{0:0.00;(0.00);zero}";
    REQUIRE(render(fmt, {2}) == "2.00");
    REQUIRE(render(fmt, {-1.5}) == "(1.50)");
    REQUIRE(render(fmt, {0}) == "zero");
    REQUIRE(render("{0:0;;none}", {-3}) == "-3");
}

TEST_CASE("format_numeric_pattern rounds half away from zero", "[composite]") {
    REQUIRE(format_numeric_pattern(Value(2.5), "0") == "3");
    REQUIRE(format_numeric_pattern(Value(-2.5), "0") == "-3");
    REQUIRE(format_numeric_pattern(Value(0.995), "0.00") == "1.00");
    REQUIRE(format_numeric_pattern(Value(0.001), "0.00") == "0.00");
}

TEST_CASE("general format keeps the case of the letter", "[composite]") {
    REQUIRE(render("{0:G}", {1e20}) == "1E+20");
    REQUIRE(render("{0:g}", {1e20}) == "1e+20");
}

TEST_CASE("output does not depend on the C locale", "[composite]") {
    std::setlocale(LC_NUMERIC, "");
    REQUIRE(render("{0:F1}", {1.5}) == "1.5");
    REQUIRE(render("{0}", {0.25}) == "0.25");
    std::setlocale(LC_NUMERIC, "C");
}

TEST_CASE("align_text", "[composite]") {
    REQUIRE(align_text("ab", 4) == "  ab");
    REQUIRE(align_text("ab", -4) == "ab  ");
    REQUIRE(align_text("abc", 0) == "abc");
}
