// test_value.cpp
#include <catch2/catch.hpp>

#include "BlockFlowValue.hpp"
#include <cmath>
#include <limits>

using namespace BlockFlow;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
} // namespace

TEST_CASE("value kinds and scalar extraction", "[value]") {
    CHECK(std::string(kindName(mkScalar(1))) == "scalar");
    CHECK(std::string(kindName(mkVector({1, 2}))) == "vector");
    CHECK(std::string(kindName(mkTable({"a"}, {{1}}))) == "table");
    CHECK(std::string(kindName(mkError("x"))) == "error");

    CHECK(extractScalar(InputValue{mkScalar(3)}) == 3.0);
    CHECK_FALSE(extractScalar(InputValue{}).has_value());
    CHECK_FALSE(extractScalar(InputValue{mkVector({3})}).has_value());
    CHECK_FALSE(extractScalar(InputValue{mkError("bad")}).has_value());
}

TEST_CASE("value equality treats NaN as equal to itself", "[value]") {
    CHECK(mkScalar(kNaN) == mkScalar(kNaN));
    CHECK(mkVector({1, kNaN}) == mkVector({1, kNaN}));
    CHECK(mkScalar(1) != mkScalar(2));
    CHECK(mkScalar(1) != mkVector({1}));
    CHECK(mkTable({"a"}, {{1}}) != mkTable({"b"}, {{1}}));
    CHECK(mkError("x") == mkError("x"));
}

TEST_CASE("compact scalar formatting", "[value][format]") {
    SECTION("missing value") {
        const Value* none = nullptr;
        CHECK(formatValue(none) == "—");
        CHECK(formatValueFull(none) == "—");
        CHECK(formatValueJson(none) == "null");
    }
    SECTION("non-finite and zero") {
        CHECK(formatValue(mkScalar(kNaN)) == "NaN");
        CHECK(formatValue(mkScalar(kInf)) == "+∞");
        CHECK(formatValue(mkScalar(-kInf)) == "−∞");
        CHECK(formatValue(mkScalar(-0.0)) == "0");
    }
    SECTION("six significant digits") {
        CHECK(formatValue(mkScalar(42)) == "42");
        CHECK(formatValue(mkScalar(-2.5)) == "-2.5");
        CHECK(formatValue(mkScalar(1.0 / 3.0)) == "0.333333");
        CHECK(formatValue(mkScalar(3.14159265)) == "3.14159");
        CHECK(formatValue(mkScalar(999999)) == "999999");
        CHECK(formatValue(mkScalar(999999.4)) == "999999");
    }
    SECTION("rounding up to 1e6 stays in fixed notation") {
        CHECK(formatValue(mkScalar(999999.5)) == "1000000");
        CHECK(formatValue(mkScalar(999999.7)) == "1000000");
        CHECK(formatValue(mkScalar(-999999.7)) == "-1000000");
        CHECK(formatValue(mkScalar(999999.7), "C") == "1000000");
    }
    SECTION("scientific outside [1e-3, 1e6)") {
        CHECK(formatValue(mkScalar(1234567)) == "1.2346e+6");
        CHECK(formatValue(mkScalar(0.0001)) == "1.0000e-4");
        CHECK(formatValue(mkScalar(-2.5e-7)) == "-2.5000e-7");
        CHECK(formatValue(mkScalar(0.001)) == "0.001");
    }
    SECTION("unknown locale falls back to the neutral format") {
        CHECK(formatValue(mkScalar(1234.5), "xx_NOT_A_LOCALE") == "1234.5");
        CHECK(formatValue(mkScalar(1234.5), "C") == "1234.5");
    }
}

TEST_CASE("compact vector, table and error formatting", "[value][format]") {
    CHECK(formatValue(mkVector({})) == "[empty]");
    CHECK(formatValue(mkVector({1, 2, 3})) == "[1, 2, 3]");
    CHECK(formatValue(mkVector({1, kNaN, 3})) == "[1, NaN, 3]");
    CHECK(formatValue(mkVector({0.5, 1, 2, 4})) == "[0.5, 1, 2, 4]");
    CHECK(formatValue(mkVector({1, 2, 3, 4, 5})) == "[5 items]");
    CHECK(formatValue(mkTable({"a", "b", "c"}, {{1, 2, 3}, {4, 5, 6}})) == "2×3 table");
    CHECK(formatValue(mkError("Division by zero")) == "Division by zero");
}

TEST_CASE("full-precision formatting", "[value][format]") {
    CHECK(formatValueFull(mkScalar(7)) == "7");
    CHECK(formatValueFull(mkScalar(0.1)) == "0.10000000000000001");
    CHECK(formatValueFull(mkScalar(1e21)) == "1e+21");
    CHECK(formatValueFull(mkScalar(kInf)) == "+Infinity");
    CHECK(formatValueFull(mkScalar(-kInf)) == "-Infinity");
    CHECK(formatValueFull(mkScalar(kNaN)) == "NaN");
    CHECK(formatValueFull(mkVector({1.5, 2})) == "[1.5, 2]");
    CHECK(formatValueFull(mkTable({"a", "b"}, {{1, 2}, {3, 4}})) == "a\tb\n1\t2\n3\t4");
    CHECK(formatValueFull(mkError("boom")) == "Error: boom");
}

TEST_CASE("JSON formatting", "[value][format][json]") {
    CHECK(formatValueJson(mkScalar(2.5)) == "2.5");
    CHECK(formatValueJson(mkScalar(7)) == "7");
    CHECK(formatValueJson(mkScalar(-0.0)) == "0");
    CHECK(formatValueJson(mkScalar(1e300)) == "1e+300");
    CHECK(formatValueJson(mkVector({1, 2.5, -3})) == "[1,2.5,-3]");
    CHECK(formatValueJson(mkScalar(kNaN)) == "\"NaN\"");
    CHECK(formatValueJson(mkScalar(kInf)) == "\"Infinity\"");
    CHECK(formatValueJson(mkScalar(-kInf)) == "\"-Infinity\"");
    CHECK(formatValueJson(mkError("boom")) == "{\"error\":\"boom\"}");

    const auto vec = nlohmann::json::parse(formatValueJson(mkVector({1, 2.5})));
    REQUIRE(vec.is_array());
    CHECK(vec.size() == 2);
    CHECK(vec[1].get<double>() == 2.5);

    const std::string tableText = formatValueJson(mkTable({"x", "y"}, {{1, 2}}));
    CHECK(tableText.find('\n') != std::string::npos);
    const auto table = nlohmann::json::parse(tableText);
    CHECK(table["columns"] == nlohmann::json({"x", "y"}));
    CHECK(table["rows"][0][1].get<double>() == 2.0);
    CHECK(table["rows"][0][1].is_number_integer());
}
