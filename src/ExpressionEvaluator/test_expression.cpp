#include <catch2/catch_all.hpp>
#include <cmath>
#include <limits>
#include <string>

#include "ExpressionEvaluator.hpp"

using namespace expr;
using Catch::Approx;

TEST_CASE("ExpressionEvaluator parses number literals", "[expr]") {
    ExpressionEvaluator ev;

    REQUIRE(ev.evaluate("123") == 123.0);
    REQUIRE(ev.evaluate("2.5") == 2.5);
    REQUIRE(ev.evaluate(".5") == 0.5);
    REQUIRE(ev.evaluate("1e3") == 1000.0);
    REQUIRE(ev.evaluate("  42  ") == 42.0);
}

TEST_CASE("ExpressionEvaluator operator precedence and unary", "[expr]") {
    ExpressionEvaluator ev;

    REQUIRE(ev.evaluate("1+2*3") == 7.0);
    REQUIRE(ev.evaluate("(1+2)*3") == 9.0);
    REQUIRE(ev.evaluate("10/4") == 2.5);
    REQUIRE(ev.evaluate("10%3") == 1.0);
    REQUIRE(ev.evaluate("2^3") == 8.0);
    // '^' is left-associative and unary minus binds tighter
    REQUIRE(ev.evaluate("2^3^2") == 64.0);
    REQUIRE(ev.evaluate("-2^2") == 4.0);
    REQUIRE(ev.evaluate("2^-1") == 0.5);
    REQUIRE(ev.evaluate("--3") == 3.0);
    REQUIRE(ev.evaluate("1,2") == 2.0);
}

TEST_CASE("ExpressionEvaluator constants and functions", "[expr]") {
    ExpressionEvaluator ev;

    REQUIRE(ev.evaluate("pi") == Approx(3.14159265358979));
    REQUIRE(ev.evaluate("e") == Approx(2.718281828459045));
    REQUIRE(ev.evaluate("sqrt(16)") == 4.0);
    REQUIRE(ev.evaluate("sqrt 16") == 4.0);
    REQUIRE(ev.evaluate("abs(-3)+1") == 4.0);
    REQUIRE(ev.evaluate("pow(2,10)") == 1024.0);
    REQUIRE(ev.evaluate("atan2(1,1)") == Approx(0.785398163397448));
    REQUIRE(ev.evaluate("log(1000)") == Approx(3.0));
    REQUIRE(ev.evaluate("ln(e)") == Approx(1.0));
    REQUIRE(ev.evaluate("fac(5)") == 120.0);
    REQUIRE(ev.evaluate("ncr(5,2)") == 10.0);
    REQUIRE(ev.evaluate("npr(5,2)") == 20.0);
    REQUIRE(ev.evaluate("floor(2.7) + ceil(2.2)") == 5.0);
}

TEST_CASE("ExpressionEvaluator rejects non-numeric text", "[expr]") {
    ExpressionEvaluator ev;

    REQUIRE_FALSE(ev.tryEvaluate("abc").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("   ").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("hello world").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("1 2").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("(1+2").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("3+").has_value());
    REQUIRE_FALSE(ev.tryEvaluate("pow(2)").has_value());
    REQUIRE_THROWS_AS(ev.evaluate("Bob"), EvalError);

    auto ok = ev.tryEvaluate("0+1");
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 1.0);
}

TEST_CASE("ExpressionEvaluator division by zero yields infinity", "[expr]") {
    ExpressionEvaluator ev;
    REQUIRE(std::isinf(ev.evaluate("1/0")));
}

TEST_CASE("ExpressionEvaluator formats numbers", "[expr]") {
    REQUIRE(ExpressionEvaluator::formatNumber(2.0) == "2");
    REQUIRE(ExpressionEvaluator::formatNumber(-7.0) == "-7");
    REQUIRE(ExpressionEvaluator::formatNumber(0.0) == "0");
    REQUIRE(ExpressionEvaluator::formatNumber(2.5) == "2.5");
    REQUIRE(ExpressionEvaluator::formatNumber(0.1) == "0.1");
    REQUIRE(ExpressionEvaluator::formatNumber(1.0 / 3.0) == "0.3333333333333333");
    REQUIRE(ExpressionEvaluator::formatNumber(0.001) == "0.001");
    REQUIRE(ExpressionEvaluator::formatNumber(1500.0) == "1500");
    REQUIRE(ExpressionEvaluator::formatNumber(1e21) == "1000000000000000000000");
    REQUIRE(ExpressionEvaluator::formatNumber(std::numeric_limits<double>::infinity()) == "inf");
    REQUIRE(ExpressionEvaluator::formatNumber(-std::numeric_limits<double>::infinity()) == "-inf");
    REQUIRE(ExpressionEvaluator::formatNumber(std::nan("")) == "NaN");
}
