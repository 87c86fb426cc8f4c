#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace expr {

// Exception type for evaluation failures
struct EvalError : public std::runtime_error {
    size_t position;
    EvalError(const std::string& m, size_t p)
        : std::runtime_error(m), position(p) {}
};

/**
 * ExpressionEvaluator
 *
 * Numeric expression evaluator over plain text, used by assignments and
 * conditionals to decide whether a value is a number. Supports
 * + - * / % ^, unary signs, parentheses, the comma operator, the
 * constants pi and e, and the usual math functions (sin, sqrt, pow...).
 * Anything that is not a complete numeric expression is an error.
 */
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;

    // Evaluate the whole text; throws EvalError on any syntax problem
    double evaluate(const std::string& source) const;

    // Evaluate, mapping failure to an empty optional
    std::optional<double> tryEvaluate(const std::string& source) const;

    // Text form of a numeric result: integral values without a fraction,
    // others with the shortest representation that reads back the same.
    static std::string formatNumber(double value);

private:
    // Pratt parser entry
    double parseExpression(const std::string& s, size_t& pos, int minBp) const;

    // Primaries and helpers
    double parsePrimary(const std::string& s, size_t& pos) const;
    double parseNumber(const std::string& s, size_t& pos) const;
    double callFunction(const std::string& name, const std::string& s, size_t& pos) const;

    // Utilities
    static void skipSpaces(const std::string& s, size_t& pos);
    static bool isAsciiDigit(char c);
    static bool isAsciiAlpha(char c);
    static std::string readIdentifier(const std::string& s, size_t& pos);

    // Operator handling
    struct OpInfo { char op; int lbp; };
    static OpInfo peekOperator(const std::string& s, size_t pos);
    static double applyOperator(char op, double a, double b);
};

} // namespace expr
