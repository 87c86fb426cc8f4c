#include "ExpressionEvaluator.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace expr {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double E = 2.71828182845904523536;

// Binding powers; '^' is left-associative like the other binary operators
constexpr int BP_COMMA = 10;
constexpr int BP_ADD = 20;
constexpr int BP_MUL = 30;
constexpr int BP_POW = 40;

double factorial(double a) {
    if (a < 0.0) return std::numeric_limits<double>::quiet_NaN();
    if (a > static_cast<double>(std::numeric_limits<unsigned int>::max())) {
        return std::numeric_limits<double>::infinity();
    }
    auto n = static_cast<unsigned int>(a);
    double result = 1.0;
    for (unsigned int i = 1; i <= n; ++i) {
        result *= i;
        if (std::isinf(result)) break;
    }
    return result;
}

double combinations(double n, double r) {
    if (n < 0.0 || r < 0.0 || n < r) return std::numeric_limits<double>::quiet_NaN();
    if (n > static_cast<double>(std::numeric_limits<unsigned int>::max()) ||
        r > static_cast<double>(std::numeric_limits<unsigned int>::max())) {
        return std::numeric_limits<double>::infinity();
    }
    auto un = static_cast<unsigned long>(n);
    auto ur = static_cast<unsigned long>(r);
    if (ur > un / 2) ur = un - ur;
    double result = 1.0;
    for (unsigned long i = 1; i <= ur; ++i) {
        result *= static_cast<double>(un - ur + i) / static_cast<double>(i);
    }
    return std::round(result);
}

} // namespace

double ExpressionEvaluator::evaluate(const std::string& source) const {
    size_t pos = 0;
    skipSpaces(source, pos);
    if (pos >= source.size()) throw EvalError("Empty expression", pos);
    double value = parseExpression(source, pos, 0);
    skipSpaces(source, pos);
    if (pos < source.size()) throw EvalError("Unexpected character", pos);
    return value;
}

std::optional<double> ExpressionEvaluator::tryEvaluate(const std::string& source) const {
    try {
        return evaluate(source);
    } catch (const EvalError&) {
        return std::nullopt;
    }
}

std::string ExpressionEvaluator::formatNumber(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

    // Shortest scientific form that reads back exactly
    char buf[64];
    for (int precision = 0; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }

    std::string sci(buf);
    bool negative = !sci.empty() && sci[0] == '-';
    size_t ePos = sci.find('e');
    std::string mantissa = sci.substr(negative ? 1 : 0, ePos - (negative ? 1 : 0));
    int exponent = std::atoi(sci.c_str() + ePos + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') digits.push_back(c);
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    // Render positionally: value = 0.d1d2... * 10^(exponent + 1)
    int point = exponent + 1;
    std::string out = negative ? "-" : "";
    if (digits == "0") {
        out += "0";
    } else if (point <= 0) {
        out += "0." + std::string(static_cast<size_t>(-point), '0') + digits;
    } else if (static_cast<size_t>(point) >= digits.size()) {
        out += digits + std::string(static_cast<size_t>(point) - digits.size(), '0');
    } else {
        out += digits.substr(0, static_cast<size_t>(point)) + "." + digits.substr(static_cast<size_t>(point));
    }
    return out;
}

bool ExpressionEvaluator::isAsciiDigit(char c) { return c >= '0' && c <= '9'; }
bool ExpressionEvaluator::isAsciiAlpha(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z'); }

void ExpressionEvaluator::skipSpaces(const std::string& s, size_t& pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
}

std::string ExpressionEvaluator::readIdentifier(const std::string& s, size_t& pos) {
    std::string id;
    while (pos < s.size() && (isAsciiAlpha(s[pos]) || isAsciiDigit(s[pos]) || s[pos] == '_')) {
        id.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[pos]))));
        pos++;
    }
    return id;
}

ExpressionEvaluator::OpInfo ExpressionEvaluator::peekOperator(const std::string& s, size_t pos) {
    OpInfo none{'\0', -1};
    if (pos >= s.size()) return none;
    switch (s[pos]) {
        case ',': return {',', BP_COMMA};
        case '+': return {'+', BP_ADD};
        case '-': return {'-', BP_ADD};
        case '*': return {'*', BP_MUL};
        case '/': return {'/', BP_MUL};
        case '%': return {'%', BP_MUL};
        case '^': return {'^', BP_POW};
        default: return none;
    }
}

double ExpressionEvaluator::applyOperator(char op, double a, double b) {
    switch (op) {
        case ',': return b;
        case '+': return a + b;
        case '-': return a - b;
        case '*': return a * b;
        case '/': return a / b;
        case '%': return std::fmod(a, b);
        case '^': return std::pow(a, b);
        default: throw EvalError("Unknown operator", 0);
    }
}

double ExpressionEvaluator::parseNumber(const std::string& s, size_t& pos) const {
    const char* begin = s.c_str() + pos;
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) throw EvalError("Invalid number", pos);
    pos += static_cast<size_t>(end - begin);
    return value;
}

double ExpressionEvaluator::parsePrimary(const std::string& s, size_t& pos) const {
    skipSpaces(s, pos);
    if (pos >= s.size()) throw EvalError("Missing operand", pos);
    char t = s[pos];

    // Unary signs bind tighter than '^': -2^2 == 4
    if (t == '+' || t == '-') {
        ++pos;
        double rhs = parsePrimary(s, pos);
        return t == '-' ? -rhs : rhs;
    }

    if (isAsciiDigit(t) || t == '.') {
        return parseNumber(s, pos);
    }

    if (t == '(') {
        ++pos;
        double inner = parseExpression(s, pos, 0);
        skipSpaces(s, pos);
        if (pos >= s.size() || s[pos] != ')') throw EvalError("Missing )", pos);
        ++pos;
        return inner;
    }

    if (isAsciiAlpha(t)) {
        auto name = readIdentifier(s, pos);
        return callFunction(name, s, pos);
    }

    throw EvalError("Syntax error", pos);
}

double ExpressionEvaluator::callFunction(const std::string& name, const std::string& s, size_t& pos) const {
    // Constants accept an optional empty argument list
    if (name == "pi" || name == "e") {
        size_t save = pos;
        skipSpaces(s, pos);
        if (pos + 1 < s.size() && s[pos] == '(') {
            size_t p = pos + 1;
            skipSpaces(s, p);
            if (p < s.size() && s[p] == ')') {
                pos = p + 1;
                return name == "pi" ? PI : E;
            }
        }
        pos = save;
        return name == "pi" ? PI : E;
    }

    // Two-argument functions require a parenthesized pair
    if (name == "atan2" || name == "pow" || name == "ncr" || name == "npr") {
        skipSpaces(s, pos);
        if (pos >= s.size() || s[pos] != '(') throw EvalError("Expected ( after " + name, pos);
        ++pos;
        double a = parseExpression(s, pos, BP_COMMA + 1);
        skipSpaces(s, pos);
        if (pos >= s.size() || s[pos] != ',') throw EvalError("Expected , in " + name, pos);
        ++pos;
        double b = parseExpression(s, pos, BP_COMMA + 1);
        skipSpaces(s, pos);
        if (pos >= s.size() || s[pos] != ')') throw EvalError("Missing )", pos);
        ++pos;
        if (name == "atan2") return std::atan2(a, b);
        if (name == "pow") return std::pow(a, b);
        if (name == "ncr") return combinations(a, b);
        return combinations(a, b) * factorial(b);
    }

    // One-argument functions take a signed operand: "sqrt 4" or "sqrt(4)"
    double (*fn)(double) = nullptr;
    if (name == "abs") fn = [](double x) { return std::fabs(x); };
    else if (name == "acos") fn = [](double x) { return std::acos(x); };
    else if (name == "asin") fn = [](double x) { return std::asin(x); };
    else if (name == "atan") fn = [](double x) { return std::atan(x); };
    else if (name == "ceil") fn = [](double x) { return std::ceil(x); };
    else if (name == "cos") fn = [](double x) { return std::cos(x); };
    else if (name == "cosh") fn = [](double x) { return std::cosh(x); };
    else if (name == "exp") fn = [](double x) { return std::exp(x); };
    else if (name == "fac") fn = [](double x) { return factorial(x); };
    else if (name == "floor") fn = [](double x) { return std::floor(x); };
    else if (name == "ln") fn = [](double x) { return std::log(x); };
    else if (name == "log" || name == "log10") fn = [](double x) { return std::log10(x); };
    else if (name == "sin") fn = [](double x) { return std::sin(x); };
    else if (name == "sinh") fn = [](double x) { return std::sinh(x); };
    else if (name == "sqrt") fn = [](double x) { return std::sqrt(x); };
    else if (name == "tan") fn = [](double x) { return std::tan(x); };
    else if (name == "tanh") fn = [](double x) { return std::tanh(x); };

    if (!fn) throw EvalError("Unknown identifier: " + name, pos);
    return fn(parsePrimary(s, pos));
}

// Pratt parser with binding powers above
double ExpressionEvaluator::parseExpression(const std::string& s, size_t& pos, int minBp) const {
    double lhs = parsePrimary(s, pos);
    skipSpaces(s, pos);

    while (pos < s.size()) {
        OpInfo op = peekOperator(s, pos);
        if (op.lbp < minBp) break;
        ++pos;
        double rhs = parseExpression(s, pos, op.lbp + 1);
        lhs = applyOperator(op.op, lhs, rhs);
        skipSpaces(s, pos);
    }

    return lhs;
}

} // namespace expr
