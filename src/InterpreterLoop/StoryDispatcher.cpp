#include "StoryDispatcher.hpp"

#include <utility>

#include "../ScriptStore/PreScan.hpp"
#include "../Runtime/TextFunctions.hpp"

namespace storyline {

StoryDispatcher::StoryDispatcher(std::shared_ptr<ScriptStore> s, PrintCallback printCb, ReadLineCallback readCb)
    : script(std::move(s)), print(printCb), prompts(printCb, std::move(readCb)) {}

std::vector<ScriptError> StoryDispatcher::prepare() {
    labels.clear();
    vars.clear();
    if (!script) return {};
    return preScan(*script, labels, vars);
}

std::optional<size_t> StoryDispatcher::operator()(const ScriptStore::ScriptLine& line, size_t lineIndex) {
    const Directive& d = line.directive;
    if (d.isMalformed()) {
        throw ScriptError(ErrorCodes::MALFORMED_DIRECTIVE, d.malformed, lineIndex);
    }

    switch (d.kind) {
        case DirectiveKind::Blank:
        case DirectiveKind::Label:
        case DirectiveKind::Comment:
            return std::nullopt;

        case DirectiveKind::BlankLine:
            print("");
            return std::nullopt;

        case DirectiveKind::Goto:
            return labels.resolve(d.label, lineIndex);

        case DirectiveKind::Conditional:
            return executeConditional(d, lineIndex);

        case DirectiveKind::Assignment:
            assign(d.name, d.value, lineIndex);
            return std::nullopt;

        case DirectiveKind::Menu:
            return executeMenu(lineIndex);

        case DirectiveKind::Input:
            executeInput(d, lineIndex);
            return std::nullopt;

        case DirectiveKind::VariableText:
        case DirectiveKind::Text:
            print(vars.substitute(line.text, lineIndex));
            return std::nullopt;
    }
    return std::nullopt;
}

// Leftmost operator wins; at the same position two-character operators come first.
std::string StoryDispatcher::findComparisonOperator(const std::string& condition) {
    static const char* const OPERATORS[] = {"!=", "==", "<=", ">=", "<", ">"};
    for (size_t pos = 0; pos < condition.size(); ++pos) {
        for (const char* op : OPERATORS) {
            if (condition.compare(pos, std::char_traits<char>::length(op), op) == 0) return op;
        }
    }
    return std::string();
}

bool StoryDispatcher::evaluateCondition(const std::string& condition, size_t lineIndex) const {
    std::string op = findComparisonOperator(condition);
    if (op.empty()) {
        throw ScriptError(ErrorCodes::MALFORMED_DIRECTIVE,
                          "Condition '" + condition + "' needs a left side, an operator and a right side",
                          lineIndex);
    }
    auto operands = text::splitAll(condition, op);
    if (operands.size() != 2) {
        throw ScriptError(ErrorCodes::MALFORMED_DIRECTIVE,
                          "Condition '" + condition + "' must contain exactly one '" + op + "'",
                          lineIndex);
    }
    const std::string& left = operands[0];
    const std::string& right = operands[1];

    auto lvalue = ev.tryEvaluate(left);
    auto rvalue = ev.tryEvaluate(right);

    if (!lvalue || !rvalue) {
        // At least one side is text: only equality is defined
        if (op == "==") return left == right;
        if (op == "!=") return left != right;
        throw ScriptError(ErrorCodes::NON_NUMERIC_ORDERING,
                          "Text cannot be compared with " + op + ": '" + left + "' " + op + " '" + right + "'",
                          lineIndex);
    }

    double a = *lvalue;
    double b = *rvalue;
    if (op == "==") return a == b;
    if (op == "!=") return a != b;
    if (op == "<=") return a <= b;
    if (op == ">=") return a >= b;
    if (op == "<") return a < b;
    return a > b;
}

std::optional<size_t> StoryDispatcher::executeConditional(const Directive& d, size_t lineIndex) {
    std::string condition = vars.substitute(d.condition, lineIndex);
    if (evaluateCondition(condition, lineIndex)) {
        return executeBranch(d.thenBranch, lineIndex);
    }
    if (d.hasElse) {
        return executeBranch(d.elseBranch, lineIndex);
    }
    return std::nullopt;
}

std::optional<size_t> StoryDispatcher::executeBranch(const Branch& b, size_t lineIndex) {
    if (b.isMalformed()) {
        throw ScriptError(ErrorCodes::MALFORMED_DIRECTIVE, b.malformed, lineIndex);
    }
    switch (b.kind) {
        case Branch::Kind::Goto:
            return labels.resolve(b.label, lineIndex);
        case Branch::Kind::Assign:
            assign(b.name, b.value, lineIndex);
            return std::nullopt;
        case Branch::Kind::Print:
            print(b.text);
            return std::nullopt;
    }
    return std::nullopt;
}

void StoryDispatcher::assign(const std::string& name, const std::string& rhs, size_t lineIndex) {
    // Target must exist before the right-hand side is looked at
    vars.get(name, lineIndex);
    std::string value = vars.substitute(rhs, lineIndex);
    if (auto number = ev.tryEvaluate(value)) {
        vars.set(name, expr::ExpressionEvaluator::formatNumber(*number), lineIndex);
    } else {
        vars.set(name, value, lineIndex);
    }
}

std::optional<size_t> StoryDispatcher::executeMenu(size_t lineIndex) {
    std::vector<std::string> options;
    std::vector<size_t> optionLines;
    for (size_t i = lineIndex; i < script->size(); ++i) {
        const Directive& d = script->directive(i);
        if (d.kind != DirectiveKind::Menu) break;
        if (d.isMalformed()) {
            throw ScriptError(ErrorCodes::MALFORMED_DIRECTIVE, d.malformed, i);
        }
        options.push_back(d.prompt);
        optionLines.push_back(i);
    }

    size_t choice = prompts.chooseOption(options, lineIndex);
    size_t optionLine = optionLines[choice - 1];
    return labels.resolve(script->directive(optionLine).label, optionLine);
}

void StoryDispatcher::executeInput(const Directive& d, size_t lineIndex) {
    vars.get(d.name, lineIndex);

    std::string answer;
    switch (d.inputMode) {
        case InputMode::Numeric:
            answer = prompts.readNumber(d.prompt, lineIndex);
            break;
        case InputMode::FreeText:
            answer = prompts.readText(d.prompt, lineIndex);
            break;
        case InputMode::Unknown:
            throw ScriptError(ErrorCodes::MALFORMED_DIRECTIVE,
                              "Input mode must be 'i' or 's', as in ^iHow many?:@count", lineIndex);
    }
    vars.set(d.name, answer, lineIndex);
}

} // namespace storyline
