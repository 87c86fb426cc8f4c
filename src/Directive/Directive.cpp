#include "Directive.hpp"

#include <vector>

#include "../Runtime/TextFunctions.hpp"

namespace storyline {

Directive DirectiveParser::parse(const std::string& line) {
    Directive d;
    if (line.empty()) return d;

    switch (line[0]) {
        case '\r':
        case '\n':
            d.kind = DirectiveKind::Blank;
            break;
        case ':':
            d.kind = DirectiveKind::Label;
            d.label = line.substr(1);
            break;
        case '*':
            d.kind = DirectiveKind::Comment;
            break;
        case '|':
            d.kind = DirectiveKind::BlankLine;
            break;
        case '#':
            d.kind = DirectiveKind::Goto;
            d.label = text::stripLeading(line, '#');
            break;
        case '!':
            parseConditional(line, d);
            break;
        case '@':
            parseAtLine(line, d);
            break;
        case '?':
            parseMenu(line, d);
            break;
        case '^':
            parseInput(line, d);
            break;
        default:
            d.kind = DirectiveKind::Text;
            break;
    }
    return d;
}

Branch DirectiveParser::parseBranch(const std::string& source) {
    Branch b;
    b.text = source;
    if (source.empty()) {
        b.malformed = "Conditional branch is empty";
        return b;
    }
    if (source[0] == '#') {
        b.kind = Branch::Kind::Goto;
        b.label = text::stripLeading(source, '#');
    } else if (source[0] == '@') {
        b.kind = Branch::Kind::Assign;
        auto parts = text::splitAll(source, "=");
        if (parts.size() != 2) {
            b.malformed = "Assignment '" + source + "' has " + std::to_string(parts.size()) +
                          " parts but needs exactly 2 separated by '='";
            return b;
        }
        b.name = parts[0].substr(1);
        b.value = parts[1];
    } else {
        b.kind = Branch::Kind::Print;
    }
    return b;
}

void DirectiveParser::parseConditional(const std::string& line, Directive& d) {
    d.kind = DirectiveKind::Conditional;
    auto parts = text::splitAll(line, ":");
    if (parts.size() < 2 || parts.size() > 3) {
        d.malformed = "Conditional '" + line + "' has " + std::to_string(parts.size()) +
                      " parts but needs 2 or 3 separated by ':'";
        return;
    }
    d.condition = parts[0].substr(1);
    d.thenBranch = parseBranch(text::trim(parts[1]));
    if (parts.size() == 3) {
        d.hasElse = true;
        d.elseBranch = parseBranch(text::trim(parts[2]));
    }
}

void DirectiveParser::parseAtLine(const std::string& line, Directive& d) {
    auto parts = text::splitAll(line, "=");
    if (parts.size() != 2) {
        // Not a single assignment: text that mentions variables
        d.kind = DirectiveKind::VariableText;
        return;
    }
    d.kind = DirectiveKind::Assignment;
    d.name = parts[0].substr(1);
    d.value = parts[1];
}

void DirectiveParser::parseMenu(const std::string& line, Directive& d) {
    d.kind = DirectiveKind::Menu;
    auto parts = text::splitAll(line, ":");
    if (parts.size() != 2) {
        d.malformed = "Menu option '" + line + "' has " + std::to_string(parts.size()) +
                      " parts but needs exactly 2 separated by ':'";
        return;
    }
    d.prompt = parts[0].substr(1);
    d.label = text::stripLeading(parts[1], '#');
}

void DirectiveParser::parseInput(const std::string& line, Directive& d) {
    d.kind = DirectiveKind::Input;
    auto parts = text::splitAll(line, ":");
    if (parts.size() != 2 || parts[1].empty()) {
        d.malformed = "Input '" + line + "' has " + std::to_string(parts.size()) +
                      " parts but needs a prompt and a variable separated by ':'";
        return;
    }
    const std::string& left = parts[0];
    d.name = parts[1].substr(1);
    if (left.size() >= 2) {
        if (left[1] == 'i') d.inputMode = InputMode::Numeric;
        else if (left[1] == 's') d.inputMode = InputMode::FreeText;
        d.prompt = left.substr(2);
    }
}

const char* DirectiveParser::kindName(DirectiveKind kind) {
    switch (kind) {
        case DirectiveKind::Blank: return "blank";
        case DirectiveKind::Label: return "label";
        case DirectiveKind::Comment: return "comment";
        case DirectiveKind::BlankLine: return "blank line";
        case DirectiveKind::Goto: return "goto";
        case DirectiveKind::Conditional: return "conditional";
        case DirectiveKind::Assignment: return "assignment";
        case DirectiveKind::VariableText: return "variable text";
        case DirectiveKind::Menu: return "menu";
        case DirectiveKind::Input: return "input";
        case DirectiveKind::Text: return "text";
    }
    return "unknown";
}

} // namespace storyline
