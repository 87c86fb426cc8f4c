#include "PreScan.hpp"

#include <string>

#include "ScriptStore.hpp"
#include "../Runtime/LabelTable.hpp"
#include "../Runtime/VariableStore.hpp"

namespace storyline {

std::vector<ScriptError> preScan(const ScriptStore& script, LabelTable& labels, VariableStore& vars) {
    std::vector<ScriptError> diagnostics;

    for (size_t index = 0; index < script.size(); ++index) {
        const auto& line = script.at(index);
        const Directive& d = line.directive;

        switch (d.kind) {
            case DirectiveKind::Label:
                if (!labels.declare(d.label, index)) {
                    diagnostics.emplace_back(ErrorCodes::DUPLICATE_LABEL,
                                             "Label '" + d.label + "' is declared again; this declaration wins",
                                             index);
                }
                break;
            case DirectiveKind::Assignment:
                vars.declare(d.name);
                break;
            case DirectiveKind::VariableText:
                // '@' line without exactly one '=': never a declaration
                if (line.text.find('=') != std::string::npos) {
                    diagnostics.emplace_back(ErrorCodes::MALFORMED_DECLARATION,
                                             "'" + line.text + "' is not a declaration: expected exactly one '='",
                                             index);
                }
                break;
            default:
                break;
        }
    }

    return diagnostics;
}

namespace {

void checkLabel(const LabelTable& labels, const std::string& label, size_t index,
                std::vector<ScriptError>& problems) {
    if (!labels.contains(label)) {
        problems.emplace_back(ErrorCodes::MISSING_LABEL, "Goto target '" + label + "' is not declared", index);
    }
}

void checkBranch(const Branch& b, const LabelTable& labels, const VariableStore& vars, size_t index,
                 std::vector<ScriptError>& problems) {
    if (b.isMalformed()) {
        problems.emplace_back(ErrorCodes::MALFORMED_DIRECTIVE, b.malformed, index);
        return;
    }
    if (b.kind == Branch::Kind::Goto) {
        checkLabel(labels, b.label, index, problems);
    } else if (b.kind == Branch::Kind::Assign && !vars.contains(b.name)) {
        problems.emplace_back(ErrorCodes::UNDECLARED_VARIABLE,
                              "Variable @" + b.name + " is assigned but never declared", index);
    }
}

} // namespace

std::vector<ScriptError> checkScript(const ScriptStore& script, const LabelTable& labels, const VariableStore& vars) {
    std::vector<ScriptError> problems;

    for (size_t index = 0; index < script.size(); ++index) {
        const Directive& d = script.directive(index);
        if (d.isMalformed()) {
            problems.emplace_back(ErrorCodes::MALFORMED_DIRECTIVE, d.malformed, index);
            continue;
        }
        switch (d.kind) {
            case DirectiveKind::Goto:
            case DirectiveKind::Menu:
                checkLabel(labels, d.label, index, problems);
                break;
            case DirectiveKind::Conditional:
                checkBranch(d.thenBranch, labels, vars, index, problems);
                if (d.hasElse) checkBranch(d.elseBranch, labels, vars, index, problems);
                break;
            case DirectiveKind::Input:
                if (!vars.contains(d.name)) {
                    problems.emplace_back(ErrorCodes::UNDECLARED_VARIABLE,
                                          "Input target @" + d.name + " is never declared", index);
                }
                if (d.inputMode == InputMode::Unknown) {
                    problems.emplace_back(ErrorCodes::MALFORMED_DIRECTIVE,
                                          "Input mode must be 'i' or 's', as in ^iHow many?:@count", index);
                }
                break;
            default:
                break;
        }
    }

    return problems;
}

} // namespace storyline
