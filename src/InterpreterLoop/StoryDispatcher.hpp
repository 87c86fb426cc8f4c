#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "PromptReader.hpp"
#include "../ScriptStore/ScriptStore.hpp"
#include "../ExpressionEvaluator/ExpressionEvaluator.hpp"
#include "../Runtime/LabelTable.hpp"
#include "../Runtime/ScriptError.hpp"
#include "../Runtime/VariableStore.hpp"

namespace storyline {

// Executes one story line at a time for InterpreterLoop.
// It supports every directive kind:
// - labels, comments and blank lines (no-ops), '|' (empty output line)
// - #label goto
// - !a<op>b:then[:else] with numeric or string comparison
// - @name=value assignment and @-bearing text
// - ?prompt:label menu blocks and ^i / ^s input requests
// - plain text with @name substitution
// Returns the next line override (nullopt = fall through). Throws ScriptError on errors.
class StoryDispatcher {
public:
    using PrintCallback = PromptReader::PrintCallback;
    using ReadLineCallback = PromptReader::ReadLineCallback;

    StoryDispatcher(std::shared_ptr<ScriptStore> script, PrintCallback printCb, ReadLineCallback readCb);

    // Run the pre-scan over the script: declares labels and variables.
    // Returns the pre-scan diagnostics (duplicate labels, malformed declarations).
    std::vector<ScriptError> prepare();

    std::optional<size_t> operator()(const ScriptStore::ScriptLine& line, size_t lineIndex);

    // Comparison of already substituted condition text, e.g. "3>=2"
    bool evaluateCondition(const std::string& condition, size_t lineIndex) const;

    LabelTable& getLabels() { return labels; }
    const LabelTable& getLabels() const { return labels; }
    VariableStore& getVariables() { return vars; }
    const VariableStore& getVariables() const { return vars; }

private:
    std::shared_ptr<ScriptStore> script;
    PrintCallback print;
    LabelTable labels;
    VariableStore vars;
    expr::ExpressionEvaluator ev;
    PromptReader prompts;

    std::optional<size_t> executeConditional(const Directive& d, size_t lineIndex);
    std::optional<size_t> executeBranch(const Branch& b, size_t lineIndex);
    void assign(const std::string& name, const std::string& rhs, size_t lineIndex);
    std::optional<size_t> executeMenu(size_t lineIndex);
    void executeInput(const Directive& d, size_t lineIndex);

    static std::string findComparisonOperator(const std::string& condition);
};

} // namespace storyline
