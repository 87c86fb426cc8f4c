#pragma once

#include <vector>

#include "../Runtime/ScriptError.hpp"

namespace storyline {

class ScriptStore;
class LabelTable;
class VariableStore;

/**
 * Pre-scan pass, run once before execution.
 *
 * Declares every `:label` (last declaration wins) and every top-level
 * `@name=value` variable (initial value "0"). Redeclared labels and `@`
 * lines that do not split into exactly one name and one value are not
 * errors here; they are returned as DUPLICATE_LABEL and
 * MALFORMED_DECLARATION diagnostics so the caller can warn or, in strict
 * mode, refuse to run.
 */
std::vector<ScriptError> preScan(const ScriptStore& script, LabelTable& labels, VariableStore& vars);

/**
 * Static check over an already pre-scanned script: malformed directives,
 * goto/branch/menu targets with no label, input targets and conditional
 * assignments naming undeclared variables. Nothing is executed.
 */
std::vector<ScriptError> checkScript(const ScriptStore& script, const LabelTable& labels, const VariableStore& vars);

} // namespace storyline
