#include "InterpreterLoop.hpp"

#include <exception>
#include <utility>

namespace storyline {

InterpreterLoop::InterpreterLoop(std::shared_ptr<ScriptStore> script)
    : prog(std::move(script)) {}

InterpreterLoop::~InterpreterLoop() = default;

void InterpreterLoop::reset() {
    halted = false;
    currentLine = 0;
    error.reset();
}

void InterpreterLoop::run() {
    reset();
    cont();
}

void InterpreterLoop::cont() {
    if (!prog) return;
    halted = false;
    while (!halted) {
        if (step() == StepResult::Halted) break;
    }
}

void InterpreterLoop::stop() { halted = true; }

void InterpreterLoop::setCurrentLine(size_t lineIndex) {
    currentLine = lineIndex;
}

bool InterpreterLoop::isFinished() const {
    return !prog || currentLine >= prog->size();
}

InterpreterLoop::StepResult InterpreterLoop::fail(ScriptError e) {
    if (!e.hasLine()) e.setLineIndex(currentLine);
    error = std::move(e);
    halted = true;
    return StepResult::Halted;
}

InterpreterLoop::StepResult InterpreterLoop::step() {
    if (halted || !prog) return StepResult::Halted;

    if (currentLine >= prog->size()) {
        // No more lines
        halted = true;
        return StepResult::Halted;
    }

    const auto& line = prog->at(currentLine);
    if (traceEnabled && trace) trace(currentLine, line.text);

    std::optional<size_t> nextOverride;
    if (handler) {
        try {
            nextOverride = handler(line, currentLine);
        } catch (const ScriptError& e) {
            return fail(e);
        } catch (const std::exception& e) {
            return fail(ScriptError(ErrorCodes::INTERNAL_ERROR, e.what(), currentLine));
        }
    }

    if (halted) return StepResult::Halted;

    if (nextOverride) {
        if (*nextOverride > prog->size()) {
            return fail(ScriptError(ErrorCodes::INTERNAL_ERROR,
                                    "Jump to line " + std::to_string(*nextOverride) + " is outside the script",
                                    currentLine));
        }
        currentLine = *nextOverride;
        return StepResult::Jumped;
    }

    // Fall through to next line
    ++currentLine;
    if (currentLine >= prog->size()) {
        halted = true;
        return StepResult::Halted;
    }
    return StepResult::Continued;
}

} // namespace storyline
