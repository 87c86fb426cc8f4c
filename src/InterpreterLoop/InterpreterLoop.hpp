#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../ScriptStore/ScriptStore.hpp"
#include "../Runtime/ScriptError.hpp"

namespace storyline {

/**
 * InterpreterLoop
 *
 * Program-counter driven execution loop over a ScriptStore. Each step
 * hands the current line to a pluggable statement handler, which either
 * falls through (next line) or names the line to continue at. The loop
 * halts when the counter reaches the end of the script or when the
 * handler throws; the error is then kept for the caller in lastError().
 */
class InterpreterLoop {
public:
    // Execution result for a single step
    enum class StepResult {
        Continued,   // Proceed to next line
        Jumped,      // Control transferred to another line
        Halted       // End of script reached, stopped, or error
    };

    // Diagnostic / trace callback: (lineIndex, rawText)
    using TraceCallback = std::function<void(size_t, const std::string&)>;

    // Statement handler callback: execute one line and return an optional
    // next line override (nullopt = fall through). Throws to signal an error.
    using StatementHandler = std::function<std::optional<size_t>(const ScriptStore::ScriptLine&, size_t)>;

    explicit InterpreterLoop(std::shared_ptr<ScriptStore> script);
    ~InterpreterLoop();

    // Configuration
    void setTrace(bool enabled) { traceEnabled = enabled; }
    bool getTrace() const { return traceEnabled; }
    void setTraceCallback(TraceCallback cb) { trace = std::move(cb); }
    void setStatementHandler(StatementHandler cb) { handler = std::move(cb); }

    // Program control
    void reset();
    void run();               // run from line 0
    void cont();              // continue from the current line
    void stop();              // halt after the current step
    void setCurrentLine(size_t lineIndex);
    size_t getCurrentLine() const { return currentLine; }

    // Single-step execution (useful for tests)
    StepResult step();

    bool isHalted() const { return halted; }
    // True once the counter has reached the end of the script
    bool isFinished() const;
    const std::optional<ScriptError>& lastError() const { return error; }

private:
    std::shared_ptr<ScriptStore> prog;
    bool halted{false};
    bool traceEnabled{false};
    TraceCallback trace{};
    StatementHandler handler{};
    std::optional<ScriptError> error{};

    size_t currentLine{0};

    StepResult fail(ScriptError e);
};

} // namespace storyline
