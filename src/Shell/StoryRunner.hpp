#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../InterpreterLoop/StoryDispatcher.hpp"
#include "../Runtime/ScriptError.hpp"
#include "../ScriptStore/ScriptStore.hpp"

namespace storyline {

// Command line of the story players
struct RunOptions {
    std::string scriptPath;
    bool trace = false;
    bool strict = false;
    bool check = false;
};

void printUsage(const char* program);

// Returns false on a usage error
bool parseArguments(int argc, char* argv[], RunOptions& opts, bool& showHelp);

// "?<name>: <message> in line <n>", n 1-based
std::string formatError(const ScriptError& e);

void reportDiagnostics(const std::vector<ScriptError>& diagnostics, const char* severity);

// Load the script named by opts; load failures are reported and yield nullptr
std::shared_ptr<ScriptStore> loadScript(const RunOptions& opts);

// Pre-scan and run the story to its end. Returns the error that stopped it, if any.
// Pre-scan diagnostics go to stderr, except the one returned in strict mode.
std::optional<ScriptError> runStory(const std::shared_ptr<ScriptStore>& script, const RunOptions& opts,
                                    StoryDispatcher::PrintCallback print,
                                    StoryDispatcher::ReadLineCallback readLine);

// --check: report every problem found without running; returns the exit code
int runCheckMode(const ScriptStore& script);

} // namespace storyline
