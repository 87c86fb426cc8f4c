#include "StoryRunner.hpp"

#include <iostream>
#include <utility>

#include "../InterpreterLoop/InterpreterLoop.hpp"
#include "../Runtime/LabelTable.hpp"
#include "../Runtime/VariableStore.hpp"
#include "../ScriptStore/PreScan.hpp"

namespace storyline {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] <script>\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help   Show this help\n";
    std::cout << "  --trace      Log every executed line to stderr\n";
    std::cout << "  --strict     Treat duplicate labels and malformed declarations as errors\n";
    std::cout << "  --check      Check the script for problems without running it\n";
    std::cout << "\n";
    std::cout << "Script lines:\n";
    std::cout << "  :label              label\n";
    std::cout << "  @name=value         variable assignment (declares the variable)\n";
    std::cout << "  !a==b:then[:else]   conditional (== != < > <= >=)\n";
    std::cout << "  #label              goto\n";
    std::cout << "  ?text:label         menu option (consecutive lines form one menu)\n";
    std::cout << "  ^iprompt:@name      numeric input\n";
    std::cout << "  ^sprompt:@name      text input\n";
    std::cout << "  |                   empty line\n";
    std::cout << "  *comment            ignored\n";
    std::cout << "  anything else       printed, with @name replaced by its value\n";
}

bool parseArguments(int argc, char* argv[], RunOptions& opts, bool& showHelp) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            showHelp = true;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--strict") {
            opts.strict = true;
        } else if (arg == "--check") {
            opts.check = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            return false;
        } else if (opts.scriptPath.empty()) {
            opts.scriptPath = arg;
        } else {
            std::cerr << "Error: only one script can be run at a time" << std::endl;
            return false;
        }
    }
    return showHelp || !opts.scriptPath.empty();
}

std::string formatError(const ScriptError& e) {
    std::string text = "?" + std::string(errorName(e.getErrorCode())) + ": " + e.what();
    if (e.hasLine()) text += " in line " + std::to_string(e.getLineIndex() + 1);
    return text;
}

void reportDiagnostics(const std::vector<ScriptError>& diagnostics, const char* severity) {
    for (const auto& d : diagnostics) {
        std::cerr << "[PreScan] " << severity << ": " << d.what()
                  << " (line " << d.getLineIndex() + 1 << ")" << std::endl;
    }
}

std::shared_ptr<ScriptStore> loadScript(const RunOptions& opts) {
    auto script = std::make_shared<ScriptStore>();
    try {
        script->loadFromFile(opts.scriptPath);
    } catch (const ScriptError& e) {
        std::cerr << formatError(e) << std::endl;
        return nullptr;
    }
    return script;
}

std::optional<ScriptError> runStory(const std::shared_ptr<ScriptStore>& script, const RunOptions& opts,
                                    StoryDispatcher::PrintCallback print,
                                    StoryDispatcher::ReadLineCallback readLine) {
    StoryDispatcher dispatcher(script, std::move(print), std::move(readLine));

    auto diagnostics = dispatcher.prepare();
    if (opts.strict && !diagnostics.empty()) {
        // The first one is returned and reported by the caller
        reportDiagnostics(std::vector<ScriptError>(diagnostics.begin() + 1, diagnostics.end()), "error");
        return diagnostics.front();
    }
    reportDiagnostics(diagnostics, "warning");

    InterpreterLoop loop(script);
    loop.setTrace(opts.trace);
    loop.setTraceCallback([](size_t index, const std::string& text) {
        std::cerr << "TRACE " << index + 1 << ": " << text << "\n";
    });
    loop.setStatementHandler([&dispatcher](const ScriptStore::ScriptLine& line, size_t index) {
        return dispatcher(line, index);
    });

    loop.run();
    return loop.lastError();
}

int runCheckMode(const ScriptStore& script) {
    LabelTable labels;
    VariableStore vars;
    auto diagnostics = preScan(script, labels, vars);
    auto problems = checkScript(script, labels, vars);

    reportDiagnostics(diagnostics, "warning");
    for (const auto& p : problems) {
        std::cerr << formatError(p) << std::endl;
    }

    size_t total = diagnostics.size() + problems.size();
    std::cerr << "[storyline] " << script.getSourceName() << ": " << script.size() << " lines, "
              << labels.size() << " labels, " << vars.size() << " variables, "
              << total << (total == 1 ? " problem" : " problems") << std::endl;
    return total == 0 ? 0 : 1;
}

} // namespace storyline
