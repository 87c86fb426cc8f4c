#include <iostream>
#include <optional>
#include <string>

#include "Shell/StoryRunner.hpp"

using namespace storyline;

int main(int argc, char* argv[]) {
    RunOptions opts;
    bool showHelp = false;
    if (!parseArguments(argc, argv, opts, showHelp)) {
        printUsage(argv[0]);
        return 1;
    }
    if (showHelp) {
        std::cout << "storyline - interactive story script interpreter\n";
        printUsage(argv[0]);
        return 0;
    }

    auto script = loadScript(opts);
    if (!script) return 1;

    if (opts.check) {
        return runCheckMode(*script);
    }

    auto print = [](const std::string& text) {
        std::cout << text << '\n' << std::flush;
    };
    auto readLine = []() -> std::optional<std::string> {
        std::string line;
        if (!std::getline(std::cin, line)) return std::nullopt;
        return line;
    };

    auto error = runStory(script, opts, print, readLine);
    if (error) {
        std::cerr << formatError(*error) << std::endl;
        return 1;
    }
    return 0;
}
