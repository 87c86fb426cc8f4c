#include <iostream>
#include <string>

#include "StoryRunner.hpp"
#include "StoryWindow.hpp"

using namespace storyline;

int main(int argc, char* argv[]) {
    RunOptions opts;
    bool showHelp = false;
    if (!parseArguments(argc, argv, opts, showHelp)) {
        printUsage(argv[0]);
        return 1;
    }
    if (showHelp) {
        std::cout << "storyline-window - play a story script in a window\n";
        printUsage(argv[0]);
        return 0;
    }

    auto script = loadScript(opts);
    if (!script) return 1;

    if (opts.check) {
        return runCheckMode(*script);
    }

    StoryWindow window;
    if (!window.initialize("storyline - " + opts.scriptPath)) {
        std::cerr << "Failed to initialize story window" << std::endl;
        return 1;
    }

    auto error = runStory(
        script, opts,
        [&window](const std::string& text) { window.print(text); },
        [&window]() { return window.readLine(); });

    if (error) {
        std::cerr << formatError(*error) << std::endl;
        window.print(formatError(*error));
        window.waitForClose("Press any key to close.");
        return 1;
    }
    window.waitForClose("The End. Press any key to close.");
    return 0;
}
