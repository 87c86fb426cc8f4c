#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace storyline {

/**
 * PromptReader
 *
 * Blocking menu and input prompts on top of a line-oriented console.
 * Invalid answers are handled here by re-prompting; only a closed input
 * (ReadLineCallback returning nullopt) escapes, as ScriptError INPUT_CLOSED.
 */
class PromptReader {
public:
    using PrintCallback = std::function<void(const std::string&)>;           // one output line
    using ReadLineCallback = std::function<std::optional<std::string>()>;    // nullopt = input closed

    PromptReader(PrintCallback printCb, ReadLineCallback readCb);

    // Print the numbered options and block until a valid choice; returns the 1-based choice
    size_t chooseOption(const std::vector<std::string>& options, size_t lineIndex);

    // ^i: re-prompt until the answer contains no letters
    std::string readNumber(const std::string& prompt, size_t lineIndex);

    // ^s: one line of free text
    std::string readText(const std::string& prompt, size_t lineIndex);

private:
    PrintCallback print;
    ReadLineCallback readLine;

    std::string nextLine(size_t lineIndex);
    static std::optional<size_t> parseChoice(const std::string& answer);
};

} // namespace storyline
