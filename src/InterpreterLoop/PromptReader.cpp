#include "PromptReader.hpp"

#include <limits>
#include <utility>

#include "../Runtime/ScriptError.hpp"
#include "../Runtime/TextFunctions.hpp"

namespace storyline {

PromptReader::PromptReader(PrintCallback printCb, ReadLineCallback readCb)
    : print(std::move(printCb)), readLine(std::move(readCb)) {}

std::string PromptReader::nextLine(size_t lineIndex) {
    std::optional<std::string> line;
    if (readLine) line = readLine();
    if (!line) {
        throw ScriptError(ErrorCodes::INPUT_CLOSED, "Input ended while waiting for an answer", lineIndex);
    }
    return text::stripLineEnding(*line);
}

// Unsigned decimal with an optional leading '+', nothing else
std::optional<size_t> PromptReader::parseChoice(const std::string& answer) {
    size_t pos = 0;
    if (pos < answer.size() && answer[pos] == '+') ++pos;
    if (pos >= answer.size()) return std::nullopt;
    size_t value = 0;
    for (; pos < answer.size(); ++pos) {
        char c = answer[pos];
        if (c < '0' || c > '9') return std::nullopt;
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

size_t PromptReader::chooseOption(const std::vector<std::string>& options, size_t lineIndex) {
    const size_t count = options.size();
    for (size_t i = 0; i < count; ++i) {
        print(std::to_string(i + 1) + ". " + options[i]);
    }

    const std::string range = " between 1 and " + std::to_string(count);
    while (true) {
        std::string answer = nextLine(lineIndex);
        if (text::containsAlpha(answer)) {
            print("You must enter a NUMBER" + range);
            continue;
        }
        auto choice = parseChoice(answer);
        if (!choice || *choice < 1 || *choice > count) {
            print("You must enter a number" + range);
            continue;
        }
        return *choice;
    }
}

std::string PromptReader::readNumber(const std::string& prompt, size_t lineIndex) {
    while (true) {
        print("");
        print(prompt);
        std::string answer = nextLine(lineIndex);
        if (!text::containsAlpha(answer)) return answer;
        print("You may only enter in a Number. Please try again.");
    }
}

std::string PromptReader::readText(const std::string& prompt, size_t lineIndex) {
    print("");
    print(prompt);
    return nextLine(lineIndex);
}

} // namespace storyline
