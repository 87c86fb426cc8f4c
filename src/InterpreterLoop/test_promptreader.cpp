#include <catch2/catch_all.hpp>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "PromptReader.hpp"
#include "../Runtime/ScriptError.hpp"

using namespace storyline;

namespace {

// Scripted console: answers come from a queue, output is recorded line by line
class TestConsole {
public:
    std::vector<std::string> output;
    std::deque<std::string> answers;

    PromptReader reader() {
        return PromptReader(
            [this](const std::string& s) { output.push_back(s); },
            [this]() -> std::optional<std::string> {
                if (answers.empty()) return std::nullopt;
                std::string a = answers.front();
                answers.pop_front();
                return a;
            });
    }
};

} // namespace

TEST_CASE("PromptReader menu lists options and accepts a valid choice", "[prompt]") {
    TestConsole console;
    console.answers = {"2"};
    auto prompts = console.reader();

    REQUIRE(prompts.chooseOption({"Left", "Right"}, 0) == 2);
    REQUIRE(console.output == std::vector<std::string>({"1. Left", "2. Right"}));
}

TEST_CASE("PromptReader menu re-prompts on bad answers", "[prompt]") {
    TestConsole console;
    console.answers = {"9", "x", "0", "-1", "", "1"};
    auto prompts = console.reader();

    REQUIRE(prompts.chooseOption({"A", "B"}, 0) == 1);
    REQUIRE(console.output == std::vector<std::string>({
        "1. A",
        "2. B",
        "You must enter a number between 1 and 2",
        "You must enter a NUMBER between 1 and 2",
        "You must enter a number between 1 and 2",
        "You must enter a number between 1 and 2",
        "You must enter a number between 1 and 2",
    }));
}

TEST_CASE("PromptReader menu tolerates line endings and a plus sign", "[prompt]") {
    TestConsole console;
    console.answers = {"+3\r\n"};
    auto prompts = console.reader();
    REQUIRE(prompts.chooseOption({"a", "b", "c"}, 0) == 3);
}

TEST_CASE("PromptReader numeric input rejects letters", "[prompt]") {
    TestConsole console;
    console.answers = {"abc", "3"};
    auto prompts = console.reader();

    REQUIRE(prompts.readNumber("How many?", 0) == "3");
    REQUIRE(console.output == std::vector<std::string>({
        "", "How many?",
        "You may only enter in a Number. Please try again.",
        "", "How many?",
    }));
}

TEST_CASE("PromptReader numeric input keeps the answer verbatim", "[prompt]") {
    TestConsole console;
    console.answers = {" 1.5 "};
    auto prompts = console.reader();
    REQUIRE(prompts.readNumber("Amount?", 0) == " 1.5 ");
}

TEST_CASE("PromptReader text input accepts anything", "[prompt]") {
    TestConsole console;
    console.answers = {"Sir Robin 2nd"};
    auto prompts = console.reader();

    REQUIRE(prompts.readText("Name?", 0) == "Sir Robin 2nd");
    REQUIRE(console.output == std::vector<std::string>({"", "Name?"}));
}

TEST_CASE("PromptReader reports closed input", "[prompt]") {
    TestConsole console;
    auto prompts = console.reader();

    try {
        prompts.readText("Name?", 4);
        FAIL("expected ScriptError");
    } catch (const ScriptError& e) {
        REQUIRE(e.getErrorCode() == ErrorCodes::INPUT_CLOSED);
        REQUIRE(e.getLineIndex() == 4);
    }

    console.answers = {"nope"};
    REQUIRE_THROWS_AS(prompts.chooseOption({"A"}, 0), ScriptError);
}
