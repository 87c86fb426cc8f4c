#include <catch2/catch_all.hpp>
#include "../src/Runtime/TextFunctions.hpp"
#include "../src/Runtime/LabelTable.hpp"

using namespace storyline;

TEST_CASE("Text helpers") {
    SECTION("splitAll") {
        REQUIRE(text::splitAll("a:b:c", ":") == std::vector<std::string>({"a", "b", "c"}));
        REQUIRE(text::splitAll("a::", ":") == std::vector<std::string>({"a", "", ""}));
        REQUIRE(text::splitAll("plain", ":") == std::vector<std::string>({"plain"}));
        REQUIRE(text::splitAll("", ":") == std::vector<std::string>({""}));
        REQUIRE(text::splitAll("1==2==3", "==") == std::vector<std::string>({"1", "2", "3"}));
    }

    SECTION("trim") {
        REQUIRE(text::trim("  #end \t") == "#end");
        REQUIRE(text::trim("   ").empty());
        REQUIRE(text::trim("x") == "x");
    }

    SECTION("stripLeading") {
        REQUIRE(text::stripLeading("##end", '#') == "end");
        REQUIRE(text::stripLeading("end#", '#') == "end#");
        REQUIRE(text::stripLeading("###", '#').empty());
    }

    SECTION("stripLineEnding") {
        REQUIRE(text::stripLineEnding("3\r\n") == "3");
        REQUIRE(text::stripLineEnding("3\n") == "3");
        REQUIRE(text::stripLineEnding("3") == "3");
    }

    SECTION("containsAlpha") {
        REQUIRE(text::containsAlpha("12a"));
        REQUIRE(text::containsAlpha("X"));
        REQUIRE_FALSE(text::containsAlpha("12.5"));
        REQUIRE_FALSE(text::containsAlpha("-3 + 4"));
        REQUIRE_FALSE(text::containsAlpha(""));
    }
}

TEST_CASE("LabelTable declare, find and resolve") {
    LabelTable labels;
    REQUIRE(labels.declare("start", 0));
    REQUIRE(labels.declare("end", 5));
    REQUIRE_FALSE(labels.declare("start", 9));

    REQUIRE(labels.size() == 2);
    REQUIRE(labels.contains("end"));
    REQUIRE(labels.find("start") == size_t{9});
    REQUIRE_FALSE(labels.find("middle").has_value());
    REQUIRE(labels.resolve("end", 1) == 5);

    try {
        labels.resolve("middle", 3);
        FAIL("expected ScriptError");
    } catch (const ScriptError& e) {
        REQUIRE(e.getErrorCode() == ErrorCodes::MISSING_LABEL);
        REQUIRE(e.getLineIndex() == 3);
    }

    labels.clear();
    REQUIRE(labels.size() == 0);
}
