#include <catch2/catch_all.hpp>
#include "../src/Runtime/VariableStore.hpp"
#include "../src/Runtime/ScriptError.hpp"

using namespace storyline;

TEST_CASE("VariableStore declare, get and set") {
    VariableStore vs;
    REQUIRE_FALSE(vs.contains("gold"));
    REQUIRE(vs.tryGet("gold") == nullptr);

    vs.declare("gold");
    REQUIRE(vs.contains("gold"));
    REQUIRE(vs.get("gold", 0) == "0");

    vs.set("gold", "12", 3);
    REQUIRE(*vs.tryGet("gold") == "12");

    // Redeclaring resets the value
    vs.declare("gold");
    REQUIRE(vs.get("gold", 0) == "0");
    REQUIRE(vs.size() == 1);
}

TEST_CASE("VariableStore rejects undeclared names with the line index") {
    VariableStore vs;
    try {
        vs.set("ghost", "1", 7);
        FAIL("expected ScriptError");
    } catch (const ScriptError& e) {
        REQUIRE(e.getErrorCode() == ErrorCodes::UNDECLARED_VARIABLE);
        REQUIRE(e.getLineIndex() == 7);
    }
    REQUIRE_THROWS_AS(vs.get("ghost", 0), ScriptError);
}

TEST_CASE("VariableStore name scanning") {
    SECTION("terminators end a name") {
        auto names = VariableStore::scanReferences("@a+@b-@c<@d>@e=@f(@g)@h.@i!@j#@k:@l;@m^@n/@o\\@p q");
        REQUIRE(names == std::vector<std::string>({"a", "b", "c", "d", "e", "f", "g", "h",
                                                   "i", "j", "k", "l", "m", "n", "o", "p"}));
    }

    SECTION("adjacent references") {
        REQUIRE(VariableStore::scanReferences("@a@b") == std::vector<std::string>({"a", "b"}));
    }

    SECTION("distinct names in discovery order") {
        REQUIRE(VariableStore::scanReferences("@y and @x and @y") == std::vector<std::string>({"y", "x"}));
    }

    SECTION("bare @ is skipped") {
        REQUIRE(VariableStore::scanReferences("mail me @ home, @who") == std::vector<std::string>({"who,"}));
        REQUIRE(VariableStore::scanReferences("@").empty());
        REQUIRE(VariableStore::scanReferences("no refs").empty());
    }

    SECTION("digits and underscores belong to the name") {
        REQUIRE(VariableStore::scanReferences("@hp_2*3") == std::vector<std::string>({"hp_2*3"}));
    }
}

TEST_CASE("VariableStore substitution") {
    VariableStore vs;
    vs.declare("name");
    vs.declare("gold");
    vs.set("name", "Ann", 0);
    vs.set("gold", "7", 0);

    REQUIRE(vs.substitute("Hello @name you have @gold coins. Bye @name!", 0) ==
            "Hello Ann you have 7 coins. Bye Ann!");
    REQUIRE(vs.substitute("@gold+1", 0) == "7+1");
    REQUIRE(vs.substitute("@name@gold", 0) == "Ann7");
    REQUIRE(vs.substitute("nothing to do", 0) == "nothing to do");
    REQUIRE(vs.substitute("mail @ home", 0) == "mail @ home");

    SECTION("a comma belongs to the name") {
        try {
            (void)vs.substitute("Hello @name, welcome", 2);
            FAIL("expected ScriptError");
        } catch (const ScriptError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::UNDECLARED_VARIABLE);
            REQUIRE(std::string(e.what()).find("@name,") != std::string::npos);
        }
    }

    SECTION("undeclared names fail before anything is replaced") {
        try {
            (void)vs.substitute("@name meets @stranger", 4);
            FAIL("expected ScriptError");
        } catch (const ScriptError& e) {
            REQUIRE(e.getErrorCode() == ErrorCodes::UNDECLARED_VARIABLE);
            REQUIRE(e.getLineIndex() == 4);
            REQUIRE(std::string(e.what()).find("stranger") != std::string::npos);
        }
    }

    SECTION("values are not substituted again, in either order") {
        vs.set("name", "@gold", 0);
        REQUIRE(vs.substitute("@gold @name", 0) == "7 @gold");
        REQUIRE(vs.substitute("@name @gold", 0) == "@gold 7");
    }
}

TEST_CASE("VariableStore substitution keeps longer names intact") {
    VariableStore vs;
    vs.declare("a");
    vs.declare("ab");
    vs.set("a", "1", 0);
    vs.set("ab", "2", 0);

    REQUIRE(vs.substitute("@a and @ab", 0) == "1 and 2");
    REQUIRE(vs.substitute("@ab and @a", 0) == "2 and 1");
}
