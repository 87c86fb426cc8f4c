#pragma once

#include <string>

namespace storyline {

/**
 * Directive
 *
 * One script line classified by its leading sigil and pre-split into the
 * fields its handler needs. Lines whose fixed-token split fails keep their
 * kind and carry a non-empty `malformed` message; the error is raised only
 * when the engine reaches that line.
 *
 *   :label   #goto   !cond:then[:else]   @name=value   ?prompt:label
 *   ^i/^s prompt:@var   |   *comment   anything else is text
 */
enum class DirectiveKind {
    Blank,        // empty line (or a stray CR)
    Label,        // :name
    Comment,      // *...
    BlankLine,    // |
    Goto,         // #label
    Conditional,  // !expr:then[:else]
    Assignment,   // @name=value
    VariableText, // @... without a single '='
    Menu,         // ?prompt:label
    Input,        // ^mode prompt:@var
    Text          // anything else
};

enum class InputMode {
    Numeric,  // ^i
    FreeText, // ^s
    Unknown   // any other mode character, or none
};

// Action taken by one side of a conditional
struct Branch {
    enum class Kind { Goto, Assign, Print };

    Kind kind{Kind::Print};
    std::string text;  // trimmed branch text as written
    std::string label; // Goto
    std::string name;  // Assign
    std::string value; // Assign right-hand side
    std::string malformed;

    bool isMalformed() const { return !malformed.empty(); }
};

struct Directive {
    DirectiveKind kind{DirectiveKind::Blank};
    std::string malformed;

    std::string label;      // Label name, Goto / Menu target
    std::string name;       // Assignment / Input variable
    std::string value;      // Assignment right-hand side
    std::string prompt;     // Menu / Input prompt text
    InputMode inputMode{InputMode::Unknown};

    std::string condition;  // Conditional text without '!'
    Branch thenBranch;
    Branch elseBranch;
    bool hasElse{false};

    bool isMalformed() const { return !malformed.empty(); }
};

class DirectiveParser {
public:
    // Classify and split a single raw script line
    static Directive parse(const std::string& line);

    // Parse the trimmed text of a conditional branch
    static Branch parseBranch(const std::string& text);

    static const char* kindName(DirectiveKind kind);

private:
    static void parseConditional(const std::string& line, Directive& d);
    static void parseAtLine(const std::string& line, Directive& d);
    static void parseMenu(const std::string& line, Directive& d);
    static void parseInput(const std::string& line, Directive& d);
};

} // namespace storyline
