// Variable store with @name substitution for story text.
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace storyline {

/**
 * VariableStore
 *
 * Maps variable names to their current value. Values are kept as text;
 * whether a value is numeric is decided by the expression evaluator when
 * it is used. A variable exists only after it has been declared, which the
 * pre-scan does for every top-level `@name=...` line.
 */
class VariableStore {
public:
    // Declare name with the initial value "0" (resets an existing value)
    void declare(const std::string& name);

    bool contains(const std::string& name) const { return table_.count(name) != 0; }

    // Try to find an existing variable; returns nullptr if not found.
    const std::string* tryGet(const std::string& name) const;

    // Value of a declared variable; throws UNDECLARED_VARIABLE otherwise
    const std::string& get(const std::string& name, size_t lineIndex) const;

    // Update a declared variable; throws UNDECLARED_VARIABLE otherwise
    void set(const std::string& name, const std::string& value, size_t lineIndex);

    // Replace every @name reference in source with the variable's value.
    // References are replaced where they were found, in one left-to-right
    // pass; any undeclared name throws UNDECLARED_VARIABLE before anything
    // is replaced.
    std::string substitute(const std::string& source, size_t lineIndex) const;

    // Distinct variable names referenced in source, in discovery order.
    // A name runs from after '@' up to space, NUL, '@' or one of +-<>=().!#:;^/\ .
    static std::vector<std::string> scanReferences(const std::string& source);

    static bool isNameTerminator(char c);

    size_t size() const { return table_.size(); }
    void clear() { table_.clear(); }

private:
    std::unordered_map<std::string, std::string> table_;
};

} // namespace storyline
