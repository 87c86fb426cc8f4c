// Text helpers shared by the loader, the directive parser and the handlers
#pragma once

#include <string>
#include <vector>

namespace storyline {
namespace text {

// Split on every occurrence of sep. Always yields at least one part;
// adjacent or trailing separators yield empty parts ("a::" -> "a", "", "").
std::vector<std::string> splitAll(const std::string& source, const std::string& sep);

// Remove leading and trailing whitespace.
std::string trim(const std::string& source);

// Remove every leading occurrence of ch.
std::string stripLeading(const std::string& source, char ch);

// Remove trailing '\r' and '\n' characters.
std::string stripLineEnding(const std::string& source);

// True if any character is an ASCII letter.
bool containsAlpha(const std::string& source);

} // namespace text
} // namespace storyline
