#include "TextFunctions.hpp"

#include <algorithm>
#include <cctype>

namespace storyline {
namespace text {

std::vector<std::string> splitAll(const std::string& source, const std::string& sep) {
    std::vector<std::string> parts;
    if (sep.empty()) {
        parts.push_back(source);
        return parts;
    }
    size_t start = 0;
    while (true) {
        size_t hit = source.find(sep, start);
        if (hit == std::string::npos) {
            parts.push_back(source.substr(start));
            break;
        }
        parts.push_back(source.substr(start, hit - start));
        start = hit + sep.size();
    }
    return parts;
}

std::string trim(const std::string& source) {
    auto notSpace = [](char c) { return !std::isspace(static_cast<unsigned char>(c)); };
    auto first = std::find_if(source.begin(), source.end(), notSpace);
    auto last = std::find_if(source.rbegin(), source.rend(), notSpace).base();
    if (first >= last) return std::string();
    return std::string(first, last);
}

std::string stripLeading(const std::string& source, char ch) {
    size_t pos = source.find_first_not_of(ch);
    if (pos == std::string::npos) return std::string();
    return source.substr(pos);
}

std::string stripLineEnding(const std::string& source) {
    size_t end = source.size();
    while (end > 0 && (source[end - 1] == '\n' || source[end - 1] == '\r')) --end;
    return source.substr(0, end);
}

bool containsAlpha(const std::string& source) {
    return std::any_of(source.begin(), source.end(),
                       [](char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; });
}

} // namespace text
} // namespace storyline
