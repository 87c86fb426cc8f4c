#include "VariableStore.hpp"

#include <algorithm>

#include "ScriptError.hpp"

namespace storyline {

void VariableStore::declare(const std::string& name) {
    table_[name] = "0";
}

const std::string* VariableStore::tryGet(const std::string& name) const {
    auto it = table_.find(name);
    if (it == table_.end()) return nullptr;
    return &it->second;
}

const std::string& VariableStore::get(const std::string& name, size_t lineIndex) const {
    auto it = table_.find(name);
    if (it == table_.end()) {
        throw ScriptError(ErrorCodes::UNDECLARED_VARIABLE,
                          "Variable @" + name + " is used before it is declared", lineIndex);
    }
    return it->second;
}

void VariableStore::set(const std::string& name, const std::string& value, size_t lineIndex) {
    auto it = table_.find(name);
    if (it == table_.end()) {
        throw ScriptError(ErrorCodes::UNDECLARED_VARIABLE,
                          "Variable @" + name + " must be declared with a top-level @" + name +
                          "=... line before it is assigned",
                          lineIndex);
    }
    it->second = value;
}

bool VariableStore::isNameTerminator(char c) {
    switch (c) {
        case ' ': case '\0': case '+': case '-': case '<': case '>': case '=':
        case '(': case ')': case '.': case '!': case '#': case ':': case ';':
        case '^': case '/': case '\\': case '@':
            return true;
        default:
            return false;
    }
}

std::vector<std::string> VariableStore::scanReferences(const std::string& source) {
    std::vector<std::string> names;
    size_t pos = source.find('@');
    while (pos != std::string::npos) {
        size_t start = pos + 1;
        size_t end = start;
        while (end < source.size() && !isNameTerminator(source[end])) ++end;
        if (end > start) {
            std::string name = source.substr(start, end - start);
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(std::move(name));
            }
        }
        pos = source.find('@', end == start ? start : end);
    }
    return names;
}

std::string VariableStore::substitute(const std::string& source, size_t lineIndex) const {
    // Every reference must resolve before any output is produced
    for (const auto& name : scanReferences(source)) {
        get(name, lineIndex);
    }

    // Single pass: values are emitted once and never rescanned
    std::string out;
    out.reserve(source.size());
    size_t pos = 0;
    while (pos < source.size()) {
        size_t at = source.find('@', pos);
        if (at == std::string::npos) {
            out.append(source, pos, std::string::npos);
            break;
        }
        out.append(source, pos, at - pos);

        size_t start = at + 1;
        size_t end = start;
        while (end < source.size() && !isNameTerminator(source[end])) ++end;
        if (end == start) {
            out.push_back('@');
        } else {
            out += get(source.substr(start, end - start), lineIndex);
        }
        pos = end;
    }
    return out;
}

} // namespace storyline
