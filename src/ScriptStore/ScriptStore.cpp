#include "ScriptStore.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "../Runtime/ScriptError.hpp"

namespace storyline {

ScriptStore::ScriptStore() = default;

ScriptStore::~ScriptStore() = default;

void ScriptStore::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ScriptError(ErrorCodes::LOAD_FAILURE,
                          "Cannot open '" + path + "': " + std::strerror(errno));
    }
    loadFromStream(file);
    if (file.bad()) {
        throw ScriptError(ErrorCodes::LOAD_FAILURE, "Error while reading '" + path + "'");
    }
    sourceName = path;
}

void ScriptStore::loadFromStream(std::istream& in) {
    clear();
    std::string line;
    while (std::getline(in, line)) {
        appendLine(line);
    }
}

void ScriptStore::loadFromText(const std::string& source) {
    std::istringstream in(source);
    loadFromStream(in);
}

void ScriptStore::appendLine(const std::string& text) {
    ScriptLine line;
    line.text = text;
    if (!line.text.empty() && line.text.back() == '\r') line.text.pop_back();
    line.directive = DirectiveParser::parse(line.text);
    lines.push_back(std::move(line));
}

void ScriptStore::clear() {
    lines.clear();
    sourceName.clear();
}

const ScriptStore::ScriptLine& ScriptStore::at(size_t index) const {
    if (index >= lines.size()) {
        throw std::out_of_range("Script line " + std::to_string(index) + " out of range");
    }
    return lines[index];
}

} // namespace storyline
