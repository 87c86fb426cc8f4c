// Label table: label name -> line index of its declaration.
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "ScriptError.hpp"

namespace storyline {

class LabelTable {
public:
    // Record a declaration; the last one wins. Returns false if it replaced an earlier one.
    bool declare(const std::string& name, size_t lineIndex) {
        return table_.insert_or_assign(name, lineIndex).second;
    }

    std::optional<size_t> find(const std::string& name) const {
        auto it = table_.find(name);
        if (it == table_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& name) const { return table_.count(name) != 0; }

    // Jump target for name; throws MISSING_LABEL tagged with the referencing line.
    size_t resolve(const std::string& name, size_t fromLine) const {
        auto it = table_.find(name);
        if (it == table_.end()) {
            throw ScriptError(ErrorCodes::MISSING_LABEL, "Goto target '" + name + "' is not declared", fromLine);
        }
        return it->second;
    }

    size_t size() const { return table_.size(); }
    void clear() { table_.clear(); }

private:
    std::unordered_map<std::string, size_t> table_;
};

} // namespace storyline
