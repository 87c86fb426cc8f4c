#ifndef STORYLINE_SCRIPTSTORE_H
#define STORYLINE_SCRIPTSTORE_H

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "../Directive/Directive.hpp"

namespace storyline {

/**
 * Story Script Store
 *
 * Holds the script as an ordered, 0-indexed sequence of raw lines, each
 * paired with its parsed Directive. Lines are parsed once when they are
 * appended; the store is not modified while a story runs.
 *
 * Operations supported:
 * - Load from a file, a stream or a string (trailing CR stripped per line)
 * - Indexed access to raw text and parsed directive
 * - Iteration in script order
 */
class ScriptStore {
public:
    struct ScriptLine {
        std::string text;     // raw line without line ending
        Directive directive;  // parsed form of text
    };

    using const_iterator = std::vector<ScriptLine>::const_iterator;

    ScriptStore();
    ~ScriptStore();

    /**
     * Load a script file, replacing the current contents
     * @param path File to read
     * @throws ScriptError LOAD_FAILURE if the file cannot be opened or read
     */
    void loadFromFile(const std::string& path);

    /**
     * Load a script from a stream, replacing the current contents
     * @param in Stream positioned at the first line
     */
    void loadFromStream(std::istream& in);

    /**
     * Load a script held in memory, replacing the current contents
     * @param source Script text with '\n' or "\r\n" line endings
     */
    void loadFromText(const std::string& source);

    /**
     * Append one line at the end of the script
     * @param text Raw line; a trailing '\r' is removed
     */
    void appendLine(const std::string& text);

    void clear();

    size_t size() const { return lines.size(); }
    bool isEmpty() const { return lines.empty(); }

    /**
     * Access a line by index
     * @throws std::out_of_range if index >= size()
     */
    const ScriptLine& at(size_t index) const;
    const std::string& text(size_t index) const { return at(index).text; }
    const Directive& directive(size_t index) const { return at(index).directive; }

    const_iterator begin() const { return lines.begin(); }
    const_iterator end() const { return lines.end(); }

    // Path of the last file loaded, empty for in-memory scripts
    const std::string& getSourceName() const { return sourceName; }

private:
    std::vector<ScriptLine> lines;
    std::string sourceName;
};

} // namespace storyline

#endif // STORYLINE_SCRIPTSTORE_H
