#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>
#include <cstdint>

namespace storyline {

/**
 * ScriptError - fatal story script error
 *
 * Thrown by directive handlers and the loader. Carries one of the
 * ErrorCodes below and the 0-based index of the script line that
 * raised it (NO_LINE when the error is not tied to a line).
 */
class ScriptError : public std::runtime_error {
public:
    static constexpr size_t NO_LINE = static_cast<size_t>(-1);

    ScriptError(uint16_t errorCode, const std::string& message, size_t lineIndex = NO_LINE)
        : std::runtime_error(message), errorCode_(errorCode), lineIndex_(lineIndex) {}

    uint16_t getErrorCode() const { return errorCode_; }
    size_t getLineIndex() const { return lineIndex_; }
    bool hasLine() const { return lineIndex_ != NO_LINE; }

    void setLineIndex(size_t lineIndex) { lineIndex_ = lineIndex; }

private:
    uint16_t errorCode_;
    size_t lineIndex_;
};

namespace ErrorCodes {
    constexpr uint16_t LOAD_FAILURE = 1;
    constexpr uint16_t MALFORMED_DIRECTIVE = 2;
    constexpr uint16_t UNDECLARED_VARIABLE = 3;
    constexpr uint16_t MISSING_LABEL = 4;
    constexpr uint16_t NON_NUMERIC_ORDERING = 5;
    constexpr uint16_t INPUT_CLOSED = 6;
    // Pre-scan diagnostics, fatal only in strict mode
    constexpr uint16_t DUPLICATE_LABEL = 7;
    constexpr uint16_t MALFORMED_DECLARATION = 8;
    constexpr uint16_t INTERNAL_ERROR = 51;
}

// Short name for an error code, used in diagnostics.
inline const char* errorName(uint16_t code) {
    switch (code) {
        case ErrorCodes::LOAD_FAILURE: return "Load failure";
        case ErrorCodes::MALFORMED_DIRECTIVE: return "Malformed directive";
        case ErrorCodes::UNDECLARED_VARIABLE: return "Undeclared variable";
        case ErrorCodes::MISSING_LABEL: return "Missing label";
        case ErrorCodes::NON_NUMERIC_ORDERING: return "Non-numeric comparison";
        case ErrorCodes::INPUT_CLOSED: return "Input closed";
        case ErrorCodes::DUPLICATE_LABEL: return "Duplicate label";
        case ErrorCodes::MALFORMED_DECLARATION: return "Malformed declaration";
        case ErrorCodes::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

} // namespace storyline
