/**
 * @file format_error.hpp
 * @brief Error codes reported by the gdfmt formatting pipeline
 */

#pragma once

#include <string>

namespace gdfmt {

// ============================================================================
// Error Codes
// ============================================================================

enum FormatErrorCode {
    FORMAT_OK = 0,
    FORMAT_ERR_ENGINE = 1,             // external pretty-printer rejected or failed on the input
    FORMAT_ERR_ENCODING = 2,           // pretty-printer output is not valid UTF-8
    FORMAT_ERR_STRUCTURE_CHANGED = 3,  // safe mode found a structural difference
    FORMAT_ERR_PARSE = 4,              // tree-sitter could not produce a tree at all
    FORMAT_ERR_IO = 5,                 // file could not be read or written (CLI only)
};

struct FormatError {
    FormatErrorCode code;
    std::string message;

    FormatError() : code(FORMAT_OK) {}
    FormatError(FormatErrorCode c, const std::string& msg) : code(c), message(msg) {}

    bool ok() const { return code == FORMAT_OK; }
};

const char* format_error_name(FormatErrorCode code);
const char* format_error_message(FormatErrorCode code);

// "<name>: <message>" for display
std::string format_error_describe(const FormatError& error);

} // namespace gdfmt
