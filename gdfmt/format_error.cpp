#include "format_error.hpp"

namespace gdfmt {

const char* format_error_name(FormatErrorCode code) {
    switch (code) {
    case FORMAT_OK:                    return "OK";
    case FORMAT_ERR_ENGINE:            return "EngineError";
    case FORMAT_ERR_ENCODING:          return "EncodingError";
    case FORMAT_ERR_STRUCTURE_CHANGED: return "StructureChangedError";
    case FORMAT_ERR_PARSE:             return "ParseError";
    case FORMAT_ERR_IO:                return "IOError";
    }
    return "UnknownError";
}

const char* format_error_message(FormatErrorCode code) {
    switch (code) {
    case FORMAT_OK:                    return "no error";
    case FORMAT_ERR_ENGINE:            return "the pretty-printer failed to format the input";
    case FORMAT_ERR_ENCODING:          return "the pretty-printer produced invalid UTF-8";
    case FORMAT_ERR_STRUCTURE_CHANGED: return "formatting changed the structure of the code";
    case FORMAT_ERR_PARSE:             return "the parser could not build a syntax tree";
    case FORMAT_ERR_IO:                return "file could not be read or written";
    }
    return "unknown error";
}

std::string format_error_describe(const FormatError& error) {
    std::string out = format_error_name(error.code);
    out += ": ";
    out += error.message.empty() ? format_error_message(error.code) : error.message;
    return out;
}

} // namespace gdfmt
