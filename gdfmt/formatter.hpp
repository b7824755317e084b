/**
 * @file formatter.hpp
 * @brief GDScript formatting pipeline
 *
 * Stages, each leaving the buffer and its syntax tree consistent:
 *   1. safe mode: fingerprint the input and normalize it
 *   2. preprocessing edits (blank lines after the top-level extends)
 *   3. external pretty-printer
 *   4. UTF-8 validation and full reparse
 *   5. postprocessing edits and the spacing pass
 *   6. optional declaration reordering
 *   7. safe mode: compare the output fingerprint with the input one
 */

#pragma once

#include "format_error.hpp"
#include "pretty_printer.hpp"

#include <string>

#ifndef GDFMT_DEFAULT_QUERY_PATH
#define GDFMT_DEFAULT_QUERY_PATH "queries/gdscript.scm"
#endif

namespace gdfmt {

struct FormatterConfig {
    int indent_size = 4;
    bool use_spaces = false;
    bool reorder_code = false;
    bool safe = false;
    std::string query_path = GDFMT_DEFAULT_QUERY_PATH;
    std::string topiary_command = "topiary";
    std::string grammar_path = GDFMT_DEFAULT_GRAMMAR_PATH;

    IndentPolicy indent() const { return IndentPolicy{use_spaces, indent_size}; }
};

// True if the bytes are well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid_utf8(const std::string& text);

/**
 * Format one GDScript source.
 * @param printer external pretty-printer, used for this call only
 * @param output formatted text; untouched unless the result is FORMAT_OK
 */
FormatError format_gdscript(const std::string& source, const FormatterConfig& config,
                            PrettyPrinter& printer, std::string* output);

// Pipeline stages, exposed for tests. Each returns false if the reparse failed.
bool preprocess_document(Document& doc);
bool postprocess_document(Document& doc);

} // namespace gdfmt
