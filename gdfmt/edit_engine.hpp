/**
 * @file edit_engine.hpp
 * @brief Regex-driven text edits that keep the syntax tree in sync
 *
 * A RegexEdit is a built-in pattern plus an RE2 rewrite string. Applying it
 * to a Document replaces every non-overlapping match in the buffer, except
 * matches that start inside a string literal of the current tree, and
 * mirrors each replacement into the tree as a TextEdit before an incremental
 * reparse.
 */

#pragma once

#include "syntax_tree.hpp"

#include <re2/re2.h>
#include <string>
#include <vector>

namespace gdfmt {

class RegexEdit {
public:
    /**
     * @param name Short name used in logs
     * @param pattern RE2 pattern; use (?m) for line anchors
     * @param rewrite Replacement with \0..\9 back-references
     * @param max_replacements Maximum edits per application, 0 for no limit
     *
     * The pattern must be valid; an invalid built-in pattern aborts.
     */
    RegexEdit(const char* name, const char* pattern, const char* rewrite,
              int max_replacements = 0);

    RegexEdit(const RegexEdit&) = delete;
    RegexEdit& operator=(const RegexEdit&) = delete;

    const char* name() const { return name_; }
    const RE2& regex() const { return regex_; }
    const std::string& rewrite() const { return rewrite_; }
    int max_replacements() const { return max_replacements_; }

private:
    const char* name_;
    RE2 regex_;
    std::string rewrite_;
    int max_replacements_;
};

// Result of planning an edit pass against the unedited buffer.
struct EditPlan {
    std::string new_text;
    std::vector<TextEdit> edits;   // sequential: each in the coordinates left by the previous
    int skipped_in_string = 0;     // matches dropped because they start in a string
};

/**
 * Find the matches of an edit in the document and compute the new buffer and
 * the tree edits, without touching the document.
 */
EditPlan plan_regex_edit(const Document& doc, const RegexEdit& edit);

/**
 * Apply an edit to the document.
 * @return number of replacements applied, or -1 if the reparse failed
 */
int apply_regex_edit(Document& doc, const RegexEdit& edit);

} // namespace gdfmt
