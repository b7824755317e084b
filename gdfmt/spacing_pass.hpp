// spacing_pass.hpp - vertical spacing between declarations
//
// Ensures exactly two blank lines before functions, constructors and inner
// classes that follow another declaration, and before variables, signals,
// constants and enums that directly follow a function, constructor or class.
// Comments and annotations directly above a declaration move down with it.

#pragma once

#include "syntax_tree.hpp"

#include <string>
#include <vector>

namespace gdfmt {

// Replacement of one blank-line run, in the coordinates of the unedited buffer.
struct SpacingEdit {
    uint32_t start;     // the line break ending the last non-blank line
    uint32_t old_end;   // start of the next non-blank line
    std::string text;   // always "\n\n\n"
};

// Insertion points (column 0 of a line) found by the spacing queries, in
// ascending order, without duplicates.
std::vector<uint32_t> find_spacing_points(const Document& doc);

// Edits needed to give every insertion point exactly two blank lines above
// it. Points that already have them produce no edit. Sorted by descending
// start so they can be applied one after another without recomputation.
std::vector<SpacingEdit> compute_spacing_edits(const Document& doc);

// Apply edits sorted by descending start; returns false if the reparse failed.
bool apply_spacing_edits(Document& doc, const std::vector<SpacingEdit>& edits);

// find + compute + apply; returns the number of edits or -1 on reparse failure
int run_spacing_pass(Document& doc);

} // namespace gdfmt
