/**
 * @file reorder.hpp
 * @brief Reorder top-level GDScript declarations per the official style guide
 *
 * Order: class annotations, class_name, extends, class docstring, signals,
 * enums, constants, static variables, @export variables, regular variables,
 * @onready variables, _static_init, static functions, built-in virtual
 * methods, other methods, inner classes. Within a group public declarations
 * come before pseudo-private ones, then declarations are sorted by name.
 * Comments and annotations directly above a declaration move with it.
 */

#pragma once

#include <string>
#include <vector>

namespace gdfmt {

enum class DeclKind {
    CLASS_ANNOTATION,
    CLASS_NAME,
    EXTENDS,
    DOCSTRING,
    SIGNAL,
    ENUM,
    CONSTANT,
    STATIC_VARIABLE,
    EXPORT_VARIABLE,
    REGULAR_VARIABLE,
    ONREADY_VARIABLE,
    STATIC_INIT,
    STATIC_FUNCTION,
    BUILTIN_VIRTUAL,
    METHOD,
    INNER_CLASS,
    UNKNOWN
};

struct Declaration {
    DeclKind kind = DeclKind::UNKNOWN;
    std::string name;
    bool is_private = false;
    int builtin_rank = 0;                 // position in the virtual method list
    std::vector<std::string> leading;     // comments and annotations above
    std::vector<std::string> trailing;    // e.g. a closing #endregion
    std::string text;
    size_t source_order = 0;
};

const char* decl_kind_name(DeclKind kind);

// Position of a built-in virtual method in callback order (1-based), or 0.
int builtin_virtual_rank(const std::string& method_name);

/**
 * Split a GDScript source into top-level declarations with their comments.
 * @return false if the source cannot be parsed or has syntax errors
 */
bool extract_declarations(const std::string& source, std::vector<Declaration>* decls, std::string* error);

// Stable sort by style-guide order.
void sort_declarations(std::vector<Declaration>& decls);

// Rebuild source text from sorted declarations.
std::string build_reordered_source(const std::vector<Declaration>& decls);

/**
 * Reorder the declarations of a GDScript file.
 * @param output reordered text on success
 * @param error reason on failure; the input is then left as is by callers
 */
bool reorder_gdscript(const std::string& source, std::string* output, std::string* error);

} // namespace gdfmt
