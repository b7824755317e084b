/**
 * @file reorder.cpp
 * @brief Reorder top-level GDScript declarations per the official style guide
 */

#include "reorder.hpp"
#include "syntax_tree.hpp"
#include "../lib/log.h"

#include <algorithm>
#include <cstring>

namespace gdfmt {

static const char* BUILTIN_VIRTUAL_METHODS[] = {
    "_init",
    "_enter_tree",
    "_ready",
    "_process",
    "_physics_process",
    "_exit_tree",
    "_input",
    "_unhandled_input",
    "_gui_input",
    "_draw",
    "_notification",
    "_get_configuration_warnings",
    "_validate_property",
    "_get_property_list",
    "_property_can_revert",
    "_property_get_revert",
    "_get",
    "_set",
    "_to_string",
};

const char* decl_kind_name(DeclKind kind) {
    switch (kind) {
        case DeclKind::CLASS_ANNOTATION: return "class_annotation";
        case DeclKind::CLASS_NAME: return "class_name";
        case DeclKind::EXTENDS: return "extends";
        case DeclKind::DOCSTRING: return "docstring";
        case DeclKind::SIGNAL: return "signal";
        case DeclKind::ENUM: return "enum";
        case DeclKind::CONSTANT: return "constant";
        case DeclKind::STATIC_VARIABLE: return "static_variable";
        case DeclKind::EXPORT_VARIABLE: return "export_variable";
        case DeclKind::REGULAR_VARIABLE: return "regular_variable";
        case DeclKind::ONREADY_VARIABLE: return "onready_variable";
        case DeclKind::STATIC_INIT: return "static_init";
        case DeclKind::STATIC_FUNCTION: return "static_function";
        case DeclKind::BUILTIN_VIRTUAL: return "builtin_virtual";
        case DeclKind::METHOD: return "method";
        case DeclKind::INNER_CLASS: return "inner_class";
        case DeclKind::UNKNOWN: return "unknown";
    }
    return "unknown";
}

int builtin_virtual_rank(const std::string& method_name) {
    int count = (int)(sizeof(BUILTIN_VIRTUAL_METHODS) / sizeof(BUILTIN_VIRTUAL_METHODS[0]));
    for (int i = 0; i < count; i++) {
        if (method_name == BUILTIN_VIRTUAL_METHODS[i]) return i + 1;
    }
    return 0;
}

// ============================================================================
// Extraction
// ============================================================================

static bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

static std::string trim_right(std::string_view text) {
    size_t end = text.size();
    while (end > 0 && (text[end - 1] == '\n' || text[end - 1] == '\r' ||
                       text[end - 1] == ' ' || text[end - 1] == '\t')) {
        end--;
    }
    return std::string(text.substr(0, end));
}

static bool is_class_annotation(std::string_view text) {
    return starts_with(text, "@tool") || starts_with(text, "@icon") || starts_with(text, "@static_unload");
}

static bool is_region_start(TSNode node, std::string_view text) {
    return node_is(node, "region_start") || (node_is(node, "comment") && starts_with(text, "#region"));
}

static bool is_region_end(TSNode node, std::string_view text) {
    return node_is(node, "region_end") || (node_is(node, "comment") && starts_with(text, "#endregion"));
}

static std::string field_text(TSNode node, const char* field, const std::string& source) {
    TSNode child = child_by_field(node, field);
    if (ts_node_is_null(child)) return "";
    return std::string(node_text(child, source));
}

static bool any_line_has(const std::vector<std::string>& lines, const char* needle) {
    for (const std::string& line : lines) {
        if (line.find(needle) != std::string::npos) return true;
    }
    return false;
}

// Variable category from its own annotations and the annotation lines above it
static DeclKind classify_variable(std::string_view text, const std::vector<std::string>& leading) {
    size_t var_pos = text.find("var ");
    std::string_view head = text.substr(0, var_pos == std::string_view::npos ? 0 : var_pos);
    if (head.find("static") != std::string_view::npos) return DeclKind::STATIC_VARIABLE;
    if (head.find("@onready") != std::string_view::npos || any_line_has(leading, "@onready"))
        return DeclKind::ONREADY_VARIABLE;
    if (head.find("@export") != std::string_view::npos || any_line_has(leading, "@export"))
        return DeclKind::EXPORT_VARIABLE;
    return DeclKind::REGULAR_VARIABLE;
}

static void classify_function(Declaration& decl) {
    if (decl.name == "_static_init") {
        decl.kind = DeclKind::STATIC_INIT;
    } else if (starts_with(decl.text, "static")) {
        decl.kind = DeclKind::STATIC_FUNCTION;
    } else if ((decl.builtin_rank = builtin_virtual_rank(decl.name)) > 0) {
        decl.kind = DeclKind::BUILTIN_VIRTUAL;
    } else {
        decl.kind = DeclKind::METHOD;
    }
}

static bool is_header(DeclKind kind) {
    return kind == DeclKind::CLASS_ANNOTATION || kind == DeclKind::CLASS_NAME ||
           kind == DeclKind::EXTENDS || kind == DeclKind::DOCSTRING;
}

// A blank line separates two rows when some row strictly between them is empty.
static bool blank_line_between(const std::string& source, uint32_t from_byte, uint32_t to_byte) {
    uint32_t pos = next_line_start(source, from_byte);
    while (pos < to_byte) {
        uint32_t end = next_line_start(source, pos);
        bool blank = true;
        for (uint32_t i = pos; i < end && i < source.size(); i++) {
            char c = source[i];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') { blank = false; break; }
        }
        if (blank && end <= to_byte) return true;
        if (end == pos) break;
        pos = end;
    }
    return false;
}

struct PendingLine {
    std::string text;
    uint32_t start_byte;
    uint32_t end_byte;
    bool doc;   // "##" comment
};

static void close_region(std::vector<Declaration>& decls, std::vector<PendingLine>& pending, std::string text,
                         uint32_t start_byte, uint32_t end_byte) {
    for (size_t i = decls.size(); i-- > 0;) {
        Declaration& decl = decls[i];
        if (decl.kind < DeclKind::STATIC_INIT || decl.kind > DeclKind::METHOD) continue;
        if (!any_line_has(decl.leading, "#region")) continue;
        if (any_line_has(decl.trailing, "#endregion")) continue;
        decl.trailing.push_back(std::move(text));
        return;
    }
    if (!decls.empty()) {
        decls.back().trailing.push_back(std::move(text));
    } else {
        pending.push_back({std::move(text), start_byte, end_byte, false});
    }
}

bool extract_declarations(const std::string& source, std::vector<Declaration>* decls, std::string* error) {
    Document doc(source);
    if (!doc.valid()) {
        *error = "failed to parse source";
        return false;
    }
    TSNode root = doc.root();
    if (ts_node_has_error(root)) {
        *error = "source has syntax errors";
        return false;
    }

    std::vector<PendingLine> pending;
    bool seen_member = false;
    int last_end_row = -1;
    uint32_t last_start_byte = 0;
    uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; i++) {
        TSNode node = ts_node_named_child(root, i);
        std::string_view text = node_text(node, source);
        uint32_t start_row = ts_node_start_point(node).row;
        uint32_t start_byte = ts_node_start_byte(node);
        uint32_t end_byte = ts_node_end_byte(node);

        bool is_comment = node_is(node, "comment") || node_is(node, "region_start") || node_is(node, "region_end");

        // comment on the same line as the end of the previous declaration
        if (is_comment && !decls->empty() && pending.empty() && (int)start_row == last_end_row) {
            decls->back().text = trim_right(
                std::string_view(source).substr(last_start_byte, end_byte - last_start_byte));
            continue;
        }
        if (is_region_end(node, text)) {
            close_region(*decls, pending, std::string(text), start_byte, end_byte);
            last_end_row = (int)node_last_row(node);
            continue;
        }
        if (is_comment || is_region_start(node, text)) {
            pending.push_back({std::string(text), start_byte, end_byte, starts_with(text, "##")});
            last_end_row = (int)node_last_row(node);
            continue;
        }
        if (node_is(node, "annotation") && !is_class_annotation(text)) {
            pending.push_back({std::string(text), start_byte, end_byte, false});
            last_end_row = (int)node_last_row(node);
            continue;
        }

        Declaration decl;
        decl.text = trim_right(text);
        decl.source_order = decls->size();

        if (node_is(node, "annotation")) {
            decl.kind = DeclKind::CLASS_ANNOTATION;
            decl.name = decl.text;
        } else if (node_is(node, "class_name_statement")) {
            decl.kind = DeclKind::CLASS_NAME;
            decl.name = field_text(node, "name", source);
            // `class_name A extends B` becomes two declarations
            TSNode extends_node = ts_node_named_child(node, 0);
            uint32_t child_count = ts_node_named_child_count(node);
            for (uint32_t c = 0; c < child_count; c++) {
                extends_node = ts_node_named_child(node, c);
                if (node_is(extends_node, "extends_statement")) break;
            }
            if (node_is(extends_node, "extends_statement")) {
                uint32_t cut = ts_node_start_byte(extends_node) - start_byte;
                decl.text = trim_right(std::string_view(source).substr(start_byte, cut));
                for (const PendingLine& line : pending) decl.leading.push_back(line.text);
                pending.clear();
                decls->push_back(std::move(decl));

                Declaration extends;
                extends.kind = DeclKind::EXTENDS;
                extends.text = trim_right(node_text(extends_node, source));
                extends.source_order = decls->size();
                decls->push_back(std::move(extends));
                last_start_byte = ts_node_start_byte(extends_node);
                last_end_row = (int)node_last_row(node);
                continue;
            }
        } else if (node_is(node, "extends_statement")) {
            decl.kind = DeclKind::EXTENDS;
        } else if (node_is(node, "signal_statement")) {
            decl.kind = DeclKind::SIGNAL;
            decl.name = field_text(node, "name", source);
        } else if (node_is(node, "enum_definition")) {
            decl.kind = DeclKind::ENUM;
            decl.name = field_text(node, "name", source);
        } else if (node_is(node, "const_statement")) {
            decl.kind = DeclKind::CONSTANT;
            decl.name = field_text(node, "name", source);
        } else if (node_is(node, "variable_statement")) {
            decl.name = field_text(node, "name", source);
        } else if (node_is(node, "function_definition")) {
            decl.name = field_text(node, "name", source);
        } else if (node_is(node, "constructor_definition")) {
            decl.name = "_init";
        } else if (node_is(node, "class_definition")) {
            decl.kind = DeclKind::INNER_CLASS;
            decl.name = field_text(node, "name", source);
        } else {
            decl.kind = DeclKind::UNKNOWN;
        }

        // "##" lines between the header and the first member, separated from
        // it by a blank line, document the class
        if (!seen_member && !is_header(decl.kind) && !pending.empty()) {
            bool all_doc = std::all_of(pending.begin(), pending.end(),
                                       [](const PendingLine& line) { return line.doc; });
            if (all_doc && blank_line_between(source, pending.back().start_byte, start_byte)) {
                Declaration docstring;
                docstring.kind = DeclKind::DOCSTRING;
                docstring.source_order = decls->size();
                for (const PendingLine& line : pending) {
                    if (!docstring.text.empty()) docstring.text += "\n";
                    docstring.text += line.text;
                }
                pending.clear();
                decls->push_back(std::move(docstring));
                decl.source_order = decls->size();
            }
        }

        for (const PendingLine& line : pending) decl.leading.push_back(line.text);
        pending.clear();

        if (node_is(node, "variable_statement")) {
            decl.kind = classify_variable(decl.text, decl.leading);
        } else if (node_is(node, "function_definition") || node_is(node, "constructor_definition")) {
            classify_function(decl);
        }
        decl.is_private = starts_with(decl.name, "_");
        if (!is_header(decl.kind)) seen_member = true;

        last_end_row = (int)node_last_row(node);
        last_start_byte = start_byte;
        decls->push_back(std::move(decl));
    }

    // comments after the last declaration stay at the end of it
    if (!pending.empty()) {
        if (decls->empty()) {
            Declaration rest;
            rest.kind = DeclKind::UNKNOWN;
            for (const PendingLine& line : pending) rest.leading.push_back(line.text);
            rest.text = rest.leading.back();
            rest.leading.pop_back();
            decls->push_back(std::move(rest));
        } else {
            for (const PendingLine& line : pending) decls->back().trailing.push_back(line.text);
        }
    }
    return true;
}

// ============================================================================
// Sorting and rebuild
// ============================================================================

static int class_annotation_rank(const std::string& text) {
    if (starts_with(text, "@tool")) return 0;
    if (starts_with(text, "@icon")) return 1;
    return 2;
}

void sort_declarations(std::vector<Declaration>& decls) {
    std::stable_sort(decls.begin(), decls.end(), [](const Declaration& a, const Declaration& b) {
        if (a.kind != b.kind) return a.kind < b.kind;
        if (a.kind == DeclKind::UNKNOWN) return false;
        if (a.kind == DeclKind::BUILTIN_VIRTUAL && a.builtin_rank != b.builtin_rank)
            return a.builtin_rank < b.builtin_rank;
        if (a.is_private != b.is_private) return !a.is_private;
        if (a.kind == DeclKind::CLASS_ANNOTATION)
            return class_annotation_rank(a.text) < class_annotation_rank(b.text);
        return a.name < b.name;
    });
}

enum class DeclGroup { HEADER, SIGNAL, ENUM, CONSTANT, STATIC_VARIABLE, EXPORT_VARIABLE,
                       REGULAR_VARIABLE, ONREADY_VARIABLE, METHOD, INNER_CLASS, UNKNOWN };

static DeclGroup group_of(DeclKind kind) {
    switch (kind) {
        case DeclKind::CLASS_ANNOTATION:
        case DeclKind::CLASS_NAME:
        case DeclKind::EXTENDS:
        case DeclKind::DOCSTRING: return DeclGroup::HEADER;
        case DeclKind::SIGNAL: return DeclGroup::SIGNAL;
        case DeclKind::ENUM: return DeclGroup::ENUM;
        case DeclKind::CONSTANT: return DeclGroup::CONSTANT;
        case DeclKind::STATIC_VARIABLE: return DeclGroup::STATIC_VARIABLE;
        case DeclKind::EXPORT_VARIABLE: return DeclGroup::EXPORT_VARIABLE;
        case DeclKind::REGULAR_VARIABLE: return DeclGroup::REGULAR_VARIABLE;
        case DeclKind::ONREADY_VARIABLE: return DeclGroup::ONREADY_VARIABLE;
        case DeclKind::STATIC_INIT:
        case DeclKind::STATIC_FUNCTION:
        case DeclKind::BUILTIN_VIRTUAL:
        case DeclKind::METHOD: return DeclGroup::METHOD;
        case DeclKind::INNER_CLASS: return DeclGroup::INNER_CLASS;
        case DeclKind::UNKNOWN: return DeclGroup::UNKNOWN;
    }
    return DeclGroup::UNKNOWN;
}

static void append_line(std::string& out, const std::string& text) {
    out += text;
    if (out.empty() || out.back() != '\n') out += '\n';
}

std::string build_reordered_source(const std::vector<Declaration>& decls) {
    std::string out;
    bool first = true;
    DeclGroup previous = DeclGroup::HEADER;
    for (const Declaration& decl : decls) {
        DeclGroup group = group_of(decl.kind);
        if (!first) {
            if (group == DeclGroup::METHOD || group == DeclGroup::INNER_CLASS) out += "\n\n";
            else if (group != previous) out += "\n";
        }
        for (const std::string& line : decl.leading) append_line(out, line);
        append_line(out, decl.text);
        for (const std::string& line : decl.trailing) append_line(out, line);
        previous = group;
        first = false;
    }
    return out;
}

bool reorder_gdscript(const std::string& source, std::string* output, std::string* error) {
    std::vector<Declaration> decls;
    if (!extract_declarations(source, &decls, error)) return false;
    if (decls.empty()) {
        *output = source;
        return true;
    }
    clog_debug(log_get_category("reorder"), "%zu top-level declarations", decls.size());
    sort_declarations(decls);
    *output = build_reordered_source(decls);
    return true;
}

} // namespace gdfmt
