// syntax_tree.cpp - tree-sitter adapter for GDScript

#include "syntax_tree.hpp"
#include "../lib/log.h"

#include <cstdlib>
#include <cstring>

namespace gdfmt {

TSPoint advance_point(TSPoint start, std::string_view text) {
    TSPoint point = start;
    for (char c : text) {
        if (c == '\n') {
            point.row++;
            point.column = 0;
        } else {
            point.column++;
        }
    }
    return point;
}

TextEdit make_text_edit(const std::string& source, uint32_t start, uint32_t old_end,
                        std::string_view replacement) {
    std::string_view src(source);
    TextEdit edit;
    edit.start_byte = start;
    edit.old_end_byte = old_end;
    edit.new_end_byte = start + (uint32_t)replacement.size();
    edit.start_position = advance_point(TSPoint{0, 0}, src.substr(0, start));
    edit.old_end_position = advance_point(edit.start_position, src.substr(start, old_end - start));
    edit.new_end_position = advance_point(edit.start_position, replacement);
    return edit;
}

const TSLanguage* gdscript_language() {
    return tree_sitter_gdscript();
}

// ============================================================================
// Parser
// ============================================================================

Parser::Parser() : parser_(ts_parser_new()) {
    if (!ts_parser_set_language(parser_, gdscript_language())) {
        // ABI mismatch between the grammar and the runtime library
        log_error("tree-sitter: failed to set GDScript language (ABI version %u)",
            ts_language_version(gdscript_language()));
        ts_parser_delete(parser_);
        parser_ = nullptr;
    }
}

Parser::~Parser() {
    if (parser_) ts_parser_delete(parser_);
}

TSTree* Parser::parse(const std::string& text, TSTree* previous) {
    if (!parser_) return nullptr;
    TSTree* tree = ts_parser_parse_string(parser_, previous, text.data(), (uint32_t)text.size());
    if (!tree) {
        log_error("tree-sitter: parse failed (%zu bytes)", text.size());
        ts_parser_reset(parser_);
    }
    return tree;
}

// ============================================================================
// Document
// ============================================================================

Document::Document(std::string text)
    : text_(std::move(text)), tree_(nullptr), parse_count_(0) {
    tree_ = parser_.parse(text_, nullptr);
    if (tree_) parse_count_++;
}

Document::~Document() {
    if (tree_) ts_tree_delete(tree_);
}

bool Document::reset(std::string text) {
    TSTree* tree = parser_.parse(text, nullptr);
    if (!tree) return false;
    if (tree_) ts_tree_delete(tree_);
    tree_ = tree;
    text_ = std::move(text);
    parse_count_++;
    return true;
}

bool Document::apply_edits(std::string new_text, const std::vector<TextEdit>& edits) {
    if (!tree_) return reset(std::move(new_text));
    for (const TextEdit& edit : edits) {
        TSInputEdit input_edit;
        input_edit.start_byte = edit.start_byte;
        input_edit.old_end_byte = edit.old_end_byte;
        input_edit.new_end_byte = edit.new_end_byte;
        input_edit.start_point = edit.start_position;
        input_edit.old_end_point = edit.old_end_position;
        input_edit.new_end_point = edit.new_end_position;
        ts_tree_edit(tree_, &input_edit);
    }
    text_ = std::move(new_text);

    TSTree* tree = parser_.parse(text_, tree_);
    if (!tree) {
        // the edited tree no longer matches any text we hold; try from scratch
        log_warn("incremental reparse failed, falling back to a full parse");
        ts_tree_delete(tree_);
        tree_ = parser_.parse(text_, nullptr);
        if (tree_) parse_count_++;
        return tree_ != nullptr;
    }
    ts_tree_delete(tree_);
    tree_ = tree;
    parse_count_++;
    return true;
}

// ============================================================================
// Node helpers
// ============================================================================

std::string_view node_text(TSNode node, const std::string& source) {
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (start >= source.size() || end <= start) return std::string_view();
    if (end > source.size()) end = (uint32_t)source.size();
    return std::string_view(source).substr(start, end - start);
}

TSNode child_by_field(TSNode node, const char* field) {
    return ts_node_child_by_field_name(node, field, (uint32_t)strlen(field));
}

uint32_t node_last_row(TSNode node) {
    TSPoint end = ts_node_end_point(node);
    TSPoint start = ts_node_start_point(node);
    if (end.column == 0 && end.row > start.row) return end.row - 1;
    return end.row;
}

bool byte_inside_kind(TSNode root, uint32_t byte, const char* kind) {
    TSNode node = ts_node_descendant_for_byte_range(root, byte, byte);
    while (!ts_node_is_null(node)) {
        if (ts_node_start_byte(node) <= byte && byte < ts_node_end_byte(node) &&
            strcmp(ts_node_type(node), kind) == 0) {
            return true;
        }
        node = ts_node_parent(node);
    }
    return false;
}

uint32_t line_start_at(const std::string& source, uint32_t byte) {
    if (byte > source.size()) byte = (uint32_t)source.size();
    while (byte > 0 && source[byte - 1] != '\n') byte--;
    return byte;
}

uint32_t next_line_start(const std::string& source, uint32_t byte) {
    size_t nl = source.find('\n', byte);
    if (nl == std::string::npos) return (uint32_t)source.size();
    return (uint32_t)nl + 1;
}

// ============================================================================
// Queries
// ============================================================================

static const char* query_error_name(TSQueryError error) {
    switch (error) {
    case TSQueryErrorNone:      return "none";
    case TSQueryErrorSyntax:    return "syntax";
    case TSQueryErrorNodeType:  return "node type";
    case TSQueryErrorField:     return "field";
    case TSQueryErrorCapture:   return "capture";
    case TSQueryErrorStructure: return "structure";
    case TSQueryErrorLanguage:  return "language";
    }
    return "unknown";
}

Query::Query(const char* source) : query_(nullptr) {
    uint32_t error_offset = 0;
    TSQueryError error_type = TSQueryErrorNone;
    query_ = ts_query_new(gdscript_language(), source, (uint32_t)strlen(source),
        &error_offset, &error_type);
    if (!query_) {
        // built-in queries only: this is a defect, not bad user input
        log_fatal("tree-sitter: invalid built-in query (%s error at offset %u): %s",
            query_error_name(error_type), error_offset, source);
        abort();
    }
}

Query::~Query() {
    if (query_) ts_query_delete(query_);
}

uint32_t Query::capture_index(std::string_view name) const {
    uint32_t count = ts_query_capture_count(query_);
    for (uint32_t i = 0; i < count; i++) {
        uint32_t len = 0;
        const char* capture = ts_query_capture_name_for_id(query_, i, &len);
        if (std::string_view(capture, len) == name) return i;
    }
    return UINT32_MAX;
}

QueryCursor::QueryCursor(const Query& query, TSNode node) : cursor_(ts_query_cursor_new()) {
    ts_query_cursor_exec(cursor_, query.get(), node);
}

QueryCursor::~QueryCursor() {
    ts_query_cursor_delete(cursor_);
}

bool QueryCursor::next(TSQueryMatch* match) {
    return ts_query_cursor_next_match(cursor_, match);
}

} // namespace gdfmt
