// syntax_tree.hpp - tree-sitter adapter for GDScript
//
// Owns the text buffer and its concrete syntax tree for one file, and keeps
// the two consistent across text edits. Nodes are TSNode values borrowed from
// the tree: any call that mutates the Document invalidates them.

#pragma once

#include <tree_sitter/api.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
    const TSLanguage* tree_sitter_gdscript(void);
}

namespace gdfmt {

// ============================================================================
// Text Edits
// ============================================================================

// One contiguous replacement plus the positional delta the tree needs to keep
// its node coordinates valid without a reparse.
struct TextEdit {
    uint32_t start_byte;
    uint32_t old_end_byte;
    uint32_t new_end_byte;
    TSPoint start_position;
    TSPoint old_end_position;
    TSPoint new_end_position;
};

// Advance a row/column cursor over text: '\n' starts a new row, any other
// byte advances the column.
TSPoint advance_point(TSPoint start, std::string_view text);

// Build the edit replacing [start, old_end) of source by replacement.
TextEdit make_text_edit(const std::string& source, uint32_t start, uint32_t old_end,
                        std::string_view replacement);

// ============================================================================
// Parser Adapter
// ============================================================================

const TSLanguage* gdscript_language();

class Parser {
public:
    Parser();
    ~Parser();

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    // Full parse when previous is null, incremental otherwise. Returns null
    // only when tree-sitter itself fails; syntax errors yield ERROR nodes.
    // The caller owns the returned tree.
    TSTree* parse(const std::string& text, TSTree* previous);

private:
    TSParser* parser_;
};

// ============================================================================
// Document: SourceBuffer + SyntaxTree
// ============================================================================

class Document {
public:
    explicit Document(std::string text);
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    // false when the initial parse failed
    bool valid() const { return tree_ != nullptr; }

    const std::string& text() const { return text_; }
    TSTree* tree() const { return tree_; }
    TSNode root() const { return ts_tree_root_node(tree_); }

    // Replace the buffer and reparse from scratch.
    bool reset(std::string text);

    // Replace the buffer with new_text, mirror the edits into the tree with
    // ts_tree_edit, then reparse incrementally. Edits are applied in order,
    // each expressed in the coordinates left by the previous one.
    bool apply_edits(std::string new_text, const std::vector<TextEdit>& edits);

    // Number of full or incremental parses performed, for diagnostics.
    int parse_count() const { return parse_count_; }

private:
    Parser parser_;
    std::string text_;
    TSTree* tree_;
    int parse_count_;
};

// ============================================================================
// Node helpers
// ============================================================================

inline bool node_is(TSNode node, const char* kind) {
    return !ts_node_is_null(node) && std::string_view(ts_node_type(node)) == kind;
}

std::string_view node_text(TSNode node, const std::string& source);

TSNode child_by_field(TSNode node, const char* field);

// Row of the last character of the node. A node ending at column 0 ends on
// the previous row.
uint32_t node_last_row(TSNode node);

// True if the byte lies inside a node of the given kind (or one of its
// descendants).
bool byte_inside_kind(TSNode root, uint32_t byte, const char* kind);

// Byte offset of the start of the line holding byte.
uint32_t line_start_at(const std::string& source, uint32_t byte);

// Byte offset just past the line break ending the line holding byte, or the
// end of the buffer.
uint32_t next_line_start(const std::string& source, uint32_t byte);

// ============================================================================
// Queries
// ============================================================================

// Compiled tree-sitter query against the GDScript grammar. Built-in queries
// are compiled once per process; a malformed one is a defect and aborts.
class Query {
public:
    explicit Query(const char* source);
    ~Query();

    Query(const Query&) = delete;
    Query& operator=(const Query&) = delete;

    const TSQuery* get() const { return query_; }

    // Capture index for a name, or UINT32_MAX if the query has no such capture.
    uint32_t capture_index(std::string_view name) const;

private:
    TSQuery* query_;
};

class QueryCursor {
public:
    QueryCursor(const Query& query, TSNode node);
    ~QueryCursor();

    QueryCursor(const QueryCursor&) = delete;
    QueryCursor& operator=(const QueryCursor&) = delete;

    bool next(TSQueryMatch* match);

private:
    TSQueryCursor* cursor_;
};

} // namespace gdfmt
