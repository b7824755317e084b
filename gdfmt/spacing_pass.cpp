// spacing_pass.cpp - vertical spacing between declarations

#include "spacing_pass.hpp"
#include "../lib/log.h"

#include <algorithm>

namespace gdfmt {

// declaration, then optional comments/annotations, then a callable or class
static const char* DECL_THEN_CALLABLE_QUERY =
    "("
    "  [(variable_statement) (function_definition) (class_definition) (signal_statement)"
    "   (const_statement) (enum_definition) (constructor_definition)] @first"
    "  ."
    "  [(comment) (annotation)]* @comment"
    "  ."
    "  [(function_definition) (constructor_definition) (class_definition)] @second"
    ")";

// callable or class, directly followed by a member declaration
static const char* CALLABLE_THEN_MEMBER_QUERY =
    "("
    "  [(constructor_definition) (function_definition) (class_definition)] @first"
    "  ."
    "  [(variable_statement) (signal_statement) (const_statement) (enum_definition)] @second"
    ")";

static const char* const BLANK_RUN = "\n\n\n";

static const Query& decl_then_callable_query() {
    static const Query query(DECL_THEN_CALLABLE_QUERY);
    return query;
}

static const Query& callable_then_member_query() {
    static const Query query(CALLABLE_THEN_MEMBER_QUERY);
    return query;
}

// Start of the first line after the node's last line.
static uint32_t line_after(const std::string& source, TSNode node) {
    uint32_t end = ts_node_end_byte(node);
    if (ts_node_end_point(node).column == 0) return end;
    return next_line_start(source, end);
}

// Insertion point for a declaration followed by comments and a callable:
// a block of comments sitting directly above the callable is kept attached to
// it, anything else (a trailing comment on the first declaration's line, a
// comment separated by a blank line) stays with the first declaration.
static uint32_t point_with_comments(const std::string& source, TSNode first,
                                    const std::vector<TSNode>& comments, TSNode second) {
    uint32_t first_row = node_last_row(first);
    uint32_t second_row = ts_node_start_point(second).row;

    size_t idx = comments.size() - 1;
    TSNode last = comments[idx];
    bool attached = node_last_row(last) + 1 == second_row &&
                    ts_node_start_point(last).row > first_row;
    if (!attached) return line_after(source, first);

    while (idx > 0) {
        TSNode prev = comments[idx - 1];
        uint32_t next_row = ts_node_start_point(comments[idx]).row;
        if (node_last_row(prev) + 1 != next_row || ts_node_start_point(prev).row <= first_row) break;
        idx--;
    }
    return line_start_at(source, ts_node_start_byte(comments[idx]));
}

std::vector<uint32_t> find_spacing_points(const Document& doc) {
    const std::string& source = doc.text();
    std::vector<uint32_t> points;

    const Query& query_a = decl_then_callable_query();
    uint32_t a_first = query_a.capture_index("first");
    uint32_t a_comment = query_a.capture_index("comment");
    uint32_t a_second = query_a.capture_index("second");

    QueryCursor cursor_a(query_a, doc.root());
    TSQueryMatch match;
    while (cursor_a.next(&match)) {
        TSNode first = {}, second = {};
        bool has_first = false, has_second = false;
        std::vector<TSNode> comments;
        for (uint16_t i = 0; i < match.capture_count; i++) {
            const TSQueryCapture& cap = match.captures[i];
            if (cap.index == a_first) { first = cap.node; has_first = true; }
            else if (cap.index == a_second) { second = cap.node; has_second = true; }
            else if (cap.index == a_comment) comments.push_back(cap.node);
        }
        if (!has_first || !has_second) continue;

        std::sort(comments.begin(), comments.end(), [](TSNode a, TSNode b) {
            return ts_node_start_byte(a) < ts_node_start_byte(b);
        });
        uint32_t point = comments.empty() ? line_after(source, first)
                                          : point_with_comments(source, first, comments, second);
        points.push_back(point);
    }

    const Query& query_b = callable_then_member_query();
    uint32_t b_second = query_b.capture_index("second");
    QueryCursor cursor_b(query_b, doc.root());
    while (cursor_b.next(&match)) {
        for (uint16_t i = 0; i < match.capture_count; i++) {
            if (match.captures[i].index == b_second) {
                points.push_back(line_start_at(source, ts_node_start_byte(match.captures[i].node)));
            }
        }
    }

    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    return points;
}

static bool is_blank_line(const std::string& source, uint32_t line_start, uint32_t line_end) {
    for (uint32_t i = line_start; i < line_end; i++) {
        if (source[i] != ' ' && source[i] != '\t' && source[i] != '\r') return false;
    }
    return true;
}

// Blank-line run around the line starting at point: from the line break that
// ends the previous non-blank line to the start of the next non-blank line.
static bool blank_run_at(const std::string& source, uint32_t point, uint32_t* start, uint32_t* end) {
    if (point == 0 || point > source.size() || source[point - 1] != '\n') return false;

    uint32_t run_start = point - 1;
    for (;;) {
        uint32_t line = line_start_at(source, run_start);
        if (line == 0 && is_blank_line(source, 0, run_start)) return false;  // nothing above
        if (!is_blank_line(source, line, run_start)) break;
        run_start = line - 1;
    }
    // the previous line's own trailing whitespace is left alone
    run_start = (uint32_t)source.find('\n', line_start_at(source, run_start));

    uint32_t run_end = point;
    while (run_end < source.size()) {
        size_t nl = source.find('\n', run_end);
        if (nl == std::string::npos) return false;  // only blanks until EOF
        if (!is_blank_line(source, run_end, (uint32_t)nl)) break;
        run_end = (uint32_t)nl + 1;
    }
    if (run_end >= source.size()) return false;

    *start = run_start;
    *end = run_end;
    return true;
}

std::vector<SpacingEdit> compute_spacing_edits(const Document& doc) {
    const std::string& source = doc.text();
    std::vector<SpacingEdit> edits;
    for (uint32_t point : find_spacing_points(doc)) {
        uint32_t start = 0, end = 0;
        if (!blank_run_at(source, point, &start, &end)) continue;
        if (source.compare(start, end - start, BLANK_RUN) == 0) continue;
        edits.push_back(SpacingEdit{start, end, BLANK_RUN});
    }

    std::sort(edits.begin(), edits.end(), [](const SpacingEdit& a, const SpacingEdit& b) {
        return a.start > b.start;
    });
    edits.erase(std::unique(edits.begin(), edits.end(), [](const SpacingEdit& a, const SpacingEdit& b) {
        return a.start == b.start;
    }), edits.end());
    return edits;
}

bool apply_spacing_edits(Document& doc, const std::vector<SpacingEdit>& edits) {
    if (edits.empty()) return true;
    std::string text = doc.text();
    std::vector<TextEdit> tree_edits;
    tree_edits.reserve(edits.size());
    for (const SpacingEdit& edit : edits) {
        // descending order: offsets before this edit are still valid
        tree_edits.push_back(make_text_edit(text, edit.start, edit.old_end, edit.text));
        text.replace(edit.start, edit.old_end - edit.start, edit.text);
    }
    return doc.apply_edits(std::move(text), tree_edits);
}

int run_spacing_pass(Document& doc) {
    std::vector<SpacingEdit> edits = compute_spacing_edits(doc);
    log_debug("spacing pass: %zu blank-line run(s) to normalize", edits.size());
    if (!apply_spacing_edits(doc, edits)) return -1;
    return (int)edits.size();
}

} // namespace gdfmt
