/**
 * @file linter.cpp
 * @brief Lint driver: ignore comments, rule dispatch and tree walk
 */

#include "linter.hpp"
#include "../lib/log.h"

#include <algorithm>
#include <unordered_map>

namespace gdfmt {

const char* severity_name(Severity severity) {
    return severity == Severity::ERROR ? "error" : "warning";
}

std::string format_issue(const std::string& path, const LintIssue& issue) {
    return path + ":" + std::to_string(issue.line) + ":" + issue.rule + ":" +
        severity_name(issue.severity) + ": " + issue.message;
}

// ============================================================================
// Ignore comments
// ============================================================================

std::set<std::string> parse_rule_list(const std::string& text) {
    std::set<std::string> rules;
    std::string current;
    for (char c : text) {
        if (c == ',' || c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            if (!current.empty()) rules.insert(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) rules.insert(current);
    return rules;
}

static void add_ignore(IgnoreMap& ignores, uint32_t line, std::string_view rules_text) {
    std::set<std::string> parsed = parse_rule_list(std::string(rules_text));
    auto it = ignores.find(line);
    if (it == ignores.end()) {
        ignores[line] = std::move(parsed);
        return;
    }
    if (it->second.empty()) return;   // already ignores every rule
    if (parsed.empty()) it->second.clear();
    else it->second.insert(parsed.begin(), parsed.end());
}

IgnoreMap parse_ignore_comments(const std::string& source) {
    static const std::string_view NEXT_LINE = "gdlint-ignore-next-line";
    static const std::string_view SAME_LINE = "gdlint-ignore";

    IgnoreMap ignores;
    uint32_t line = 1;
    size_t pos = 0;
    while (pos <= source.size()) {
        size_t end = source.find('\n', pos);
        if (end == std::string::npos) end = source.size();
        std::string_view text(source.data() + pos, end - pos);

        size_t hash = text.find('#');
        if (hash != std::string_view::npos) {
            std::string_view comment = text.substr(hash);
            size_t at = comment.find(NEXT_LINE);
            if (at != std::string_view::npos) {
                add_ignore(ignores, line + 1, comment.substr(at + NEXT_LINE.size()));
            } else if ((at = comment.find(SAME_LINE)) != std::string_view::npos) {
                add_ignore(ignores, line, comment.substr(at + SAME_LINE.size()));
            }
        }
        if (end == source.size()) break;
        pos = end + 1;
        line++;
    }
    return ignores;
}

bool is_ignored(const IgnoreMap& ignores, uint32_t line, const std::string& rule) {
    auto it = ignores.find(line);
    if (it == ignores.end()) return false;
    return it->second.empty() || it->second.count(rule) > 0;
}

// ============================================================================
// Linter
// ============================================================================

Linter::Linter(LinterConfig config) : config_(std::move(config)) {}

bool Linter::lint(const std::string& source, std::vector<LintIssue>* issues, std::string* error) {
    Document doc(source);
    if (!doc.valid()) {
        *error = "failed to parse source";
        return false;
    }

    std::vector<std::unique_ptr<LintRule>> rules = make_builtin_rules(config_);

    // kind -> indices of the rules that inspect it
    std::unordered_map<std::string, std::vector<size_t>> dispatch;
    for (size_t i = 0; i < rules.size(); i++) {
        for (const char* kind : rules[i]->target_kinds()) dispatch[kind].push_back(i);
    }
    log_debug("lint: %zu rule(s), %zu node kind(s)", rules.size(), dispatch.size());

    std::vector<LintIssue> found;
    for (auto& rule : rules) rule->check_source(source, found);

    if (!dispatch.empty()) {
        TSTreeCursor cursor = ts_tree_cursor_new(doc.root());
        bool done = false;
        while (!done) {
            TSNode node = ts_tree_cursor_current_node(&cursor);
            if (ts_node_is_named(node)) {
                auto it = dispatch.find(ts_node_type(node));
                if (it != dispatch.end()) {
                    for (size_t index : it->second) rules[index]->check_node(node, source, found);
                }
            }
            if (ts_tree_cursor_goto_first_child(&cursor)) continue;
            while (!ts_tree_cursor_goto_next_sibling(&cursor)) {
                if (!ts_tree_cursor_goto_parent(&cursor)) {
                    done = true;
                    break;
                }
            }
        }
        ts_tree_cursor_delete(&cursor);
    }

    for (auto& rule : rules) rule->finalize(source, found);

    IgnoreMap ignores = parse_ignore_comments(source);
    issues->clear();
    for (LintIssue& issue : found) {
        if (!is_ignored(ignores, issue.line, issue.rule)) issues->push_back(std::move(issue));
    }
    std::stable_sort(issues->begin(), issues->end(), [](const LintIssue& a, const LintIssue& b) {
        if (a.line != b.line) return a.line < b.line;
        return a.column < b.column;
    });
    return true;
}

} // namespace gdfmt
