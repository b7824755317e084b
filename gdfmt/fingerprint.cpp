/**
 * @file fingerprint.cpp
 * @brief Structural fingerprints of syntax trees for safe mode
 */

#include "fingerprint.hpp"
#include "../lib/log.h"

#include <cstring>
#include <utility>

namespace gdfmt {

const Fingerprint* Fingerprint::find_child(const char* child_kind) const {
    for (const Fingerprint& child : children) {
        if (child.kind == child_kind) return &child;
    }
    return nullptr;
}

static Fingerprint fingerprint_at(TSTreeCursor* cursor, const std::string& source, bool keep_leaf_text) {
    TSNode node = ts_tree_cursor_current_node(cursor);
    Fingerprint fp;
    fp.grammar_id = ts_node_grammar_symbol(node);
    fp.kind = ts_node_type(node);
    fp.row = ts_node_start_point(node).row;

    if (ts_tree_cursor_goto_first_child(cursor)) {
        do {
            fp.children.push_back(fingerprint_at(cursor, source, keep_leaf_text));
        } while (ts_tree_cursor_goto_next_sibling(cursor));
        ts_tree_cursor_goto_parent(cursor);
    } else if (keep_leaf_text) {
        fp.has_text = true;
        fp.text = std::string(node_text(node, source));
    }
    return fp;
}

Fingerprint build_fingerprint(TSNode node, const std::string& source, bool keep_leaf_text) {
    TSTreeCursor cursor = ts_tree_cursor_new(node);
    Fingerprint fp = fingerprint_at(&cursor, source, keep_leaf_text);
    ts_tree_cursor_delete(&cursor);
    return fp;
}

static std::string describe(const Fingerprint& fp) {
    return fp.kind + " (line " + std::to_string(fp.row + 1) + ")";
}

bool fingerprints_equal(const Fingerprint& expected, const Fingerprint& actual, std::string* detail) {
    if (expected.grammar_id != actual.grammar_id) {
        if (detail) *detail = "root differs: " + describe(expected) + " vs " + describe(actual);
        return false;
    }

    std::vector<std::pair<const Fingerprint*, const Fingerprint*>> stack;
    stack.push_back({&expected, &actual});
    while (!stack.empty()) {
        const Fingerprint* left = stack.back().first;
        const Fingerprint* right = stack.back().second;
        stack.pop_back();

        if (left->children.size() != right->children.size()) {
            if (detail) {
                *detail = describe(*left) + " has " + std::to_string(left->children.size()) +
                    " children, output " + describe(*right) + " has " +
                    std::to_string(right->children.size());
            }
            return false;
        }
        if (left->has_text && right->has_text && left->text != right->text) {
            if (detail) *detail = "text of " + describe(*left) + " changed";
            return false;
        }
        for (size_t i = 0; i < left->children.size(); i++) {
            const Fingerprint& l = left->children[i];
            const Fingerprint& r = right->children[i];
            if (l.grammar_id != r.grammar_id) {
                if (detail) *detail = describe(l) + " became " + describe(r);
                return false;
            }
            stack.push_back({&l, &r});
        }
    }
    return true;
}

// ============================================================================
// Normalization rules
// ============================================================================

namespace {

// Standalone argument-less annotations directly above a variable are pulled
// onto the variable's line by the formatter, where they parse as part of the
// variable statement.
class InlineAnnotationsRule : public NormalizationRule {
public:
    const char* name() const override { return "inline-annotations"; }
    int since_version() const override { return 1; }

    int apply(Fingerprint& root) const override {
        return visit(root);
    }

private:
    static TSSymbol annotations_symbol() {
        static const TSSymbol symbol = ts_language_symbol_for_name(
            gdscript_language(), "annotations", (uint32_t)strlen("annotations"), true);
        return symbol;
    }

    static void attach(Fingerprint& variable, Fingerprint annotation) {
        if (!variable.children.empty() && variable.children.front().kind == "annotations") {
            std::vector<Fingerprint>& list = variable.children.front().children;
            list.insert(list.begin(), std::move(annotation));
            return;
        }
        TSSymbol symbol = annotations_symbol();
        if (symbol == 0) {
            variable.children.insert(variable.children.begin(), std::move(annotation));
            return;
        }
        Fingerprint wrapper;
        wrapper.grammar_id = symbol;
        wrapper.kind = "annotations";
        wrapper.row = annotation.row;
        wrapper.children.push_back(std::move(annotation));
        variable.children.insert(variable.children.begin(), std::move(wrapper));
    }

    int visit(Fingerprint& parent) const {
        int count = 0;
        std::vector<Fingerprint>& children = parent.children;
        // walk backwards so stacked annotations keep their order
        for (size_t i = children.size(); i-- > 1;) {
            Fingerprint& candidate = children[i - 1];
            if (candidate.kind != "annotation" || candidate.find_child("arguments")) continue;
            if (children[i].kind != "variable_statement") continue;
            Fingerprint annotation = std::move(candidate);
            children.erase(children.begin() + (i - 1));
            attach(children[i - 1], std::move(annotation));
            count++;
        }
        for (Fingerprint& child : children) count += visit(child);
        return count;
    }
};

// `class_name A extends B` on one line parses with the extends clause inside
// the class_name statement; the formatter moves it to its own line where it
// parses as the next sibling.
class SplitClassNameExtendsRule : public NormalizationRule {
public:
    const char* name() const override { return "split-class-name-extends"; }
    int since_version() const override { return 1; }

    int apply(Fingerprint& root) const override {
        return visit(root);
    }

private:
    int visit(Fingerprint& parent) const {
        int count = 0;
        std::vector<Fingerprint>& children = parent.children;
        for (size_t i = 0; i < children.size(); i++) {
            if (children[i].kind != "class_name_statement") continue;
            std::vector<Fingerprint>& inner = children[i].children;
            for (size_t j = 0; j < inner.size(); j++) {
                if (inner[j].kind != "extends_statement") continue;
                Fingerprint extends = std::move(inner[j]);
                inner.erase(inner.begin() + j);
                children.insert(children.begin() + i + 1, std::move(extends));
                count++;
                break;
            }
        }
        for (Fingerprint& child : children) count += visit(child);
        return count;
    }
};

} // namespace

std::unique_ptr<NormalizationRule> make_inline_annotations_rule() {
    return std::make_unique<InlineAnnotationsRule>();
}

std::unique_ptr<NormalizationRule> make_split_class_name_extends_rule() {
    return std::make_unique<SplitClassNameExtendsRule>();
}

const NormalizationRuleSet& NormalizationRuleSet::builtin() {
    static const NormalizationRuleSet* rules = [] {
        NormalizationRuleSet* set = new NormalizationRuleSet();
        set->add(make_inline_annotations_rule());
        set->add(make_split_class_name_extends_rule());
        return set;
    }();
    return *rules;
}

void NormalizationRuleSet::add(std::unique_ptr<NormalizationRule> rule) {
    rules_.push_back(std::move(rule));
}

int NormalizationRuleSet::apply(Fingerprint& root, int version) const {
    int total = 0;
    for (const auto& rule : rules_) {
        if (rule->since_version() > version) continue;
        int count = rule->apply(root);
        if (count > 0) log_debug("normalization '%s': %d rewrite(s)", rule->name(), count);
        total += count;
    }
    return total;
}

} // namespace gdfmt
