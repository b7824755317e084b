/**
 * @file fingerprint.hpp
 * @brief Structural fingerprints of syntax trees for safe mode
 *
 * A fingerprint reduces a tree to its shape and grammar ids. Safe mode builds
 * one for the input before formatting, rewrites it with the normalization
 * rules that describe the structural changes the formatter makes on purpose,
 * and compares it with the fingerprint of the final output.
 */

#pragma once

#include "syntax_tree.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gdfmt {

struct Fingerprint {
    TSSymbol grammar_id = 0;
    std::string kind;           // node type, for rules and diagnostics
    uint32_t row = 0;           // start row, for diagnostics only
    bool has_text = false;      // leaf text kept for strict comparison
    std::string text;
    std::vector<Fingerprint> children;

    const Fingerprint* find_child(const char* child_kind) const;
};

/**
 * Build the fingerprint of a node and all its children (named and anonymous).
 * @param keep_leaf_text also record the text of leaves for strict comparison
 */
Fingerprint build_fingerprint(TSNode node, const std::string& source, bool keep_leaf_text);

/**
 * Compare two fingerprints depth-first. Child counts and grammar ids must be
 * identical at every position; leaf texts are compared where both kept them.
 * @param detail set to a description of the first difference, if not null
 */
bool fingerprints_equal(const Fingerprint& expected, const Fingerprint& actual, std::string* detail);

// ============================================================================
// Normalization rules
// ============================================================================

class NormalizationRule {
public:
    virtual ~NormalizationRule() = default;

    virtual const char* name() const = 0;

    // First rule-set version that includes this rule.
    virtual int since_version() const = 0;

    // Rewrite the fingerprint in place; returns the number of rewrites.
    virtual int apply(Fingerprint& root) const = 0;
};

class NormalizationRuleSet {
public:
    static const int CURRENT_VERSION = 1;

    NormalizationRuleSet() = default;

    NormalizationRuleSet(const NormalizationRuleSet&) = delete;
    NormalizationRuleSet& operator=(const NormalizationRuleSet&) = delete;

    // Rule set shipped with this version of gdfmt, built once.
    static const NormalizationRuleSet& builtin();

    void add(std::unique_ptr<NormalizationRule> rule);

    // Apply, in registration order, every rule with since_version <= version.
    int apply(Fingerprint& root, int version = CURRENT_VERSION) const;

    size_t size() const { return rules_.size(); }
    const NormalizationRule& rule(size_t index) const { return *rules_[index]; }

private:
    std::vector<std::unique_ptr<NormalizationRule>> rules_;
};

// Built-in rules, exposed for tests.
std::unique_ptr<NormalizationRule> make_inline_annotations_rule();
std::unique_ptr<NormalizationRule> make_split_class_name_extends_rule();

} // namespace gdfmt
