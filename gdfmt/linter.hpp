/**
 * @file linter.hpp
 * @brief GDScript style linter
 *
 * Rules declare the node kinds they want to see; the linter walks the parse
 * tree once and hands every node to the rules interested in its kind.
 * Source-level rules (line length) see the raw text instead.
 *
 * Issues on a line can be silenced with comments:
 *   # gdlint-ignore-next-line [rule, ...]   the following line
 *   # gdlint-ignore [rule, ...]             the line holding the comment
 * Without a rule list every rule is silenced.
 */

#pragma once

#include "syntax_tree.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace gdfmt {

enum class Severity { ERROR, WARNING };

const char* severity_name(Severity severity);

struct LintIssue {
    uint32_t line;       // 1-based
    uint32_t column;     // 1-based byte column
    std::string rule;
    Severity severity;
    std::string message;
};

// "path:line:rule:severity: message"
std::string format_issue(const std::string& path, const LintIssue& issue);

struct LinterConfig {
    int max_line_length = 100;
    std::set<std::string> disabled_rules;
};

class LintRule {
public:
    virtual ~LintRule() = default;

    virtual const char* name() const = 0;

    // Node kinds this rule inspects; empty for source-only rules.
    virtual std::vector<const char*> target_kinds() const { return {}; }

    // Once per lint run, before the tree walk.
    virtual void check_source(const std::string& source, std::vector<LintIssue>& issues) {
        (void)source; (void)issues;
    }

    // For each node whose kind is in target_kinds().
    virtual void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) {
        (void)node; (void)source; (void)issues;
    }

    // After the walk, for rules that report on collected data.
    virtual void finalize(const std::string& source, std::vector<LintIssue>& issues) {
        (void)source; (void)issues;
    }
};

// Names of every built-in rule, in registration order.
const std::vector<std::string>& builtin_rule_names();

// Built-in rules not disabled by the config.
std::vector<std::unique_ptr<LintRule>> make_builtin_rules(const LinterConfig& config);

// line (1-based) -> ignored rule names; an empty set ignores every rule
typedef std::map<uint32_t, std::set<std::string>> IgnoreMap;

IgnoreMap parse_ignore_comments(const std::string& source);
bool is_ignored(const IgnoreMap& ignores, uint32_t line, const std::string& rule);

// Split "a, b c" into rule names.
std::set<std::string> parse_rule_list(const std::string& text);

class Linter {
public:
    explicit Linter(LinterConfig config);

    Linter(const Linter&) = delete;
    Linter& operator=(const Linter&) = delete;

    const LinterConfig& config() const { return config_; }

    /**
     * Lint one source.
     * @param issues sorted by line, then column
     * @return false if the source could not be parsed at all
     */
    bool lint(const std::string& source, std::vector<LintIssue>* issues, std::string* error);

private:
    LinterConfig config_;
};

} // namespace gdfmt
