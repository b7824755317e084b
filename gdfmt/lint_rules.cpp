/**
 * @file lint_rules.cpp
 * @brief Built-in lint rules
 */

#include "linter.hpp"
#include "../lib/str.h"

#include <re2/re2.h>
#include <unordered_map>

namespace gdfmt {

// ============================================================================
// Naming patterns
// ============================================================================

static const RE2& snake_case() {
    static const RE2 re("[a-z][a-z0-9_]*");
    return re;
}

static const RE2& private_snake_case() {
    static const RE2 re("_[a-z][a-z0-9_]*");
    return re;
}

static const RE2& pascal_case() {
    static const RE2 re("[A-Z][a-zA-Z0-9]*");
    return re;
}

static const RE2& constant_case() {
    static const RE2 re("[A-Z][A-Z0-9_]*");
    return re;
}

static const RE2& private_constant_case() {
    static const RE2 re("_[A-Z][A-Z0-9_]*");
    return re;
}

static bool full_match(std::string_view text, const RE2& re) {
    return RE2::FullMatch(re2::StringPiece(text.data(), text.size()), re);
}

static bool is_snake_or_private(std::string_view name) {
    return full_match(name, snake_case()) || full_match(name, private_snake_case());
}

static bool is_constant_or_private(std::string_view name) {
    return full_match(name, constant_case()) || full_match(name, private_constant_case());
}

// ============================================================================
// Helpers
// ============================================================================

static LintIssue issue_at(TSNode node, const char* rule, Severity severity, std::string message) {
    TSPoint start = ts_node_start_point(node);
    return LintIssue{start.row + 1, start.column + 1, rule, severity, std::move(message)};
}

// `load(...)` or `preload(...)` call; preload_only restricts to the latter
static bool is_load_call(TSNode node, const std::string& source, bool preload_only) {
    if (!node_is(node, "call")) return false;
    TSNode function = ts_node_child(node, 0);
    if (ts_node_is_null(function)) return false;
    std::string_view name = node_text(function, source);
    return name == "preload" || (!preload_only && name == "load");
}

// Parameter or loop variable name: the node itself or its first child
static std::string_view binding_name(TSNode node, const std::string& source) {
    if (node_is(node, "identifier")) return node_text(node, source);
    TSNode first = ts_node_child(node, 0);
    if (ts_node_is_null(first)) return {};
    return node_text(first, source);
}

// Parameter nodes of a function definition that bind a name
static bool is_parameter(TSNode node) {
    return node_is(node, "identifier") || node_is(node, "typed_parameter") ||
           node_is(node, "default_parameter") || node_is(node, "typed_default_parameter");
}

// Last statement of a body, comments skipped
static TSNode last_statement(TSNode body) {
    TSNode last = {};
    uint32_t count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; i++) {
        TSNode stmt = ts_node_named_child(body, i);
        if (!node_is(stmt, "comment")) last = stmt;
    }
    return last;
}

static bool ends_with_return(TSNode body) {
    return !ts_node_is_null(body) && node_is(last_statement(body), "return_statement");
}

// Whether an identifier spelled `name` occurs anywhere under node
static bool uses_identifier(TSNode node, std::string_view name, const std::string& source) {
    TSTreeCursor cursor = ts_tree_cursor_new(node);
    bool found = false;
    bool done = false;
    while (!done) {
        TSNode current = ts_tree_cursor_current_node(&cursor);
        if (node_is(current, "identifier") && node_text(current, source) == name) {
            found = true;
            break;
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
    return found;
}

namespace {

// Rule checking the "name" field of a node against a predicate
class NameFieldRule : public LintRule {
public:
    typedef bool (*Predicate)(std::string_view);

    NameFieldRule(const char* name, std::vector<const char*> kinds, Predicate valid, const char* what,
                  const char* format)
        : name_(name), kinds_(std::move(kinds)), valid_(valid), what_(what), format_(format) {}

    const char* name() const override { return name_; }
    std::vector<const char*> target_kinds() const override { return kinds_; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode name_node = child_by_field(node, "name");
        if (ts_node_is_null(name_node)) return;
        std::string_view name = node_text(name_node, source);
        if (valid_(name)) return;
        issues.push_back(issue_at(name_node, name_, Severity::ERROR,
            std::string(what_) + " '" + std::string(name) + "' should be in " + format_ + " format"));
    }

private:
    const char* name_;
    std::vector<const char*> kinds_;
    Predicate valid_;
    const char* what_;
    const char* format_;
};

class VariableNameRule : public LintRule {
public:
    const char* name() const override { return "variable-name"; }
    std::vector<const char*> target_kinds() const override {
        return {"variable_statement", "export_variable_statement", "onready_variable_statement"};
    }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode name_node = child_by_field(node, "name");
        if (ts_node_is_null(name_node)) return;
        std::string_view name = node_text(name_node, source);
        // loaded scripts and scenes may be named like classes
        if (is_load_call(child_by_field(node, "value"), source, false)) {
            if (is_snake_or_private(name) || full_match(name, pascal_case())) return;
            issues.push_back(issue_at(name_node, this->name(), Severity::ERROR,
                "Variable name '" + std::string(name) +
                "' should be in PascalCase, snake_case or _private_snake_case format"));
            return;
        }
        if (is_snake_or_private(name)) return;
        issues.push_back(issue_at(name_node, this->name(), Severity::ERROR,
            "Variable name '" + std::string(name) + "' should be in snake_case or _private_snake_case format"));
    }
};

class ConstantNameRule : public LintRule {
public:
    const char* name() const override { return "constant-name"; }
    std::vector<const char*> target_kinds() const override { return {"const_statement"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode name_node = child_by_field(node, "name");
        if (ts_node_is_null(name_node)) return;
        std::string_view name = node_text(name_node, source);
        if (is_load_call(child_by_field(node, "value"), source, true)) {
            if (is_constant_or_private(name) || full_match(name, pascal_case())) return;
            issues.push_back(issue_at(name_node, this->name(), Severity::ERROR,
                "Preload constant name '" + std::string(name) + "' should be in PascalCase or CONSTANT_CASE format"));
            return;
        }
        if (is_constant_or_private(name)) return;
        issues.push_back(issue_at(name_node, this->name(), Severity::ERROR,
            "Constant name '" + std::string(name) + "' should be in CONSTANT_CASE format"));
    }
};

class FunctionArgumentNameRule : public LintRule {
public:
    const char* name() const override { return "function-argument-name"; }
    std::vector<const char*> target_kinds() const override { return {"function_definition"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode params = child_by_field(node, "parameters");
        if (ts_node_is_null(params)) return;
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; i++) {
            TSNode param = ts_node_named_child(params, i);
            if (!is_parameter(param)) continue;
            std::string_view name = binding_name(param, source);
            if (name.empty() || is_snake_or_private(name)) continue;
            issues.push_back(issue_at(param, this->name(), Severity::ERROR,
                "Function argument '" + std::string(name) + "' should be in snake_case or _private_snake_case format"));
        }
    }
};

class LoopVariableNameRule : public LintRule {
public:
    const char* name() const override { return "loop-variable-name"; }
    std::vector<const char*> target_kinds() const override { return {"for_statement"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode left = child_by_field(node, "left");
        if (!node_is(left, "identifier") && !node_is(left, "typed_parameter")) return;
        std::string_view name = binding_name(left, source);
        if (name.empty() || full_match(name, snake_case())) return;
        issues.push_back(issue_at(left, this->name(), Severity::ERROR,
            "Loop variable '" + std::string(name) + "' should be in snake_case format"));
    }
};

class EnumMemberNameRule : public LintRule {
public:
    const char* name() const override { return "enum-member-name"; }
    std::vector<const char*> target_kinds() const override { return {"enum_definition"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode body = child_by_field(node, "body");
        if (ts_node_is_null(body)) return;
        uint32_t count = ts_node_named_child_count(body);
        for (uint32_t i = 0; i < count; i++) {
            TSNode member = ts_node_named_child(body, i);
            if (!node_is(member, "enumerator")) continue;
            TSNode left = child_by_field(member, "left");
            if (ts_node_is_null(left)) continue;
            std::string_view name = node_text(left, source);
            if (name.empty() || full_match(name, constant_case())) continue;
            issues.push_back(issue_at(left, this->name(), Severity::ERROR,
                "Enum element name '" + std::string(name) + "' should be in CONSTANT_CASE format"));
        }
    }
};

class UnnecessaryPassRule : public LintRule {
public:
    const char* name() const override { return "unnecessary-pass"; }
    std::vector<const char*> target_kinds() const override { return {"body", "class_body"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        (void)source;
        std::vector<TSNode> passes;
        bool has_other = false;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode stmt = ts_node_named_child(node, i);
            if (node_is(stmt, "pass_statement")) passes.push_back(stmt);
            else if (!node_is(stmt, "comment")) has_other = true;
        }
        if (!has_other) return;
        for (TSNode pass : passes) {
            issues.push_back(issue_at(pass, name(), Severity::WARNING,
                "Unnecessary 'pass' statement when other statements are present"));
        }
    }
};

class ComparisonWithItselfRule : public LintRule {
public:
    const char* name() const override { return "comparison-with-itself"; }
    std::vector<const char*> target_kinds() const override { return {"binary_operator"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode left = child_by_field(node, "left");
        TSNode op = child_by_field(node, "op");
        TSNode right = child_by_field(node, "right");
        if (ts_node_is_null(left) || ts_node_is_null(op) || ts_node_is_null(right)) return;
        std::string_view op_text = node_text(op, source);
        if (op_text != "==" && op_text != "!=" && op_text != "<" && op_text != ">" &&
            op_text != "<=" && op_text != ">=") {
            return;
        }
        if (node_text(left, source) != node_text(right, source)) return;
        issues.push_back(issue_at(node, name(), Severity::WARNING,
            "Redundant comparison '" + std::string(node_text(node, source)) +
            "' - comparing expression with itself"));
    }
};

class UnusedArgumentRule : public LintRule {
public:
    const char* name() const override { return "unused-argument"; }
    std::vector<const char*> target_kinds() const override { return {"function_definition"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode params = child_by_field(node, "parameters");
        TSNode body = child_by_field(node, "body");
        if (ts_node_is_null(params) || ts_node_is_null(body)) return;
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; i++) {
            TSNode param = ts_node_named_child(params, i);
            if (!is_parameter(param)) continue;
            std::string_view name = binding_name(param, source);
            if (name.empty() || name[0] == '_') continue;
            if (uses_identifier(body, name, source)) continue;
            issues.push_back(issue_at(param, this->name(), Severity::WARNING,
                "Function argument '" + std::string(name) +
                "' is unused. Consider removing it or prefixing with '_'"));
        }
    }
};

// Literals and operator expressions whose value is thrown away
class StandaloneExpressionRule : public LintRule {
public:
    const char* name() const override { return "standalone-expression"; }
    std::vector<const char*> target_kinds() const override { return {"expression_statement"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        TSNode expr = ts_node_child(node, 0);
        if (ts_node_is_null(expr)) return;
        static const char* const kinds[] = {"binary_operator", "integer", "float", "string", "true", "false", "null"};
        bool flagged = false;
        for (const char* kind : kinds) {
            if (node_is(expr, kind)) { flagged = true; break; }
        }
        if (!flagged) return;
        issues.push_back(issue_at(expr, name(), Severity::WARNING,
            "Standalone expression '" + std::string(node_text(expr, source)) +
            "' is not assigned or used, the line may have no effect"));
    }
};

// `obj._member` and `obj._method()` outside self/super
class PrivateAccessRule : public LintRule {
public:
    const char* name() const override { return "private-access"; }
    std::vector<const char*> target_kinds() const override { return {"attribute"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        if (ts_node_child_count(node) < 3) return;
        std::string_view object = node_text(ts_node_child(node, 0), source);
        if (object == "self" || object == "super") return;
        TSNode member = ts_node_child(node, 2);
        bool is_call = node_is(member, "attribute_call");
        if (is_call) member = ts_node_child(member, 0);
        else if (!node_is(member, "identifier")) return;
        if (ts_node_is_null(member)) return;
        std::string_view member_name = node_text(member, source);
        if (member_name.empty() || member_name[0] != '_') return;
        std::string message = is_call
            ? "Private method '" + std::string(member_name) + "' should not be called from outside its class"
            : "Private variable '" + std::string(member_name) + "' should not be accessed from outside its class";
        issues.push_back(issue_at(member, name(), Severity::ERROR, std::move(message)));
    }
};

// elif/else following branches that all end in return
class NoElseReturnRule : public LintRule {
public:
    const char* name() const override { return "no-else-return"; }
    std::vector<const char*> target_kinds() const override { return {"if_statement"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        (void)source;
        bool if_returns = ends_with_return(child_by_field(node, "body"));
        bool all_return = if_returns;
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            TSNode clause = ts_node_named_child(node, i);
            if (node_is(clause, "elif_clause")) {
                if (if_returns) {
                    issues.push_back(issue_at(clause, name(), Severity::WARNING,
                        "Unnecessary 'elif' after 'if' block that ends with 'return'. Use 'if' instead"));
                }
                TSNode body = child_by_field(clause, "body");
                if (!ts_node_is_null(body) && !ends_with_return(body)) all_return = false;
            } else if (node_is(clause, "else_clause") && all_return) {
                issues.push_back(issue_at(clause, name(), Severity::WARNING,
                    "Unnecessary 'else' after 'if'/'elif' blocks that end with 'return'"));
            }
        }
    }
};

// Collects every load/preload path, reports the repeated ones at the end
class DuplicatedLoadRule : public LintRule {
public:
    const char* name() const override { return "duplicated-load"; }
    std::vector<const char*> target_kinds() const override { return {"call"}; }

    void check_node(TSNode node, const std::string& source, std::vector<LintIssue>& issues) override {
        (void)issues;
        if (!is_load_call(node, source, false)) return;
        TSNode args = child_by_field(node, "arguments");
        if (ts_node_is_null(args)) return;
        uint32_t count = ts_node_named_child_count(args);
        for (uint32_t i = 0; i < count; i++) {
            TSNode arg = ts_node_named_child(args, i);
            if (!node_is(arg, "string")) continue;
            std::string path(node_text(arg, source));
            if (!locations_.count(path)) order_.push_back(path);
            locations_[path].push_back(ts_node_start_point(arg));
        }
    }

    void finalize(const std::string& source, std::vector<LintIssue>& issues) override {
        (void)source;
        for (const std::string& path : order_) {
            const std::vector<TSPoint>& points = locations_[path];
            if (points.size() < 2) continue;
            for (const TSPoint& point : points) {
                issues.push_back(LintIssue{point.row + 1, point.column + 1, name(), Severity::WARNING,
                    "Duplicated load of '" + path + "'. Consider extracting to a constant."});
            }
        }
        locations_.clear();
        order_.clear();
    }

private:
    std::unordered_map<std::string, std::vector<TSPoint>> locations_;
    std::vector<std::string> order_;
};

class MaxLineLengthRule : public LintRule {
public:
    explicit MaxLineLengthRule(int max_length) : max_length_(max_length) {}

    const char* name() const override { return "max-line-length"; }

    void check_source(const std::string& source, std::vector<LintIssue>& issues) override {
        uint32_t line = 1;
        size_t pos = 0;
        while (pos < source.size()) {
            size_t end = source.find('\n', pos);
            if (end == std::string::npos) end = source.size();
            size_t line_end = end;
            if (line_end > pos && source[line_end - 1] == '\r') line_end--;

            // tabs count as 4 columns
            size_t width = 0;
            size_t run = pos;
            for (size_t i = pos; i < line_end; i++) {
                if (source[i] != '\t') continue;
                width += str_utf8_count(source.data() + run, i - run) + 4;
                run = i + 1;
            }
            width += str_utf8_count(source.data() + run, line_end - run);

            if (width > (size_t)max_length_) {
                issues.push_back(LintIssue{line, (uint32_t)max_length_ + 1, name(), Severity::WARNING,
                    "Line is too long. Found " + std::to_string(width) + " characters, maximum allowed is " +
                    std::to_string(max_length_)});
            }
            pos = end + 1;
            line++;
        }
    }

private:
    int max_length_;
};

bool valid_function_name(std::string_view name) { return is_snake_or_private(name); }
bool valid_signal_name(std::string_view name) { return full_match(name, snake_case()); }
bool valid_pascal_name(std::string_view name) { return full_match(name, pascal_case()); }

} // namespace

// ============================================================================
// Registry
// ============================================================================

typedef std::unique_ptr<LintRule> (*RuleFactory)(const LinterConfig&);

struct RuleDefinition {
    const char* name;
    RuleFactory create;
};

static const RuleDefinition ALL_RULES[] = {
    {"duplicated-load", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<DuplicatedLoadRule>(); }},
    {"standalone-expression", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<StandaloneExpressionRule>(); }},
    {"unnecessary-pass", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<UnnecessaryPassRule>(); }},
    {"unused-argument", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<UnusedArgumentRule>(); }},
    {"comparison-with-itself", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<ComparisonWithItselfRule>(); }},
    {"private-access", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<PrivateAccessRule>(); }},
    {"max-line-length", [](const LinterConfig& config) -> std::unique_ptr<LintRule> {
        return std::make_unique<MaxLineLengthRule>(config.max_line_length); }},
    {"no-else-return", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<NoElseReturnRule>(); }},
    {"function-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<NameFieldRule>("function-name", std::vector<const char*>{"function_definition"},
            valid_function_name, "Function name", "snake_case or _private_snake_case"); }},
    {"class-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<NameFieldRule>("class-name",
            std::vector<const char*>{"class_name_statement", "class_definition"},
            valid_pascal_name, "Class name", "PascalCase"); }},
    {"signal-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<NameFieldRule>("signal-name", std::vector<const char*>{"signal_statement"},
            valid_signal_name, "Signal name", "snake_case"); }},
    {"variable-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<VariableNameRule>(); }},
    {"function-argument-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<FunctionArgumentNameRule>(); }},
    {"loop-variable-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<LoopVariableNameRule>(); }},
    {"enum-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<NameFieldRule>("enum-name", std::vector<const char*>{"enum_definition"},
            valid_pascal_name, "Enum name", "PascalCase"); }},
    {"enum-member-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<EnumMemberNameRule>(); }},
    {"constant-name", [](const LinterConfig&) -> std::unique_ptr<LintRule> {
        return std::make_unique<ConstantNameRule>(); }},
};

const std::vector<std::string>& builtin_rule_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> list;
        for (const RuleDefinition& def : ALL_RULES) list.push_back(def.name);
        return list;
    }();
    return names;
}

std::vector<std::unique_ptr<LintRule>> make_builtin_rules(const LinterConfig& config) {
    std::vector<std::unique_ptr<LintRule>> rules;
    for (const RuleDefinition& def : ALL_RULES) {
        if (config.disabled_rules.count(def.name)) continue;
        rules.push_back(def.create(config));
    }
    return rules;
}

} // namespace gdfmt
