/**
 * @file formatter.cpp
 * @brief GDScript formatting pipeline
 */

#include "formatter.hpp"
#include "edit_engine.hpp"
#include "fingerprint.hpp"
#include "reorder.hpp"
#include "spacing_pass.hpp"
#include "../lib/log.h"
#include "../lib/str.h"

namespace gdfmt {

bool is_valid_utf8(const std::string& text) {
    return str_utf8_valid(text.data(), text.size());
}

// ============================================================================
// Built-in edits
// ============================================================================

// Blank lines between the top-level `extends` and what follows; the ruleset
// decides the spacing there.
static const RegexEdit& extends_blank_lines_edit() {
    static const RegexEdit edit("extends-blank-lines",
        "(?m)(^[^#\\n]*extends )([a-zA-Z0-9_]+|\".*?\")\\n(\\n*)", "\\1\\2\n", 1);
    return edit;
}

static const RegexEdit& whitespace_lines_edit() {
    static const RegexEdit edit("whitespace-only-lines", "(?m)^[ \\t]+\\n", "\n");
    return edit;
}

// A semicolon left alone on its line joins the statement above.
static const RegexEdit& dangling_semicolons_edit() {
    static const RegexEdit edit("dangling-semicolons", "(?m)(\\s*;)+$", "");
    return edit;
}

bool preprocess_document(Document& doc) {
    return apply_regex_edit(doc, extends_blank_lines_edit()) >= 0;
}

bool postprocess_document(Document& doc) {
    if (apply_regex_edit(doc, whitespace_lines_edit()) < 0) return false;
    if (apply_regex_edit(doc, dangling_semicolons_edit()) < 0) return false;
    return run_spacing_pass(doc) >= 0;
}

// ============================================================================
// Pipeline
// ============================================================================

static FormatError parse_failure(const char* stage) {
    return FormatError(FORMAT_ERR_PARSE, std::string("syntax tree unavailable after ") + stage);
}

FormatError format_gdscript(const std::string& source, const FormatterConfig& config,
                            PrettyPrinter& printer, std::string* output) {
    Document doc(source);
    if (!doc.valid()) return parse_failure("initial parse");

    Fingerprint expected;
    if (config.safe) {
        expected = build_fingerprint(doc.root(), doc.text(), false);
        int rewrites = NormalizationRuleSet::builtin().apply(expected);
        log_debug("safe mode: input fingerprint normalized with %d rewrite(s)", rewrites);
    }

    if (!preprocess_document(doc)) return parse_failure("preprocessing");

    std::string printed, engine_error;
    if (!printer.format(doc, config.query_path, config.indent(), &printed, &engine_error)) {
        log_debug("%s failed: %s", printer.name(), engine_error.c_str());
        return FormatError(FORMAT_ERR_ENGINE, engine_error);
    }
    if (!is_valid_utf8(printed)) {
        return FormatError(FORMAT_ERR_ENCODING,
            std::string("output of ") + printer.name() + " is not valid UTF-8");
    }
    if (!doc.reset(std::move(printed))) return parse_failure("pretty-printing");

    if (!postprocess_document(doc)) return parse_failure("postprocessing");

    if (config.reorder_code) {
        std::string reordered, reorder_error;
        if (reorder_gdscript(doc.text(), &reordered, &reorder_error)) {
            if (!doc.reset(std::move(reordered))) return parse_failure("reordering");
        } else {
            clog_warn(log_get_category("reorder"),
                "code reordering failed: %s; keeping formatted code without reordering",
                reorder_error.c_str());
        }
    }

    if (config.safe) {
        Fingerprint actual = build_fingerprint(doc.root(), doc.text(), false);
        std::string detail;
        if (!fingerprints_equal(expected, actual, &detail)) {
            log_debug("safe mode: %s", detail.c_str());
            return FormatError(FORMAT_ERR_STRUCTURE_CHANGED,
                "formatting changed the code structure: " + detail);
        }
    }

    log_debug("formatted %zu bytes into %zu bytes (%d parses)", source.size(), doc.text().size(),
        doc.parse_count());
    *output = doc.text();
    return FormatError();
}

} // namespace gdfmt
