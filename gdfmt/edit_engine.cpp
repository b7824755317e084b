/**
 * @file edit_engine.cpp
 * @brief Regex-driven text edits that keep the syntax tree in sync
 */

#include "edit_engine.hpp"
#include "../lib/log.h"
#include "../lib/str.h"

#include <cstdlib>

namespace gdfmt {

// RE2 rewrites support \0..\9
static const int MAX_GROUPS = 10;

RegexEdit::RegexEdit(const char* name, const char* pattern, const char* rewrite,
                     int max_replacements)
    : name_(name), regex_(pattern), rewrite_(rewrite), max_replacements_(max_replacements) {
    if (!regex_.ok()) {
        log_fatal("edit '%s': invalid built-in pattern '%s': %s", name, pattern,
            regex_.error().c_str());
        abort();
    }
    std::string error;
    if (!regex_.CheckRewriteString(rewrite_, &error)) {
        log_fatal("edit '%s': invalid rewrite '%s': %s", name, rewrite, error.c_str());
        abort();
    }
}

EditPlan plan_regex_edit(const Document& doc, const RegexEdit& edit) {
    EditPlan plan;
    const std::string& text = doc.text();
    const RE2& regex = edit.regex();

    int ngroups = 1 + regex.NumberOfCapturingGroups();
    if (ngroups > MAX_GROUPS) ngroups = MAX_GROUPS;
    re2::StringPiece groups[MAX_GROUPS];
    re2::StringPiece input(text);

    TSNode root = doc.root();
    size_t pos = 0;          // scan position in the original text
    size_t copied = 0;       // original bytes up to here are already in new_text
    TSPoint cursor = {0, 0}; // position of new_text.size() in the edited text
    int applied = 0;

    while (pos <= text.size()) {
        if (!regex.Match(input, pos, text.size(), RE2::UNANCHORED, groups, ngroups)) break;
        size_t start = groups[0].data() - text.data();
        size_t end = start + groups[0].size();

        if (start == end) {
            // never apply an empty match, and never stall on one
            if (start >= text.size()) break;
            size_t step = str_utf8_char_len((unsigned char)text[start]);
            pos = start + (step ? step : 1);
            continue;
        }
        pos = end;

        if (byte_inside_kind(root, (uint32_t)start, "string")) {
            plan.skipped_in_string++;
            continue;
        }

        std::string replacement;
        if (!regex.Rewrite(&replacement, edit.rewrite(), groups, ngroups)) {
            log_error("edit '%s': rewrite failed at byte %zu", edit.name(), start);
            continue;
        }

        // unedited slice since the previous match
        std::string_view unchanged(text.data() + copied, start - copied);
        plan.new_text.append(unchanged);
        cursor = advance_point(cursor, unchanged);

        TextEdit te;
        te.start_byte = (uint32_t)plan.new_text.size();
        te.old_end_byte = te.start_byte + (uint32_t)(end - start);
        te.new_end_byte = te.start_byte + (uint32_t)replacement.size();
        te.start_position = cursor;
        te.old_end_position = advance_point(cursor, std::string_view(text.data() + start, end - start));
        te.new_end_position = advance_point(cursor, replacement);
        plan.edits.push_back(te);

        plan.new_text.append(replacement);
        cursor = te.new_end_position;
        copied = end;

        applied++;
        if (edit.max_replacements() > 0 && applied >= edit.max_replacements()) break;
    }

    if (plan.edits.empty()) {
        plan.new_text.clear();
        return plan;
    }
    plan.new_text.append(text, copied, std::string::npos);
    return plan;
}

int apply_regex_edit(Document& doc, const RegexEdit& edit) {
    EditPlan plan = plan_regex_edit(doc, edit);
    if (plan.skipped_in_string > 0) {
        log_debug("edit '%s': skipped %d match(es) inside strings", edit.name(), plan.skipped_in_string);
    }
    if (plan.edits.empty()) return 0;

    int count = (int)plan.edits.size();
    log_debug("edit '%s': applying %d replacement(s)", edit.name(), count);
    if (!doc.apply_edits(std::move(plan.new_text), plan.edits)) return -1;
    return count;
}

} // namespace gdfmt
