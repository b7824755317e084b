#include <gtest/gtest.h>
#include <string>

#include "../gdfmt/edit_engine.hpp"
#include "../gdfmt/fingerprint.hpp"

using namespace gdfmt;

class EditEngineTest : public ::testing::Test {
protected:
    // the incrementally updated tree must match a fresh parse of the same text
    void expect_tree_matches_fresh_parse(const Document& doc) {
        Document fresh(doc.text());
        ASSERT_TRUE(fresh.valid());
        Fingerprint incremental = build_fingerprint(doc.root(), doc.text(), true);
        Fingerprint reparsed = build_fingerprint(fresh.root(), fresh.text(), true);
        std::string detail;
        EXPECT_TRUE(fingerprints_equal(reparsed, incremental, &detail)) << detail;
    }
};

TEST_F(EditEngineTest, ReplacesEveryMatch) {
    Document doc("var a = foo\nvar b = foo\n");
    RegexEdit edit("rename", "foo", "bar");
    EXPECT_EQ(apply_regex_edit(doc, edit), 2);
    EXPECT_EQ(doc.text(), "var a = bar\nvar b = bar\n");
    expect_tree_matches_fresh_parse(doc);
}

TEST_F(EditEngineTest, SkipsMatchesInsideStrings) {
    Document doc("var a = foo\nvar b = \"foo\"\n");
    RegexEdit edit("rename", "foo", "bar");

    EditPlan plan = plan_regex_edit(doc, edit);
    EXPECT_EQ(plan.edits.size(), 1u);
    EXPECT_EQ(plan.skipped_in_string, 1);

    EXPECT_EQ(apply_regex_edit(doc, edit), 1);
    EXPECT_EQ(doc.text(), "var a = bar\nvar b = \"foo\"\n") << "string contents must not be edited";
}

TEST_F(EditEngineTest, PlanDoesNotTouchDocument) {
    Document doc("var a = foo\n");
    RegexEdit edit("rename", "foo", "bar");
    int parses = doc.parse_count();
    EditPlan plan = plan_regex_edit(doc, edit);
    EXPECT_EQ(plan.new_text, "var a = bar\n");
    EXPECT_EQ(doc.text(), "var a = foo\n");
    EXPECT_EQ(doc.parse_count(), parses);
}

TEST_F(EditEngineTest, NoMatchLeavesDocumentAlone) {
    Document doc("var a = 1\n");
    RegexEdit edit("rename", "foo", "bar");
    int parses = doc.parse_count();
    EXPECT_EQ(apply_regex_edit(doc, edit), 0);
    EXPECT_EQ(doc.text(), "var a = 1\n");
    EXPECT_EQ(doc.parse_count(), parses) << "no reparse without edits";
}

TEST_F(EditEngineTest, EmptyMatchesAreNeverApplied) {
    Document doc("var a = 1\n");
    RegexEdit edit("empty", "x*", "y");
    EXPECT_EQ(apply_regex_edit(doc, edit), 0);
    EXPECT_EQ(doc.text(), "var a = 1\n");
}

TEST_F(EditEngineTest, EmptyMatchesDoNotHideLaterMatches) {
    Document doc("var x = 1\n");
    RegexEdit edit("empty", "x*", "y");
    EXPECT_EQ(apply_regex_edit(doc, edit), 1);
    EXPECT_EQ(doc.text(), "var y = 1\n");
}

TEST_F(EditEngineTest, MaxReplacementsLimitsEdits) {
    Document doc("var a = foo\nvar b = foo\nvar c = foo\n");
    RegexEdit edit("first-only", "foo", "bar", 1);
    EXPECT_EQ(apply_regex_edit(doc, edit), 1);
    EXPECT_EQ(doc.text(), "var a = bar\nvar b = foo\nvar c = foo\n");
    expect_tree_matches_fresh_parse(doc);
}

TEST_F(EditEngineTest, BackReferencesAndLineAnchors) {
    Document doc("var a = 1;\nvar b = 2 ;\n");
    RegexEdit edit("semicolons", "(?m)([ \\t]*;)+$", "");
    EXPECT_EQ(apply_regex_edit(doc, edit), 2);
    EXPECT_EQ(doc.text(), "var a = 1\nvar b = 2\n");

    Document swap("var a = b\n");
    RegexEdit swapper("swap", "(a) = (b)", "\\2 = \\1");
    EXPECT_EQ(apply_regex_edit(swap, swapper), 1);
    EXPECT_EQ(swap.text(), "var b = a\n");
}

TEST_F(EditEngineTest, MultiLineEditsKeepPositions) {
    Document doc("extends Node\n\n\n\nvar a = 1\nvar b = 2\n");
    RegexEdit edit("collapse", "\\n\\n+", "\n");
    EXPECT_EQ(apply_regex_edit(doc, edit), 1);
    EXPECT_EQ(doc.text(), "extends Node\nvar a = 1\nvar b = 2\n");
    expect_tree_matches_fresh_parse(doc);

    TSNode last = ts_node_named_child(doc.root(), ts_node_named_child_count(doc.root()) - 1);
    EXPECT_EQ(ts_node_start_point(last).row, 2u);
    EXPECT_EQ(node_text(last, doc.text()), "var b = 2");
}

TEST_F(EditEngineTest, MakeTextEditComputesPoints) {
    std::string source = "ab\ncd\nef";
    TextEdit edit = make_text_edit(source, 1, 4, "XY\nZ");
    EXPECT_EQ(edit.start_byte, 1u);
    EXPECT_EQ(edit.old_end_byte, 4u);
    EXPECT_EQ(edit.new_end_byte, 5u);
    EXPECT_EQ(edit.start_position.row, 0u);
    EXPECT_EQ(edit.start_position.column, 1u);
    EXPECT_EQ(edit.old_end_position.row, 1u);
    EXPECT_EQ(edit.old_end_position.column, 1u);
    EXPECT_EQ(edit.new_end_position.row, 1u);
    EXPECT_EQ(edit.new_end_position.column, 1u);
}
