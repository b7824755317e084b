#include <gtest/gtest.h>
#include <string>

#include "../gdfmt/fingerprint.hpp"

using namespace gdfmt;

class FingerprintTest : public ::testing::Test {
protected:
    Fingerprint fingerprint_of(const std::string& source, bool keep_leaf_text) {
        Document doc(source);
        EXPECT_TRUE(doc.valid());
        return build_fingerprint(doc.root(), doc.text(), keep_leaf_text);
    }

    bool same(const Fingerprint& a, const Fingerprint& b, std::string* detail = nullptr) {
        return fingerprints_equal(a, b, detail);
    }
};

TEST_F(FingerprintTest, WhitespaceDoesNotMatter) {
    Fingerprint a = fingerprint_of("var a=1\nfunc f( x ):\n\treturn x+1\n", false);
    Fingerprint b = fingerprint_of("var a = 1\n\n\nfunc f(x):\n\treturn x + 1\n", false);
    EXPECT_TRUE(same(a, b));
}

TEST_F(FingerprintTest, RecordsKindsAndRows) {
    Fingerprint fp = fingerprint_of("extends Node\nvar a = 1\n", false);
    EXPECT_EQ(fp.kind, "source");
    ASSERT_EQ(fp.children.size(), 2u);
    EXPECT_EQ(fp.children[0].kind, "extends_statement");
    EXPECT_EQ(fp.children[1].kind, "variable_statement");
    EXPECT_EQ(fp.children[1].row, 1u);
    EXPECT_NE(fp.find_child("variable_statement"), nullptr);
    EXPECT_EQ(fp.find_child("function_definition"), nullptr);
}

TEST_F(FingerprintTest, LeafTextOnlyComparedWhenKept) {
    EXPECT_TRUE(same(fingerprint_of("var a = 1\n", false), fingerprint_of("var a = 2\n", false)));

    std::string detail;
    EXPECT_FALSE(same(fingerprint_of("var a = 1\n", true), fingerprint_of("var a = 2\n", true), &detail));
    EXPECT_NE(detail.find("text of"), std::string::npos) << detail;
}

TEST_F(FingerprintTest, AddedStatementIsReported) {
    std::string detail;
    Fingerprint before = fingerprint_of("var a = 1\n", false);
    Fingerprint after = fingerprint_of("var a = 1\nvar b = 2\n", false);
    EXPECT_FALSE(same(before, after, &detail));
    EXPECT_NE(detail.find("children"), std::string::npos) << detail;
}

TEST_F(FingerprintTest, ChangedNodeKindIsReported) {
    std::string detail;
    Fingerprint before = fingerprint_of("var a = 1\n", false);
    Fingerprint after = fingerprint_of("const a = 1\n", false);
    EXPECT_FALSE(same(before, after, &detail));
    EXPECT_NE(detail.find("became"), std::string::npos) << detail;
}

TEST_F(FingerprintTest, InlineAnnotationsRuleMatchesJoinedForm) {
    Fingerprint standalone = fingerprint_of("@onready\nvar label = 1\n", false);
    Fingerprint joined = fingerprint_of("@onready var label = 1\n", false);

    std::unique_ptr<NormalizationRule> rule = make_inline_annotations_rule();
    EXPECT_STREQ(rule->name(), "inline-annotations");
    EXPECT_EQ(rule->apply(standalone), 1);

    std::string detail;
    EXPECT_TRUE(same(standalone, joined, &detail)) << detail;
}

TEST_F(FingerprintTest, InlineAnnotationsRuleKeepsAnnotationsWithArguments) {
    Fingerprint fp = fingerprint_of("@export_range(0, 10)\nvar speed = 1\n", false);
    std::unique_ptr<NormalizationRule> rule = make_inline_annotations_rule();
    EXPECT_EQ(rule->apply(fp), 0);
}

TEST_F(FingerprintTest, SplitClassNameExtendsRule) {
    Fingerprint joined = fingerprint_of("class_name Player extends Node\n", false);
    Fingerprint split = fingerprint_of("class_name Player\nextends Node\n", false);

    std::unique_ptr<NormalizationRule> rule = make_split_class_name_extends_rule();
    EXPECT_EQ(rule->apply(joined), 1);
    ASSERT_EQ(joined.children.size(), 2u);
    EXPECT_EQ(joined.children[1].kind, "extends_statement");

    std::string detail;
    EXPECT_TRUE(same(joined, split, &detail)) << detail;
}

TEST_F(FingerprintTest, BuiltinRuleSetHonorsVersion) {
    const NormalizationRuleSet& rules = NormalizationRuleSet::builtin();
    EXPECT_EQ(rules.size(), 2u);
    for (size_t i = 0; i < rules.size(); i++) {
        EXPECT_LE(rules.rule(i).since_version(), NormalizationRuleSet::CURRENT_VERSION);
    }

    Fingerprint fp = fingerprint_of("class_name Player extends Node\n", false);
    EXPECT_EQ(rules.apply(fp, 0), 0) << "no rule predates version 1";
    EXPECT_EQ(rules.apply(fp), 1);
    EXPECT_EQ(rules.apply(fp), 0) << "normalized fingerprints stay normalized";
}
