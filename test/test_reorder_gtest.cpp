#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../gdfmt/reorder.hpp"

using namespace gdfmt;

class ReorderTest : public ::testing::Test {
protected:
    std::vector<Declaration> extract(const std::string& source) {
        std::vector<Declaration> decls;
        std::string error;
        EXPECT_TRUE(extract_declarations(source, &decls, &error)) << error;
        return decls;
    }

    std::string reorder(const std::string& source) {
        std::string output, error;
        EXPECT_TRUE(reorder_gdscript(source, &output, &error)) << error;
        return output;
    }

    static Declaration make(DeclKind kind, const std::string& name, size_t order) {
        Declaration decl;
        decl.kind = kind;
        decl.name = name;
        decl.is_private = !name.empty() && name[0] == '_';
        decl.builtin_rank = builtin_virtual_rank(name);
        decl.text = name;
        decl.source_order = order;
        return decl;
    }
};

TEST_F(ReorderTest, StyleGuideOrder) {
    const std::string source =
        "extends Node\n"
        "\n"
        "var speed = 1\n"
        "const MAX = 5\n"
        "signal died\n"
        "\n"
        "\n"
        "func _process(delta):\n"
        "\tpass\n"
        "\n"
        "\n"
        "func _ready():\n"
        "\tpass\n";
    EXPECT_EQ(reorder(source),
        "extends Node\n"
        "\n"
        "signal died\n"
        "\n"
        "const MAX = 5\n"
        "\n"
        "var speed = 1\n"
        "\n"
        "\n"
        "func _ready():\n"
        "\tpass\n"
        "\n"
        "\n"
        "func _process(delta):\n"
        "\tpass\n");
}

TEST_F(ReorderTest, ReorderingIsIdempotent) {
    const std::string source =
        "func helper():\n\tpass\n\n\nvar b = 2\nsignal changed\nenum State { IDLE, RUN }\n";
    const std::string once = reorder(source);
    EXPECT_EQ(reorder(once), once);
}

TEST_F(ReorderTest, ClassifiesDeclarations) {
    std::vector<Declaration> decls = extract(
        "class_name Player\n"
        "extends CharacterBody2D\n"
        "signal hit\n"
        "enum State { IDLE }\n"
        "const SPEED = 10\n"
        "static var count = 0\n"
        "@export var health = 3\n"
        "var velocity_scale = 1.0\n"
        "@onready var sprite = $Sprite\n"
        "static func _static_init():\n\tpass\n"
        "static func create():\n\tpass\n"
        "func _ready():\n\tpass\n"
        "func jump():\n\tpass\n"
        "class Hitbox:\n\tvar size = 1\n");
    std::vector<DeclKind> expected = {
        DeclKind::CLASS_NAME, DeclKind::EXTENDS, DeclKind::SIGNAL, DeclKind::ENUM, DeclKind::CONSTANT,
        DeclKind::STATIC_VARIABLE, DeclKind::EXPORT_VARIABLE, DeclKind::REGULAR_VARIABLE,
        DeclKind::ONREADY_VARIABLE, DeclKind::STATIC_INIT, DeclKind::STATIC_FUNCTION,
        DeclKind::BUILTIN_VIRTUAL, DeclKind::METHOD, DeclKind::INNER_CLASS,
    };
    ASSERT_EQ(decls.size(), expected.size());
    for (size_t i = 0; i < decls.size(); i++) {
        EXPECT_EQ(decls[i].kind, expected[i])
            << "declaration " << i << " is " << decl_kind_name(decls[i].kind);
    }
    EXPECT_EQ(decls[0].name, "Player");
    EXPECT_EQ(decls[12].name, "jump");
}

TEST_F(ReorderTest, AnnotationOnOwnLineClassifiesVariable) {
    std::vector<Declaration> decls = extract("@export\nvar speed = 1\n@onready\nvar label = $Label\n");
    ASSERT_EQ(decls.size(), 2u);
    EXPECT_EQ(decls[0].kind, DeclKind::EXPORT_VARIABLE);
    EXPECT_EQ(decls[1].kind, DeclKind::ONREADY_VARIABLE);
}

TEST_F(ReorderTest, ClassNameWithExtendsIsSplit) {
    std::vector<Declaration> decls = extract("class_name Player extends Node\n");
    ASSERT_EQ(decls.size(), 2u);
    EXPECT_EQ(decls[0].kind, DeclKind::CLASS_NAME);
    EXPECT_EQ(decls[0].text, "class_name Player");
    EXPECT_EQ(decls[1].kind, DeclKind::EXTENDS);
    EXPECT_EQ(decls[1].text, "extends Node");
}

TEST_F(ReorderTest, PublicBeforePrivateThenByName) {
    std::vector<Declaration> decls = extract(
        "func _helper():\n\tpass\nfunc zeta():\n\tpass\nfunc alpha():\n\tpass\n");
    sort_declarations(decls);
    ASSERT_EQ(decls.size(), 3u);
    EXPECT_EQ(decls[0].name, "alpha");
    EXPECT_EQ(decls[1].name, "zeta");
    EXPECT_EQ(decls[2].name, "_helper");
    EXPECT_TRUE(decls[2].is_private);
}

TEST_F(ReorderTest, BuiltinVirtualMethodsInCallbackOrder) {
    EXPECT_EQ(builtin_virtual_rank("_init"), 1);
    EXPECT_EQ(builtin_virtual_rank("_ready"), 3);
    EXPECT_LT(builtin_virtual_rank("_ready"), builtin_virtual_rank("_process"));
    EXPECT_EQ(builtin_virtual_rank("_to_string"), 19);
    EXPECT_EQ(builtin_virtual_rank("ready"), 0);

    std::vector<Declaration> decls = extract(
        "func _input(event):\n\tpass\nfunc _ready():\n\tpass\nfunc _init():\n\tpass\n");
    sort_declarations(decls);
    ASSERT_EQ(decls.size(), 3u);
    EXPECT_EQ(decls[0].name, "_init");
    EXPECT_EQ(decls[1].name, "_ready");
    EXPECT_EQ(decls[2].name, "_input");
}

TEST_F(ReorderTest, CommentsMoveWithDeclaration) {
    EXPECT_EQ(reorder("var b = 2\n# the first one\nvar a = 1\n"),
              "# the first one\nvar a = 1\nvar b = 2\n");
}

TEST_F(ReorderTest, InlineCommentStaysOnItsLine) {
    EXPECT_EQ(reorder("var b = 2  # bee\nvar a = 1\n"),
              "var a = 1\nvar b = 2  # bee\n");
}

TEST_F(ReorderTest, DocstringNeedsBlankLine) {
    std::vector<Declaration> with_blank = extract("extends Node\n## A player.\n\nvar a = 1\n");
    ASSERT_EQ(with_blank.size(), 3u);
    EXPECT_EQ(with_blank[1].kind, DeclKind::DOCSTRING);
    EXPECT_EQ(with_blank[1].text, "## A player.");
    EXPECT_TRUE(with_blank[2].leading.empty());

    std::vector<Declaration> attached = extract("extends Node\n## Speed in px/s.\nvar a = 1\n");
    ASSERT_EQ(attached.size(), 2u);
    ASSERT_EQ(attached[1].leading.size(), 1u);
    EXPECT_EQ(attached[1].leading[0], "## Speed in px/s.");
}

TEST_F(ReorderTest, ClassAnnotationsSortToolFirst) {
    std::vector<Declaration> decls;
    decls.push_back(make(DeclKind::CLASS_ANNOTATION, "", 0));
    decls.back().text = "@icon(\"res://icon.svg\")";
    decls.push_back(make(DeclKind::CLASS_ANNOTATION, "", 1));
    decls.back().text = "@tool";
    sort_declarations(decls);
    EXPECT_EQ(decls[0].text, "@tool");
    EXPECT_EQ(decls[1].text, "@icon(\"res://icon.svg\")");
}

TEST_F(ReorderTest, UnknownStatementsKeepOrderAtEnd) {
    std::vector<Declaration> decls;
    decls.push_back(make(DeclKind::UNKNOWN, "z", 0));
    decls.push_back(make(DeclKind::METHOD, "b", 1));
    decls.push_back(make(DeclKind::UNKNOWN, "a", 2));
    decls.push_back(make(DeclKind::SIGNAL, "s", 3));
    sort_declarations(decls);
    ASSERT_EQ(decls.size(), 4u);
    EXPECT_EQ(decls[0].name, "s");
    EXPECT_EQ(decls[1].name, "b");
    EXPECT_EQ(decls[2].name, "z");
    EXPECT_EQ(decls[3].name, "a");
}

TEST_F(ReorderTest, SyntaxErrorsAreRejected) {
    std::string output, error;
    EXPECT_FALSE(reorder_gdscript("func broken(:\n\tpass\n", &output, &error));
    EXPECT_EQ(error, "source has syntax errors");
}

TEST_F(ReorderTest, EmptySourceIsUnchanged) {
    EXPECT_EQ(reorder(""), "");
}

TEST_F(ReorderTest, RebuildSeparatesGroups) {
    std::vector<Declaration> decls;
    decls.push_back(make(DeclKind::SIGNAL, "a", 0));
    decls.back().text = "signal a";
    decls.push_back(make(DeclKind::SIGNAL, "b", 1));
    decls.back().text = "signal b";
    decls.push_back(make(DeclKind::CONSTANT, "C", 2));
    decls.back().text = "const C = 1";
    decls.push_back(make(DeclKind::METHOD, "f", 3));
    decls.back().text = "func f():\n\tpass";
    decls.back().leading.push_back("# does f");
    EXPECT_EQ(build_reordered_source(decls),
              "signal a\nsignal b\n\nconst C = 1\n\n\n# does f\nfunc f():\n\tpass\n");
}
