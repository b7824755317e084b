#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

#include "../gdfmt/config.hpp"

using namespace gdfmt;

class ConfigTest : public ::testing::Test {
protected:
    GdfmtConfig config;
    std::string error;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config.format.indent_size, 4);
    EXPECT_FALSE(config.format.use_spaces);
    EXPECT_FALSE(config.format.reorder_code);
    EXPECT_FALSE(config.format.safe);
    EXPECT_EQ(config.format.topiary_command, "topiary");
    EXPECT_EQ(config.lint.max_line_length, 100);
    EXPECT_TRUE(config.lint.disabled_rules.empty());
    EXPECT_EQ(config.jobs, 0);
}

TEST_F(ConfigTest, ParsesEverySetting) {
    const std::string text =
        "# project formatting\n"
        "indent_size = 2\n"
        "use_spaces = yes\n"
        "reorder_code=on\n"
        "\n"
        "query = tools/gdscript.scm\n"
        "topiary = /opt/topiary/bin/topiary\n"
        "grammar = /opt/grammars/libtree-sitter-gdscript.so\n"
        "jobs = 3\n"
        "max_line_length = 120\n"
        "disabled_rules = max-line-length, unnecessary-pass\n";
    ASSERT_TRUE(parse_config_string(text, "gdfmt.conf", &config, &error)) << error;
    EXPECT_EQ(config.format.indent_size, 2);
    EXPECT_TRUE(config.format.use_spaces);
    EXPECT_TRUE(config.format.reorder_code);
    EXPECT_EQ(config.format.query_path, "tools/gdscript.scm");
    EXPECT_EQ(config.format.topiary_command, "/opt/topiary/bin/topiary");
    EXPECT_EQ(config.format.grammar_path, "/opt/grammars/libtree-sitter-gdscript.so");
    EXPECT_EQ(config.jobs, 3);
    EXPECT_EQ(config.lint.max_line_length, 120);
    EXPECT_EQ(config.lint.disabled_rules, (std::set<std::string>{"max-line-length", "unnecessary-pass"}));
}

TEST_F(ConfigTest, UnknownKeyReportsLine) {
    EXPECT_FALSE(parse_config_string("use_spaces = true\nindent = 2\n", "gdfmt.conf", &config, &error));
    EXPECT_EQ(error, "gdfmt.conf:2: unknown setting 'indent'");
}

TEST_F(ConfigTest, MissingEqualsSign) {
    EXPECT_FALSE(parse_config_string("use_spaces\n", "my.conf", &config, &error));
    EXPECT_EQ(error, "my.conf:1: expected 'key = value'");
}

TEST_F(ConfigTest, InvalidValues) {
    EXPECT_FALSE(parse_config_string("indent_size = 0\n", "c", &config, &error));
    EXPECT_EQ(error, "c:1: invalid value '0' for 'indent_size'");
    EXPECT_FALSE(parse_config_string("indent_size = 4x\n", "c", &config, &error));
    EXPECT_FALSE(parse_config_string("safe = maybe\n", "c", &config, &error));
    EXPECT_FALSE(parse_config_string("jobs = -1\n", "c", &config, &error));
    EXPECT_FALSE(parse_config_string("query =\n", "c", &config, &error));
    EXPECT_FALSE(parse_config_string("grammar =\n", "c", &config, &error));
    EXPECT_EQ(error, "c:1: invalid value '' for 'grammar'");
}

TEST_F(ConfigTest, BoolValues) {
    bool value = false;
    EXPECT_TRUE(parse_bool_value("TRUE", &value));
    EXPECT_TRUE(value);
    EXPECT_TRUE(parse_bool_value("off", &value));
    EXPECT_FALSE(value);
    EXPECT_TRUE(parse_bool_value("1", &value));
    EXPECT_TRUE(value);
    EXPECT_FALSE(parse_bool_value("", &value));
    EXPECT_FALSE(parse_bool_value("2", &value));
}

TEST_F(ConfigTest, IntValues) {
    int value = 0;
    EXPECT_TRUE(parse_int_value("16", 1, 16, &value));
    EXPECT_EQ(value, 16);
    EXPECT_FALSE(parse_int_value("17", 1, 16, &value));
    EXPECT_EQ(value, 16) << "failed parse must not change the value";
    EXPECT_FALSE(parse_int_value("", 1, 16, &value));
    EXPECT_FALSE(parse_int_value("99999999999999999999", 1, 16, &value));
}

TEST_F(ConfigTest, SafeAndReorderConflict) {
    config.format.safe = true;
    config.format.reorder_code = true;
    EXPECT_FALSE(validate_config(config, &error));
    EXPECT_EQ(error, "safe mode and code reordering cannot be used together");
}

TEST_F(ConfigTest, UnknownDisabledRule) {
    config.lint.disabled_rules = {"function-name", "no-such-rule"};
    EXPECT_FALSE(validate_config(config, &error));
    EXPECT_EQ(error, "unknown lint rule 'no-such-rule'");

    config.lint.disabled_rules = {"function-name"};
    EXPECT_TRUE(validate_config(config, &error)) << error;
}

TEST_F(ConfigTest, LoadConfigFile) {
    char path[] = "/tmp/gdfmt_config_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    const std::string text = "indent_size = 8\nsafe = true\n";
    ASSERT_EQ(write(fd, text.data(), text.size()), (ssize_t)text.size());
    close(fd);

    EXPECT_TRUE(load_config_file(path, &config, &error)) << error;
    EXPECT_EQ(config.format.indent_size, 8);
    EXPECT_TRUE(config.format.safe);
    unlink(path);
}

TEST_F(ConfigTest, MissingFileIsAnError) {
    EXPECT_FALSE(load_config_file("/nonexistent/gdfmt.conf", &config, &error));
    EXPECT_EQ(error.rfind("cannot open /nonexistent/gdfmt.conf", 0), 0u) << error;
}
