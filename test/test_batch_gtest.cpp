#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <unistd.h>
#include <vector>

#include "../gdfmt/batch.hpp"
#include "gdfmt_test_helpers.hpp"

using namespace gdfmt;

// Fails on sources mentioning "broken", formats everything else unchanged
class SelectivePrinter : public gdfmt::PrettyPrinter {
public:
    const char* name() const override { return "selective"; }

    bool format(const Document& doc, const std::string& ruleset, const IndentPolicy& indent,
                std::string* output, std::string* error) override {
        (void)ruleset; (void)indent;
        if (doc.text().find("broken") != std::string::npos) {
            *error = "cannot format";
            return false;
        }
        *output = doc.text();
        return true;
    }
};

class BatchTest : public ::testing::Test {
protected:
    FormatterConfig config;

    static std::vector<FormatJob> make_jobs(size_t count) {
        std::vector<FormatJob> jobs;
        for (size_t i = 0; i < count; i++) {
            std::string var = "var v" + std::to_string(i) + " = " + std::to_string(i) + "\n";
            // every third job needs spacing, the rest are already formatted
            std::string source = (i % 3 == 0) ? var + "func f():\n\tpass\n" : var;
            jobs.push_back(FormatJob{"file" + std::to_string(i) + ".gd", source});
        }
        return jobs;
    }
};

TEST_F(BatchTest, ResultsFollowInputOrder) {
    std::vector<FormatJob> jobs = make_jobs(40);
    std::atomic<int> printers{0};
    PrinterFactory factory = [&printers]() -> std::unique_ptr<PrettyPrinter> {
        printers++;
        return std::make_unique<IdentityPrinter>();
    };

    std::vector<FormatResult> results = format_files(jobs, config, factory, 4);
    ASSERT_EQ(results.size(), jobs.size());
    EXPECT_EQ(printers.load(), 40) << "each job gets its own printer";

    for (size_t i = 0; i < jobs.size(); i++) {
        ASSERT_TRUE(results[i].error.ok()) << jobs[i].name << ": " << format_error_describe(results[i].error);
        std::string var = "var v" + std::to_string(i) + " = " + std::to_string(i) + "\n";
        if (i % 3 == 0) {
            EXPECT_EQ(results[i].output, var + "\n\nfunc f():\n\tpass\n") << jobs[i].name;
            EXPECT_TRUE(results[i].changed);
        } else {
            EXPECT_EQ(results[i].output, var) << jobs[i].name;
            EXPECT_FALSE(results[i].changed);
        }
    }
}

TEST_F(BatchTest, SameResultsWithOneOrManyThreads) {
    std::vector<FormatJob> jobs = make_jobs(12);
    PrinterFactory factory = []() -> std::unique_ptr<PrettyPrinter> { return std::make_unique<IdentityPrinter>(); };

    std::vector<FormatResult> serial = format_files(jobs, config, factory, 1);
    std::vector<FormatResult> parallel = format_files(jobs, config, factory, 0);
    ASSERT_EQ(serial.size(), parallel.size());
    for (size_t i = 0; i < serial.size(); i++) {
        EXPECT_EQ(serial[i].output, parallel[i].output) << jobs[i].name;
    }
}

TEST_F(BatchTest, FailuresStayWithTheirJob) {
    std::vector<FormatJob> jobs = {
        {"a.gd", "var a = 1\n"},
        {"b.gd", "var broken = 1\n"},
        {"c.gd", "var c = 1\n"},
    };
    PrinterFactory factory = []() -> std::unique_ptr<PrettyPrinter> { return std::make_unique<SelectivePrinter>(); };

    std::vector<FormatResult> results = format_files(jobs, config, factory, 3);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].error.ok());
    EXPECT_EQ(results[1].error.code, FORMAT_ERR_ENGINE);
    EXPECT_EQ(results[1].error.message, "cannot format");
    EXPECT_FALSE(results[1].changed);
    EXPECT_TRUE(results[2].error.ok());
}

TEST_F(BatchTest, MissingPrinterIsAnEngineError) {
    std::vector<FormatJob> jobs = {{"a.gd", "var a = 1\n"}};
    PrinterFactory factory = []() -> std::unique_ptr<PrettyPrinter> { return nullptr; };
    std::vector<FormatResult> results = format_files(jobs, config, factory, 2);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].error.code, FORMAT_ERR_ENGINE);
}

TEST_F(BatchTest, NoJobs) {
    PrinterFactory factory = []() -> std::unique_ptr<PrettyPrinter> { return std::make_unique<IdentityPrinter>(); };
    EXPECT_TRUE(format_files({}, config, factory, 4).empty());
}

TEST_F(BatchTest, DefaultThreadCountIsPositive) {
    EXPECT_GE(default_thread_count(), 1);
}

static std::string write_temp_source(const std::string& text) {
    char path[] = "/tmp/gdfmt_batch_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) return "";
    ssize_t written = write(fd, text.data(), text.size());
    close(fd);
    return written == (ssize_t)text.size() ? std::string(path) : "";
}

TEST_F(BatchTest, UnreadableFileIsSkippedOthersLoad) {
    std::string first = write_temp_source("var a = 1\n");
    std::string last = write_temp_source("var c = 1\n");
    ASSERT_FALSE(first.empty());
    ASSERT_FALSE(last.empty());
    const std::string missing = "/tmp/gdfmt_batch_does_not_exist.gd";

    std::vector<std::string> errors;
    std::vector<FormatJob> jobs = load_format_jobs({first, missing, last}, &errors);
    unlink(first.c_str());
    unlink(last.c_str());

    ASSERT_EQ(jobs.size(), 2u) << "a missing file must not stop the others";
    EXPECT_EQ(jobs[0].name, first);
    EXPECT_EQ(jobs[0].source, "var a = 1\n");
    EXPECT_EQ(jobs[1].name, last);
    EXPECT_EQ(jobs[1].source, "var c = 1\n");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rfind("Failed to read file " + missing + ": ", 0), 0u) << errors[0];

    PrinterFactory factory = []() -> std::unique_ptr<PrettyPrinter> { return std::make_unique<IdentityPrinter>(); };
    std::vector<FormatResult> results = format_files(jobs, config, factory, 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].error.ok());
    EXPECT_TRUE(results[1].error.ok());
}
