// main.cpp - gdfmt command line tool

#include "batch.hpp"
#include "config.hpp"
#include "formatter.hpp"
#include "linter.hpp"
#include "../lib/log.h"
#include "../lib/str.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

#define GDFMT_VERSION "0.1.0"

using namespace gdfmt;

// exit codes
#define EXIT_OK 0
#define EXIT_FAILURE_RESULT 1   // check found changes, formatting or lint issues
#define EXIT_USAGE 2            // bad arguments or configuration

static void print_help(const char* prog) {
    printf("gdfmt %s - GDScript formatter\n\n", GDFMT_VERSION);
    printf("Usage: %s [options] [files...]\n", prog);
    printf("       %s lint [options] files...\n\n", prog);
    printf("Without files, reads GDScript from stdin and writes the result to stdout.\n\n");
    printf("Options:\n");
    printf("  --use-spaces          Indent with spaces instead of tabs\n");
    printf("  --indent-size N       Spaces per indentation level (default: 4)\n");
    printf("  --reorder-code        Reorder declarations following the GDScript style guide\n");
    printf("  --safe                Fail if formatting changed the code structure\n");
    printf("  --check               Exit with 1 if any file is not formatted, write nothing\n");
    printf("  --stdout              Print formatted files instead of writing them in place\n");
    printf("  -o, --output FILE     Write the result to FILE (single input only)\n");
    printf("  --query FILE          Topiary query file (default: %s)\n", GDFMT_DEFAULT_QUERY_PATH);
    printf("  --topiary PATH        Topiary executable (default: topiary)\n");
    printf("  --grammar PATH        GDScript grammar library for Topiary (default: %s)\n",
        GDFMT_DEFAULT_GRAMMAR_PATH);
    printf("  -j, --jobs N          Worker threads (default: one per processor)\n");
    printf("  --config FILE         Read settings from FILE (default: ./%s if present)\n", GDFMT_CONFIG_FILE);
    printf("  -h, --help            Show this help\n");
    printf("  --version             Show the version\n");
    printf("\nLint options:\n");
    printf("  --max-line-length N   Maximum line length (default: 100)\n");
    printf("  --disable RULES       Comma separated rules to disable\n");
    printf("\n--reorder-code and --safe cannot be used together.\n");
}

static bool read_all(FILE* f, std::string* content) {
    char buffer[8192];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) content->append(buffer, n);
    return ferror(f) == 0;
}

static bool write_file(const std::string& path, const std::string& content, std::string* error) {
    FILE* f = fopen(path.c_str(), "wb");
    if (!f) {
        *error = "Failed to write to file " + path + ": " + strerror(errno);
        return false;
    }
    bool ok = fwrite(content.data(), 1, content.size(), f) == content.size();
    if (fclose(f) != 0) ok = false;
    if (!ok) *error = "Failed to write to file " + path;
    return ok;
}

struct CliOptions {
    std::vector<std::string> files;
    std::string output_path;
    std::string config_path;
    bool check = false;
    bool to_stdout = false;
    bool lint = false;
};

// Value of an option taking an argument, or null (after reporting) if missing
static const char* option_value(int argc, char* argv[], int* i) {
    if (*i + 1 >= argc) {
        fprintf(stderr, "Error: option '%s' requires a value\n", argv[*i]);
        return nullptr;
    }
    return argv[++*i];
}

// First pass: only --config, so that flags override the file
static bool find_config_path(int argc, char* argv[], std::string* path) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0) {
            const char* value = option_value(argc, argv, &i);
            if (!value) return false;
            *path = value;
        }
    }
    return true;
}

static bool parse_arguments(int argc, char* argv[], int first, CliOptions* cli, GdfmtConfig* config) {
    for (int i = first; i < argc; i++) {
        const char* arg = argv[i];
        const char* value = nullptr;
        if (strcmp(arg, "--use-spaces") == 0) {
            config->format.use_spaces = true;
        } else if (strcmp(arg, "--indent-size") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            if (!parse_int_value(value, 1, 16, &config->format.indent_size)) {
                fprintf(stderr, "Error: invalid indent size '%s'\n", value);
                return false;
            }
        } else if (strcmp(arg, "--reorder-code") == 0) {
            config->format.reorder_code = true;
        } else if (strcmp(arg, "--safe") == 0) {
            config->format.safe = true;
        } else if (strcmp(arg, "--check") == 0 || strcmp(arg, "-c") == 0) {
            cli->check = true;
        } else if (strcmp(arg, "--stdout") == 0) {
            cli->to_stdout = true;
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            cli->output_path = value;
        } else if (strcmp(arg, "--query") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            config->format.query_path = value;
        } else if (strcmp(arg, "--topiary") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            config->format.topiary_command = value;
        } else if (strcmp(arg, "--grammar") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            config->format.grammar_path = value;
        } else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--jobs") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            if (!parse_int_value(value, 0, 1024, &config->jobs)) {
                fprintf(stderr, "Error: invalid job count '%s'\n", value);
                return false;
            }
        } else if (strcmp(arg, "--config") == 0) {
            i++;   // handled before
        } else if (strcmp(arg, "--max-line-length") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            if (!parse_int_value(value, 1, 100000, &config->lint.max_line_length)) {
                fprintf(stderr, "Error: invalid maximum line length '%s'\n", value);
                return false;
            }
        } else if (strcmp(arg, "--disable") == 0) {
            if (!(value = option_value(argc, argv, &i))) return false;
            std::set<std::string> rules = parse_rule_list(value);
            config->lint.disabled_rules.insert(rules.begin(), rules.end());
        } else if (strcmp(arg, "-") == 0 || arg[0] != '-') {
            cli->files.push_back(arg);
        } else {
            fprintf(stderr, "Error: Unknown option '%s'\n", arg);
            return false;
        }
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

static bool is_gdscript_path(const std::string& path) {
    return str_ends_with_lit(path.c_str(), path.size(), ".gd");
}

static int exec_lint(const CliOptions& cli, const GdfmtConfig& config) {
    std::vector<std::string> paths;
    for (const std::string& path : cli.files) {
        if (is_gdscript_path(path)) paths.push_back(path);
        else log_info("lint: skipping %s, not a .gd file", path.c_str());
    }
    if (paths.empty()) {
        fprintf(stderr, "Error: No GDScript files found in the arguments provided. Please provide at least one .gd file.\n");
        return EXIT_USAGE;
    }
    Linter linter(config.lint);
    bool has_issues = false;
    bool failed = false;
    for (const std::string& path : paths) {
        std::string source, error;
        if (!read_source_file(path, &source, &error)) {
            fprintf(stderr, "Error: %s\n", error.c_str());
            failed = true;
            continue;
        }
        std::vector<LintIssue> issues;
        if (!linter.lint(source, &issues, &error)) {
            fprintf(stderr, "Error: %s: %s\n", path.c_str(), error.c_str());
            failed = true;
            continue;
        }
        for (const LintIssue& issue : issues) {
            printf("%s\n", format_issue(path, issue).c_str());
            has_issues = true;
        }
    }
    return (has_issues || failed) ? EXIT_FAILURE_RESULT : EXIT_OK;
}

static int exec_format(const CliOptions& cli, const GdfmtConfig& config) {
    bool from_stdin = cli.files.empty() || (cli.files.size() == 1 && cli.files[0] == "-");
    if (!cli.output_path.empty() && cli.files.size() > 1) {
        fprintf(stderr, "Error: --output can only be used with a single input\n");
        return EXIT_USAGE;
    }

    int status = EXIT_OK;
    std::vector<FormatJob> jobs;
    if (from_stdin) {
        FormatJob job;
        job.name = "<stdin>";
        if (!read_all(stdin, &job.source)) {
            fprintf(stderr, "Error: Failed to read from stdin\n");
            return EXIT_FAILURE_RESULT;
        }
        jobs.push_back(std::move(job));
    } else {
        // unreadable files are reported and skipped, the rest are formatted
        std::vector<std::string> read_errors;
        jobs = load_format_jobs(cli.files, &read_errors);
        for (const std::string& error : read_errors) fprintf(stderr, "Error: %s\n", error.c_str());
        if (!read_errors.empty()) status = EXIT_FAILURE_RESULT;
    }

    const FormatterConfig& format_config = config.format;
    PrinterFactory factory = [&format_config]() -> std::unique_ptr<PrettyPrinter> {
        return std::make_unique<TopiaryPrinter>(format_config.topiary_command,
            format_config.grammar_path);
    };
    std::vector<FormatResult> results = format_files(jobs, format_config, factory, config.jobs);

    for (size_t i = 0; i < jobs.size(); i++) {
        const FormatJob& job = jobs[i];
        const FormatResult& result = results[i];
        if (!result.error.ok()) {
            fprintf(stderr, "Error: %s: %s\n", job.name.c_str(), format_error_describe(result.error).c_str());
            status = EXIT_FAILURE_RESULT;
            continue;
        }
        if (cli.check) {
            if (result.changed) {
                fprintf(stderr, "%s: not formatted\n", job.name.c_str());
                status = EXIT_FAILURE_RESULT;
            }
            continue;
        }
        std::string error;
        if (!cli.output_path.empty()) {
            if (!write_file(cli.output_path, result.output, &error)) {
                fprintf(stderr, "Error: %s\n", error.c_str());
                status = EXIT_FAILURE_RESULT;
            }
        } else if (from_stdin || cli.to_stdout) {
            fwrite(result.output.data(), 1, result.output.size(), stdout);
        } else if (result.changed) {
            if (!write_file(job.name, result.output, &error)) {
                fprintf(stderr, "Error: %s\n", error.c_str());
                status = EXIT_FAILURE_RESULT;
            } else {
                log_info("formatted %s", job.name.c_str());
            }
        }
    }
    if (cli.check && status == EXIT_OK) {
        fprintf(stderr, cli.files.size() <= 1 ? "File is formatted\n" : "All files are formatted\n");
    }
    fflush(stdout);
    return status;
}

int main(int argc, char* argv[]) {
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");
    log_debug("main() started with %d arguments", argc);

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_help(argv[0]);
            log_fini();
            return EXIT_OK;
        }
        if (strcmp(argv[i], "--version") == 0) {
            printf("gdfmt %s\n", GDFMT_VERSION);
            log_fini();
            return EXIT_OK;
        }
    }

    GdfmtConfig config;
    CliOptions cli;
    std::string error;
    if (!find_config_path(argc, argv, &cli.config_path)) {
        log_fini();
        return EXIT_USAGE;
    }
    if (cli.config_path.empty() && access(GDFMT_CONFIG_FILE, F_OK) == 0) cli.config_path = GDFMT_CONFIG_FILE;
    if (!cli.config_path.empty() && !load_config_file(cli.config_path, &config, &error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        log_fini();
        return EXIT_USAGE;
    }

    int first = 1;
    if (argc >= 2 && strcmp(argv[1], "lint") == 0) {
        cli.lint = true;
        first = 2;
    }
    if (!parse_arguments(argc, argv, first, &cli, &config)) {
        log_fini();
        return EXIT_USAGE;
    }
    if (!validate_config(config, &error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        log_fini();
        return EXIT_USAGE;
    }

    int status = cli.lint ? exec_lint(cli, config) : exec_format(cli, config);
    log_debug("exiting with status %d", status);
    log_fini();
    return status;
}
