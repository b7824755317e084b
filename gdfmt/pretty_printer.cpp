// pretty_printer.cpp - Topiary command line adapter

#include "pretty_printer.hpp"
#include "../lib/log.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace gdfmt {

std::string IndentPolicy::unit() const {
    if (!use_spaces) return "\t";
    return std::string(size > 0 ? (size_t)size : 4, ' ');
}

std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string nickel_quote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '%':  out += "\\%"; break;
        default:   out += c;
        }
    }
    out += "\"";
    return out;
}

static bool write_file(const std::string& path, const std::string& content) {
    FILE* f = fopen(path.c_str(), "wb");
    if (!f) return false;
    size_t written = fwrite(content.data(), 1, content.size(), f);
    bool ok = written == content.size();
    if (fclose(f) != 0) ok = false;
    return ok;
}

static std::string read_file(const std::string& path) {
    std::string content;
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) return content;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) content.append(buffer, n);
    fclose(f);
    return content;
}

namespace {

// Private temporary directory removed with its files on scope exit
class TempDir {
public:
    TempDir() {
        const char* base = getenv("TMPDIR");
        std::string pattern = std::string(base && *base ? base : "/tmp") + "/gdfmt-XXXXXX";
        std::vector<char> buf(pattern.begin(), pattern.end());
        buf.push_back('\0');
        if (mkdtemp(buf.data())) path_ = buf.data();
    }
    ~TempDir() {
        for (const std::string& file : files_) unlink(file.c_str());
        if (!path_.empty()) rmdir(path_.c_str());
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    bool ok() const { return !path_.empty(); }

    std::string file(const char* name) {
        files_.push_back(path_ + "/" + name);
        return files_.back();
    }

private:
    std::string path_;
    std::vector<std::string> files_;
};

} // namespace

TopiaryPrinter::TopiaryPrinter(std::string command, std::string grammar_path)
    : command_(std::move(command)), grammar_path_(std::move(grammar_path)) {}

std::string TopiaryPrinter::language_config(const IndentPolicy& indent, const std::string& grammar_path) {
    return "{\n"
           "  languages = {\n"
           "    gdscript = {\n"
           "      extensions = [\"gd\"],\n"
           "      indent = " + nickel_quote(indent.unit()) + ",\n"
           "      grammar.source.path = " + nickel_quote(grammar_path) + ",\n"
           "    },\n"
           "  },\n"
           "}\n";
}

bool TopiaryPrinter::format(const Document& doc, const std::string& ruleset, const IndentPolicy& indent,
                            std::string* output, std::string* error) {
    TempDir dir;
    if (!dir.ok()) {
        *error = std::string("cannot create temporary directory: ") + strerror(errno);
        return false;
    }
    std::string input_path = dir.file("input.gd");
    std::string config_path = dir.file("languages.ncl");
    std::string stderr_path = dir.file("stderr.txt");
    if (!write_file(input_path, doc.text()) || !write_file(config_path, language_config(indent, grammar_path_))) {
        *error = std::string("cannot write temporary files: ") + strerror(errno);
        return false;
    }

    std::string cmd = shell_quote(command_) +
        " --configuration " + shell_quote(config_path) +
        " format --language gdscript --query " + shell_quote(ruleset) +
        " --skip-idempotence --tolerate-parsing-errors" +
        " < " + shell_quote(input_path) +
        " 2> " + shell_quote(stderr_path);
    log_debug("topiary: executing %s", cmd.c_str());

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        *error = "failed to execute " + command_ + ": " + strerror(errno);
        return false;
    }
    std::string result;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) result.append(buffer, n);

    int status = pclose(pipe);
    if (status == -1) {
        *error = std::string("pclose failed: ") + strerror(errno);
        return false;
    }
    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (exit_code != 0) {
        std::string message = read_file(stderr_path);
        while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) message.pop_back();
        *error = "Topiary formatting failed (exit code " + std::to_string(exit_code) + ")";
        if (!message.empty()) *error += ": " + message;
        return false;
    }
    log_debug("topiary: formatted %zu bytes into %zu bytes", doc.text().size(), result.size());
    *output = std::move(result);
    return true;
}

} // namespace gdfmt
