// config.cpp - gdfmt.conf loading and validation

#include "config.hpp"
#include "../lib/log.h"
#include "../lib/str.h"

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace gdfmt {

bool parse_bool_value(const std::string& text, bool* value) {
    const char* s = text.c_str();
    size_t len = text.size();
    if (str_ieq_lit(s, len, "true") || str_ieq_lit(s, len, "on") || str_ieq_lit(s, len, "yes") ||
        str_eq_lit(s, len, "1")) {
        *value = true;
        return true;
    }
    if (str_ieq_lit(s, len, "false") || str_ieq_lit(s, len, "off") || str_ieq_lit(s, len, "no") ||
        str_eq_lit(s, len, "0")) {
        *value = false;
        return true;
    }
    return false;
}

bool parse_int_value(const std::string& text, int min_value, int max_value, int* value) {
    int64_t parsed;
    const char* end = nullptr;
    if (!str_to_int64(text.data(), text.size(), &parsed, &end)) return false;
    if (end != text.data() + text.size()) return false;
    if (parsed < min_value || parsed > max_value) return false;
    *value = (int)parsed;
    return true;
}

static std::string trimmed(const char* s, size_t len) {
    str_trim(&s, &len);
    return std::string(s, len);
}

static bool apply_setting(const std::string& key, const std::string& value, GdfmtConfig* config,
                          std::string* error) {
    bool ok = true;
    if (key == "indent_size") {
        ok = parse_int_value(value, 1, 16, &config->format.indent_size);
    } else if (key == "use_spaces") {
        ok = parse_bool_value(value, &config->format.use_spaces);
    } else if (key == "reorder_code") {
        ok = parse_bool_value(value, &config->format.reorder_code);
    } else if (key == "safe") {
        ok = parse_bool_value(value, &config->format.safe);
    } else if (key == "query") {
        ok = !value.empty();
        if (ok) config->format.query_path = value;
    } else if (key == "topiary") {
        ok = !value.empty();
        if (ok) config->format.topiary_command = value;
    } else if (key == "grammar") {
        ok = !value.empty();
        if (ok) config->format.grammar_path = value;
    } else if (key == "jobs") {
        ok = parse_int_value(value, 0, 1024, &config->jobs);
    } else if (key == "max_line_length") {
        ok = parse_int_value(value, 1, 100000, &config->lint.max_line_length);
    } else if (key == "disabled_rules") {
        config->lint.disabled_rules = parse_rule_list(value);
    } else {
        *error = "unknown setting '" + key + "'";
        return false;
    }
    if (!ok) *error = "invalid value '" + value + "' for '" + key + "'";
    return ok;
}

bool parse_config_string(const std::string& text, const std::string& origin, GdfmtConfig* config,
                         std::string* error) {
    int line_number = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) end = text.size();
        line_number++;
        std::string line = trimmed(text.data() + pos, end - pos);
        pos = end + 1;

        if (line.empty() || line[0] == '#') continue;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            *error = origin + ":" + std::to_string(line_number) + ": expected 'key = value'";
            return false;
        }
        std::string key = trimmed(line.data(), eq);
        std::string value = trimmed(line.data() + eq + 1, line.size() - eq - 1);
        std::string message;
        if (!apply_setting(key, value, config, &message)) {
            *error = origin + ":" + std::to_string(line_number) + ": " + message;
            return false;
        }
        log_debug("config: %s = %s", key.c_str(), value.c_str());
    }
    return true;
}

bool load_config_file(const std::string& path, GdfmtConfig* config, std::string* error) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        *error = "cannot open " + path + ": " + strerror(errno);
        return false;
    }
    std::string text;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) text.append(buffer, n);
    bool read_error = ferror(f) != 0;
    fclose(f);
    if (read_error) {
        *error = "cannot read " + path;
        return false;
    }
    log_info("config: loading %s", path.c_str());
    return parse_config_string(text, path, config, error);
}

bool validate_config(const GdfmtConfig& config, std::string* error) {
    if (config.format.safe && config.format.reorder_code) {
        *error = "safe mode and code reordering cannot be used together";
        return false;
    }
    const std::vector<std::string>& known = builtin_rule_names();
    for (const std::string& rule : config.lint.disabled_rules) {
        bool found = false;
        for (const std::string& name : known) {
            if (name == rule) { found = true; break; }
        }
        if (!found) {
            *error = "unknown lint rule '" + rule + "'";
            return false;
        }
    }
    return true;
}

} // namespace gdfmt
