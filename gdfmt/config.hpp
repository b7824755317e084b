// config.hpp - gdfmt.conf loading and validation
//
// A config file holds `key = value` lines; `#` starts a comment line.
//
//   indent_size = 4
//   use_spaces = false
//   reorder_code = false
//   safe = false
//   query = /usr/share/gdfmt/gdscript.scm
//   topiary = topiary
//   grammar = /usr/lib/libtree-sitter-gdscript.so
//   jobs = 0
//   max_line_length = 100
//   disabled_rules = max-line-length, unnecessary-pass
//
// Command line flags override values read from the file.

#pragma once

#include "formatter.hpp"
#include "linter.hpp"

#include <string>

namespace gdfmt {

#define GDFMT_CONFIG_FILE "gdfmt.conf"

struct GdfmtConfig {
    FormatterConfig format;
    LinterConfig lint;
    int jobs = 0;   // worker threads, 0 for one per processor
};

/**
 * Apply the settings of a config text on top of config.
 * @param origin file name used in error messages
 * @return false on the first unknown key or invalid value
 */
bool parse_config_string(const std::string& text, const std::string& origin, GdfmtConfig* config,
                         std::string* error);

// Read and apply a config file; a missing file is an error.
bool load_config_file(const std::string& path, GdfmtConfig* config, std::string* error);

// Parse a boolean setting: true/false, on/off, yes/no, 1/0.
bool parse_bool_value(const std::string& text, bool* value);

// Parse an integer within [min_value, max_value].
bool parse_int_value(const std::string& text, int min_value, int max_value, int* value);

// Checks that span several settings: known rule names, safe vs reorder.
bool validate_config(const GdfmtConfig& config, std::string* error);

} // namespace gdfmt
