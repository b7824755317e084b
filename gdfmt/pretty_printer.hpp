// pretty_printer.hpp - boundary to the external structural pretty-printer
//
// The formatting pipeline hands the current document to a PrettyPrinter and
// continues with whatever text it returns. The production printer runs the
// Topiary command line with the GDScript ruleset; tests plug in their own.

#pragma once

#include "syntax_tree.hpp"

// Shared library of the GDScript grammar, loaded by Topiary
#ifndef GDFMT_DEFAULT_GRAMMAR_PATH
#define GDFMT_DEFAULT_GRAMMAR_PATH "libtree-sitter-gdscript.so"
#endif

#include <string>

namespace gdfmt {

struct IndentPolicy {
    bool use_spaces = false;
    int size = 4;

    // "\t", or `size` spaces
    std::string unit() const;
};

class PrettyPrinter {
public:
    virtual ~PrettyPrinter() = default;

    virtual const char* name() const = 0;

    /**
     * Format the document with the given ruleset.
     * @param output formatted text on success
     * @param error human readable message on failure
     * @return false if the engine rejected or failed on the input
     */
    virtual bool format(const Document& doc, const std::string& ruleset, const IndentPolicy& indent,
                        std::string* output, std::string* error) = 0;
};

// Runs `topiary format` on a temporary copy of the source. gdscript is not
// one of Topiary's bundled languages, so the grammar is given as a path to
// the compiled tree-sitter-gdscript library.
class TopiaryPrinter : public PrettyPrinter {
public:
    explicit TopiaryPrinter(std::string command = "topiary",
                            std::string grammar_path = GDFMT_DEFAULT_GRAMMAR_PATH);

    const char* name() const override { return "topiary"; }

    bool format(const Document& doc, const std::string& ruleset, const IndentPolicy& indent,
                std::string* output, std::string* error) override;

    // Nickel language configuration passed to topiary
    static std::string language_config(const IndentPolicy& indent, const std::string& grammar_path);

private:
    std::string command_;
    std::string grammar_path_;
};

// Quote an argument for /bin/sh.
std::string shell_quote(const std::string& arg);

// Quote a Nickel string literal.
std::string nickel_quote(const std::string& text);

} // namespace gdfmt
