// batch.hpp - format many independent sources on worker threads
//
// Each job is formatted with its own Document and its own printer instance.
// Results are stored at the index of their job, so callers read them back
// in input order whatever order the workers finished in.

#pragma once

#include "formatter.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gdfmt {

struct FormatJob {
    std::string name;     // file path or "<stdin>", for messages
    std::string source;
};

struct FormatResult {
    FormatError error;
    std::string output;   // formatted text when error.ok()
    bool changed = false; // output differs from the source
};

typedef std::function<std::unique_ptr<PrettyPrinter>()> PrinterFactory;

// Read a whole file; error is "Failed to read file <path>: <reason>".
bool read_source_file(const std::string& path, std::string* content, std::string* error);

/**
 * Load a job per readable path, in input order.
 * @param errors one message per path that could not be read; those paths get no job
 */
std::vector<FormatJob> load_format_jobs(const std::vector<std::string>& paths, std::vector<std::string>* errors);

// Worker count used when thread_count <= 0: online processors, at least 1.
int default_thread_count();

/**
 * Format every job.
 * @param thread_count worker threads, capped at the number of jobs; <= 0 for the default
 * @return one result per job, at the same index
 */
std::vector<FormatResult> format_files(const std::vector<FormatJob>& jobs, const FormatterConfig& config,
                                       const PrinterFactory& printer_factory, int thread_count);

} // namespace gdfmt
