// batch.cpp - format many independent sources on worker threads

#include "batch.hpp"
#include "../lib/log.h"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <pthread.h>
#include <unistd.h>

namespace gdfmt {

bool read_source_file(const std::string& path, std::string* content, std::string* error) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        *error = "Failed to read file " + path + ": " + strerror(errno);
        return false;
    }
    char buffer[8192];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), f)) > 0) content->append(buffer, n);
    bool ok = ferror(f) == 0;
    fclose(f);
    if (!ok) *error = "Failed to read file " + path;
    return ok;
}

std::vector<FormatJob> load_format_jobs(const std::vector<std::string>& paths, std::vector<std::string>* errors) {
    std::vector<FormatJob> jobs;
    for (const std::string& path : paths) {
        FormatJob job;
        job.name = path;
        std::string error;
        if (!read_source_file(path, &job.source, &error)) {
            clog_warn(log_get_category("batch"), "%s", error.c_str());
            errors->push_back(std::move(error));
            continue;
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

int default_thread_count() {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? (int)n : 1;
}

namespace {

// messages go to the "batch" log category
log_category_t* batch_log() {
    return log_get_category("batch");
}

struct BatchContext {
    const std::vector<FormatJob>* jobs;
    const FormatterConfig* config;
    const PrinterFactory* printer_factory;
    std::vector<FormatResult>* results;
    std::atomic<size_t> next_job;
};

void run_job(BatchContext* ctx, size_t index) {
    const FormatJob& job = (*ctx->jobs)[index];
    FormatResult& result = (*ctx->results)[index];

    std::unique_ptr<PrettyPrinter> printer = (*ctx->printer_factory)();
    if (!printer) {
        result.error = FormatError(FORMAT_ERR_ENGINE, "no pretty-printer available");
        return;
    }
    result.error = format_gdscript(job.source, *ctx->config, *printer, &result.output);
    result.changed = result.error.ok() && result.output != job.source;
    clog_debug(batch_log(), "%s done (%s)", job.name.c_str(), format_error_name(result.error.code));
}

void* worker_thread_func(void* arg) {
    BatchContext* ctx = (BatchContext*)arg;
    while (true) {
        size_t index = ctx->next_job.fetch_add(1);
        if (index >= ctx->jobs->size()) break;
        run_job(ctx, index);
    }
    return NULL;
}

} // namespace

std::vector<FormatResult> format_files(const std::vector<FormatJob>& jobs, const FormatterConfig& config,
                                       const PrinterFactory& printer_factory, int thread_count) {
    std::vector<FormatResult> results(jobs.size());
    if (jobs.empty()) return results;

    BatchContext ctx;
    ctx.jobs = &jobs;
    ctx.config = &config;
    ctx.printer_factory = &printer_factory;
    ctx.results = &results;
    ctx.next_job = 0;

    if (thread_count <= 0) thread_count = default_thread_count();
    if ((size_t)thread_count > jobs.size()) thread_count = (int)jobs.size();

    // a single job (or a single worker) runs on the calling thread
    if (thread_count == 1) {
        worker_thread_func(&ctx);
        return results;
    }

    std::vector<pthread_t> threads;
    threads.reserve(thread_count);
    for (int i = 0; i < thread_count; i++) {
        pthread_t thread;
        if (pthread_create(&thread, NULL, worker_thread_func, &ctx) != 0) {
            clog_error(batch_log(), "failed to create worker thread %d", i);
            break;
        }
        threads.push_back(thread);
    }
    clog_debug(batch_log(), "%zu job(s) on %zu worker(s)", jobs.size(), threads.size());

    // with no worker at all the calling thread does the work
    if (threads.empty()) worker_thread_func(&ctx);
    for (pthread_t thread : threads) pthread_join(thread, NULL);
    return results;
}

} // namespace gdfmt
