/*
 * log.h - leveled, categorised logging for gdfmt.
 *
 * Messages go to the default category through log_debug() .. log_fatal(),
 * or to a named category ("batch", "reorder", ...) through clog_*().
 * A line is written as "[LEVEL] category: message\n"; the category part
 * is left out for the default category. All writes are serialised.
 *
 * log.conf, read at start-up when present, holds "key = value" lines:
 *   level = debug|info|notice|warn|error|fatal
 *   output = stdout|stderr|<path>
 *   timestamps = on|off
 *   colors = on|off
 *   category.<name> = <level>
 * '#' starts a comment.
 */
#ifndef LOG_H
#define LOG_H

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>

#ifdef __cplusplus
extern "C" {
#endif

#define LOG_OK                  0
#define LOG_LEVEL_TOO_LOW      -2   /* message filtered out */
#define LOG_WRONG_FORMAT       -3   /* bad config line or value */
#define LOG_WRITE_FAIL         -4
#define LOG_INIT_FAIL          -5
#define LOG_CATEGORY_NOT_FOUND -6

typedef enum {
    LOG_LEVEL_DEBUG = 20,
    LOG_LEVEL_INFO = 40,
    LOG_LEVEL_NOTICE = 60,
    LOG_LEVEL_WARN = 80,
    LOG_LEVEL_ERROR = 100,
    LOG_LEVEL_FATAL = 120
} log_level;

#define LOG_MAX_CATEGORIES 16

typedef struct log_category_s {
    char name[64];
    int level;          /* messages below this level are dropped */
    FILE *output;       /* NULL means stderr */
    int enabled;
} log_category_t;

/* set up the default category; config may be NULL or "" */
int log_init(const char *config);
void log_fini(void);

/* returns the named category, creating it on first use.
 * NULL once LOG_MAX_CATEGORIES are in use. */
log_category_t* log_get_category(const char *cname);

extern log_category_t *log_default_category;

int clog_fatal(log_category_t *category, const char *format, ...);
int clog_error(log_category_t *category, const char *format, ...);
int clog_warn(log_category_t *category, const char *format, ...);
int clog_notice(log_category_t *category, const char *format, ...);
int clog_info(log_category_t *category, const char *format, ...);
int clog_debug(log_category_t *category, const char *format, ...);

int log_fatal(const char *format, ...);
int log_error(const char *format, ...);
int log_warn(const char *format, ...);
int log_notice(const char *format, ...);
int log_info(const char *format, ...);
int log_debug(const char *format, ...);

int log_vwrite(log_category_t *category, int level, const char *format, va_list args);

int log_level_enabled(log_category_t *category, const int level);
void log_set_level(log_category_t *category, int level);
void log_set_output(log_category_t *category, FILE *output);

void log_enable_timestamps(int enable);
void log_enable_colors(int enable);

const char* log_level_to_string(int level);
/* case-insensitive; returns -1 for an unknown name */
int log_level_from_string(const char *name);

int log_parse_config_file(const char *filename);
int log_parse_config_string(const char *config);

#ifdef __cplusplus
}
#endif

#endif /* LOG_H */
