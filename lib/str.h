/**
 * str.h - length-bounded C string helpers.
 *
 * All functions use explicit (const char* s, size_t len) pairs.
 * NULL pointers are treated as empty strings (length 0) - never crash.
 *
 * Naming: str_ prefix, snake_case, mirrors the lib/ convention.
 * Return: bool for predicates, size_t for counts.
 */

#ifndef LIB_STR_H
#define LIB_STR_H

#include <stddef.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ──────────────────────────────────────────────────────────────────────
 *  1. Comparison
 * ────────────────────────────────────────────────────────────────────── */

/** compare with a NUL-terminated literal. */
bool str_eq_lit(const char* s, size_t len, const char* lit);

/** case-insensitive compare with a NUL-terminated literal. */
bool str_ieq_lit(const char* s, size_t len, const char* lit);

/* ──────────────────────────────────────────────────────────────────────
 *  2. Prefix / Suffix
 * ────────────────────────────────────────────────────────────────────── */

bool str_starts_with_lit(const char* s, size_t s_len, const char* prefix);
bool str_ends_with_lit(const char* s, size_t s_len, const char* suffix);

/* ──────────────────────────────────────────────────────────────────────
 *  3. Trim
 * ────────────────────────────────────────────────────────────────────── */

/** trim ASCII whitespace from both ends. mutates *s and *len in place.
 *  the underlying buffer is not modified - just pointer/length adjustment. */
void str_trim(const char** s, size_t* len);
void str_ltrim(const char** s, size_t* len);
void str_rtrim(const char** s, size_t* len);

/* ──────────────────────────────────────────────────────────────────────
 *  4. Numeric parsing
 * ────────────────────────────────────────────────────────────────────── */

/** parse decimal integer from [s, s+len). returns true on success.
 *  leading whitespace is skipped, optional sign. *end (if not NULL) receives the first unparsed byte.
 *  fails on overflow or when no digit is present. */
bool str_to_int64(const char* s, size_t len, int64_t* out, const char** end);

/* ──────────────────────────────────────────────────────────────────────
 *  5. UTF-8 utilities
 * ────────────────────────────────────────────────────────────────────── */

/** count UTF-8 codepoints in [s, s+len). invalid sequences count as 1. */
size_t str_utf8_count(const char* s, size_t len);

/** return byte length of the UTF-8 sequence starting with lead byte.
 *  returns 0 for invalid lead byte (continuation or 0xF8..0xFF). */
size_t str_utf8_char_len(unsigned char lead);

/** validate UTF-8 encoding. returns true if [s, s+len) is valid UTF-8.
 *  checks overlong encodings, surrogate range, and max codepoint. */
bool str_utf8_valid(const char* s, size_t len);

/* ──────────────────────────────────────────────────────────────────────
 *  6. Character classes (ASCII)
 * ────────────────────────────────────────────────────────────────────── */

bool str_is_space(char c);

#ifdef __cplusplus
}
#endif

#endif /* LIB_STR_H */
