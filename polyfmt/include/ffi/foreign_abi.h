/*
 * Foreign formatter ABI: the C interface of natively compiled backend libraries.
 *
 * A backend library exports one format entry point and one batch entry point
 * per language, plus the two release functions:
 *
 *   char*  FormatShell(const char* src, size_t len, unsigned indent);
 *   char** FormatShellBatch(const char* const* srcs, const size_t* lens,
 *                           size_t count, unsigned indent);
 *   void   FreeString(char* s);
 *   void   FreeStringArray(char** arr, size_t count);
 *
 * Input is passed as pointer plus explicit length and may contain NUL bytes.
 * Results are NUL-terminated and allocated by the library; the host copies
 * them and hands every pointer back to the matching release function.
 * When the library cannot parse its input it returns a copy of the input.
 *
 * `indent` is 0 for tabs, otherwise the number of spaces per level.
 * Fixed-style languages ignore it.
 */

#ifndef POLYFMT_FOREIGN_ABI_H
#define POLYFMT_FOREIGN_ABI_H

#include <stddef.h>

/* ===== Export macro ===== */

#define POLYFMT_API __attribute__((visibility("default")))

/* ===== Entry point names ===== */

#define POLYFMT_FREE_STRING_SYMBOL "FreeString"
#define POLYFMT_FREE_STRING_ARRAY_SYMBOL "FreeStringArray"

/* Optional: returns non-zero when every entry point is reentrant. */
#define POLYFMT_REENTRANT_SYMBOL "polyfmt_backend_reentrant"

/* ===== Function pointer typedefs for dynamic loading ===== */

typedef char* (*PolyfmtFormatFn)(const char* src, size_t len, unsigned indent);
typedef char** (*PolyfmtFormatBatchFn)(const char* const* srcs, const size_t* lens, size_t count,
                                       unsigned indent);
typedef void (*PolyfmtFreeStringFn)(char* s);
typedef void (*PolyfmtFreeStringArrayFn)(char** arr, size_t count);
typedef int (*PolyfmtReentrantFn)(void);

#endif /* POLYFMT_FOREIGN_ABI_H */
