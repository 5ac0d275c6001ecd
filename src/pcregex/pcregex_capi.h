// pcregex - C Binding
// Copyright (c) 2026 greenteng.com
//
// Flat C interface over the Regexp class. Functions never throw; failures
// return NULL or -1 and leave a message for pcregex_error().

#ifndef PCREGEX_CAPI_H
#define PCREGEX_CAPI_H

#include "pcregex_platform.h"

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#ifdef PCREGEX_HAS_CAPI

typedef struct pcregex_t pcregex_t;

// ============================================================================
// Compiled Patterns
// ============================================================================

// Compile a pattern with PCRE2 compile options (0 for none).
// Returns NULL on error.
PCREGEX_API pcregex_t* pcregex_compile(const char* pattern, uint32_t options);

PCREGEX_API void pcregex_free(pcregex_t* re);

// 1 if the pattern matches anywhere in subject, 0 if not, -1 on error
PCREGEX_API int pcregex_match(pcregex_t* re, const char* subject);

// Text of the first match, or NULL. NULL with an empty pcregex_error()
// means there was no match.
PCREGEX_API char* pcregex_find(pcregex_t* re, const char* subject);

// Replace every match using a ${name} / ${digits} template
PCREGEX_API char* pcregex_replace_all(pcregex_t* re, const char* src, const char* tmpl);

// Split around matches, at most n pieces (n < 0 for all).
// Returns a NULL-terminated list.
PCREGEX_API char** pcregex_split(pcregex_t* re, const char* s, int n);

// ============================================================================
// Utilities
// ============================================================================

#ifdef PCREGEX_HAS_GLOB
// Paths matching a glob as a NULL-terminated list
PCREGEX_API char** pcregex_glob(const char* glob);
#endif

// Escape all regex metacharacters in s
PCREGEX_API char* pcregex_escape(const char* s);

PCREGEX_API void pcregex_string_free(char* s);
PCREGEX_API void pcregex_list_free(char** list);

// Message of the last failure on this thread, "" after a successful call
PCREGEX_API const char* pcregex_error(void);

#endif // PCREGEX_HAS_CAPI

#ifdef __cplusplus
}
#endif

#endif // PCREGEX_CAPI_H
