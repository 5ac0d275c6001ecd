// pcregex - Platform Detection Header
// Copyright (c) 2026 greenteng.com
//
// Cross-platform macros and type abstractions
// Shared by every pcregex module

#ifndef PCREGEX_PLATFORM_H
#define PCREGEX_PLATFORM_H

// ============================================================================
// Platform detection
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define PCREGEX_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Mutex abstraction
// ============================================================================

#ifdef PCREGEX_PLATFORM_WINDOWS
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
    #define PCREGEX_MUTEX CRITICAL_SECTION

    #define pcregex_mutex_init(m) InitializeCriticalSection(m)
    #define pcregex_mutex_destroy(m) DeleteCriticalSection(m)
    #define pcregex_mutex_lock(m) EnterCriticalSection(m)
    #define pcregex_mutex_unlock(m) LeaveCriticalSection(m)
#else
    #include <pthread.h>
    #define PCREGEX_MUTEX pthread_mutex_t

    #define pcregex_mutex_init(m) pthread_mutex_init(m, NULL)
    #define pcregex_mutex_destroy(m) pthread_mutex_destroy(m)
    #define pcregex_mutex_lock(m) pthread_mutex_lock(m)
    #define pcregex_mutex_unlock(m) pthread_mutex_unlock(m)
#endif

// ============================================================================
// Filesystem abstraction
// ============================================================================

#ifdef PCREGEX_PLATFORM_WINDOWS
    #define PCREGEX_PATH_SEPARATOR '\\'
    #define PCREGEX_PATH_SEPARATOR_STR "\\"
#else
    #define PCREGEX_PATH_SEPARATOR '/'
    #define PCREGEX_PATH_SEPARATOR_STR "/"
#endif

// ============================================================================
// Export symbols
// ============================================================================

// pcregex is built as a static library; nothing to export on Windows
#ifdef PCREGEX_PLATFORM_WINDOWS
    #define PCREGEX_API
#else
    #define PCREGEX_API __attribute__((visibility("default")))
#endif

// ============================================================================
// Debug macros
// ============================================================================

#ifdef NDEBUG
    #define PCREGEX_DEBUG 0
#else
    #define PCREGEX_DEBUG 1
#endif

#if PCREGEX_DEBUG
    #include <stdio.h>
    #define PCREGEX_LOG(fmt, ...) fprintf(stderr, "[PCREGEX] " fmt "\n", ##__VA_ARGS__)
#else
    #define PCREGEX_LOG(fmt, ...) ((void)0)
#endif

// ============================================================================
// Feature flags (derived from PCREGEX_NO_XXX)
// ============================================================================
// Use PCREGEX_NO_XXX to drop modules, e.g. -DPCREGEX_NO_GLOB -DPCREGEX_NO_CAPI

// Glob translation and filesystem walking
#ifndef PCREGEX_NO_GLOB
    #define PCREGEX_HAS_GLOB 1
#endif

// extern "C" binding
#ifndef PCREGEX_NO_CAPI
    #define PCREGEX_HAS_CAPI 1
#endif

#endif // PCREGEX_PLATFORM_H
