// pcregex - Version Information
// Copyright (c) 2026 greenteng.com

#ifndef PCREGEX_VERSION_H
#define PCREGEX_VERSION_H

// ============================================================================
// VERSION
// ============================================================================

#define PCREGEX_VERSION_MAJOR  1
#define PCREGEX_VERSION_MINOR  0
#define PCREGEX_VERSION_PATCH  0

// ============================================================================
// DERIVED VERSION MACROS - DO NOT MODIFY
// ============================================================================

#define PCREGEX_STRINGIFY2(x) #x
#define PCREGEX_STRINGIFY(x) PCREGEX_STRINGIFY2(x)

#define PCREGEX_VERSION_STRING \
    PCREGEX_STRINGIFY(PCREGEX_VERSION_MAJOR) "." \
    PCREGEX_STRINGIFY(PCREGEX_VERSION_MINOR) "." \
    PCREGEX_STRINGIFY(PCREGEX_VERSION_PATCH)

#define PCREGEX_VERSION_INT \
    ((PCREGEX_VERSION_MAJOR * 10000) + (PCREGEX_VERSION_MINOR * 100) + PCREGEX_VERSION_PATCH)

#endif // PCREGEX_VERSION_H
