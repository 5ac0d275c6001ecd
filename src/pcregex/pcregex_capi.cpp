// pcregex - C Binding
// Copyright (c) 2026 greenteng.com
//
// Every entry point clears the thread-local error, runs the C++ call and
// turns an exception into a NULL / -1 result with the message kept for
// pcregex_error().

#include "pcregex_capi.h"

#ifdef PCREGEX_HAS_CAPI

#include "pcregex.h"

#include <stdlib.h>
#include <string.h>
#include <string>
#include <utility>
#include <vector>

struct pcregex_t {
    pcregex::Regexp re;

    explicit pcregex_t(pcregex::Regexp r) : re(std::move(r)) {}
};

// Thread-local error message
static thread_local std::string g_pcregex_error;

static void set_error(const char* msg) {
    g_pcregex_error = msg ? msg : "";
}

static void clear_error() {
    g_pcregex_error.clear();
}

// Helper: malloc'd copy released by pcregex_string_free
static char* dup_string(const std::string& s) {
    char* out = static_cast<char*>(malloc(s.size() + 1));
    if (!out) {
        set_error("out of memory");
        return NULL;
    }
    memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

// Helper: NULL-terminated list released by pcregex_list_free
static char** dup_list(const std::vector<std::string>& items) {
    char** list = static_cast<char**>(calloc(items.size() + 1, sizeof(char*)));
    if (!list) {
        set_error("out of memory");
        return NULL;
    }
    for (size_t i = 0; i < items.size(); i++) {
        list[i] = dup_string(items[i]);
        if (!list[i]) {
            pcregex_list_free(list);
            return NULL;
        }
    }
    return list;
}

// ============================================================================
// Compiled Patterns
// ============================================================================

extern "C" pcregex_t* pcregex_compile(const char* pattern, uint32_t options) {
    clear_error();
    if (!pattern) {
        set_error("Invalid pattern: NULL");
        return NULL;
    }

    try {
        return new pcregex_t(pcregex::Regexp::compile(pattern, options));
    } catch (const std::exception& e) {
        set_error(e.what());
        return NULL;
    }
}

extern "C" void pcregex_free(pcregex_t* re) {
    delete re;
}

extern "C" int pcregex_match(pcregex_t* re, const char* subject) {
    clear_error();
    if (!re || !subject) {
        set_error("Invalid arguments");
        return -1;
    }

    try {
        return re->re.match(subject) ? 1 : 0;
    } catch (const std::exception& e) {
        set_error(e.what());
        return -1;
    }
}

extern "C" char* pcregex_find(pcregex_t* re, const char* subject) {
    clear_error();
    if (!re || !subject) {
        set_error("Invalid arguments");
        return NULL;
    }

    try {
        std::optional<std::string> found = re->re.find(subject);
        if (!found) {
            return NULL;
        }
        return dup_string(*found);
    } catch (const std::exception& e) {
        set_error(e.what());
        return NULL;
    }
}

extern "C" char* pcregex_replace_all(pcregex_t* re, const char* src, const char* tmpl) {
    clear_error();
    if (!re || !src || !tmpl) {
        set_error("Invalid arguments");
        return NULL;
    }

    try {
        return dup_string(re->re.replaceAll(src, tmpl));
    } catch (const std::exception& e) {
        set_error(e.what());
        return NULL;
    }
}

extern "C" char** pcregex_split(pcregex_t* re, const char* s, int n) {
    clear_error();
    if (!re || !s) {
        set_error("Invalid arguments");
        return NULL;
    }

    try {
        return dup_list(re->re.split(s, n));
    } catch (const std::exception& e) {
        set_error(e.what());
        return NULL;
    }
}

// ============================================================================
// Utilities
// ============================================================================

#ifdef PCREGEX_HAS_GLOB
extern "C" char** pcregex_glob(const char* glob) {
    clear_error();
    if (!glob) {
        set_error("Invalid glob: NULL");
        return NULL;
    }

    try {
        return dup_list(pcregex::glob(glob));
    } catch (const std::exception& e) {
        set_error(e.what());
        return NULL;
    }
}
#endif

extern "C" char* pcregex_escape(const char* s) {
    clear_error();
    if (!s) {
        set_error("Invalid arguments");
        return NULL;
    }

    try {
        return dup_string(pcregex::quoteMeta(s));
    } catch (const std::exception& e) {
        set_error(e.what());
        return NULL;
    }
}

extern "C" void pcregex_string_free(char* s) {
    free(s);
}

extern "C" void pcregex_list_free(char** list) {
    if (!list) {
        return;
    }
    for (char** p = list; *p; p++) {
        free(*p);
    }
    free(list);
}

extern "C" const char* pcregex_error(void) {
    return g_pcregex_error.c_str();
}

#endif // PCREGEX_HAS_CAPI
