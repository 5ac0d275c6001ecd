// pcregex - Pattern Handle
// Copyright (c) 2026 greenteng.com
//
// Compilation, lifetime and introspection of a compiled pattern, and the
// single locked match attempt every search is built from.

#include "pcregex_core.h"

#include <string.h>
#include <utility>

namespace pcregex {

// ============================================================================
// PatternHandle
// ============================================================================

PatternHandle::PatternHandle() {
    pcregex_mutex_init(&matchLock);
    pcregex_mutex_init(&calloutLock);
}

PatternHandle::~PatternHandle() {
    release();
    pcregex_mutex_destroy(&calloutLock);
    pcregex_mutex_destroy(&matchLock);
}

void PatternHandle::release() {
    if (code) {
        pcre2_code_free(code);
        code = nullptr;
    }
    if (mctx) {
        pcre2_match_context_free(mctx);
        mctx = nullptr;
    }
}

// ============================================================================
// MatchData
// ============================================================================

MatchData::MatchData(PatternHandle& handle) {
    MutexGuard lock(&handle.matchLock);
    if (!handle.code) {
        throw ClosedError();
    }
    md_ = pcre2_match_data_create_from_pattern(handle.code, NULL);
    if (!md_) {
        throw ResourceError("match data");
    }
}

MatchData::~MatchData() {
    if (md_) {
        pcre2_match_data_free(md_);
    }
}

int matchAttempt(PatternHandle& handle, MatchData& md, const std::string& subject,
                 size_t offset, uint32_t options, MatchRecord& out) {
    MutexGuard lock(&handle.matchLock);
    if (!handle.code) {
        throw ClosedError();
    }

    int rc = pcre2_match(handle.code, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(),
                         offset, options, md.get(), handle.mctx);

    if (handle.calloutError) {
        std::exception_ptr err = handle.calloutError;
        handle.calloutError = nullptr;
        std::rethrow_exception(err);
    }
    if (rc < 0) {
        return rc;
    }

    // The ovector belongs to md and is reused by the next attempt, so the
    // offsets are copied out. rc == 0 means every pair was filled.
    uint32_t pairs = pcre2_get_ovector_count(md.get());
    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(md.get());
    uint32_t used = (rc == 0) ? pairs : static_cast<uint32_t>(rc);

    out.assign(pairs, Span());
    for (uint32_t i = 0; i < used && i < pairs; i++) {
        if (ovector[2 * i] == PCRE2_UNSET) {
            continue;
        }
        out[i].start = ovector[2 * i];
        out[i].end = ovector[2 * i + 1];
    }
    return rc;
}

std::string spanText(const std::string& subject, const Span& span) {
    if (!span.matched() || span.start > subject.size() || span.end < span.start) {
        return "";
    }
    return subject.substr(span.start, span.end - span.start);
}

// ============================================================================
// Regexp lifetime
// ============================================================================

Regexp::Regexp(std::unique_ptr<PatternHandle> handle, std::string expr)
    : handle_(std::move(handle)), expr_(std::move(expr)) {}

Regexp Regexp::compile(const std::string& pattern, CompileOptions options) {
    int errorcode = 0;
    PCRE2_SIZE erroroffset = 0;

    pcre2_code* re = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(),
                                   options, &errorcode, &erroroffset, NULL);
    if (!re) {
        PCREGEX_LOG("compile failed at offset %zu: %s", static_cast<size_t>(erroroffset), pattern.c_str());
        throw CompileError(errorMessage(errorcode), errorcode, erroroffset);
    }

    std::unique_ptr<PatternHandle> handle(new PatternHandle());
    handle->code = re;
    handle->mctx = pcre2_match_context_create(NULL);
    if (!handle->mctx) {
        throw ResourceError("match context");
    }

    // Inline (*UTF) shows up here as well as the UTF compile option
    uint32_t allOptions = 0;
    pcre2_pattern_info(re, PCRE2_INFO_ALLOPTIONS, &allOptions);
    handle->utf = (allOptions & PCRE2_UTF) != 0;

    return Regexp(std::move(handle), pattern);
}

Regexp::Regexp(Regexp&& other) noexcept
    : handle_(std::move(other.handle_)), expr_(std::move(other.expr_)) {}

Regexp& Regexp::operator=(Regexp&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = std::move(other.handle_);
        expr_ = std::move(other.expr_);
    }
    return *this;
}

Regexp::~Regexp() {
    close();
}

void Regexp::close() {
    if (!handle_) {
        return;
    }
    MutexGuard calloutLock(&handle_->calloutLock);
    MutexGuard matchLock(&handle_->matchLock);
    handle_->release();
    handle_->callout.reset();
}

bool Regexp::isClosed() const {
    if (!handle_) {
        return true;
    }
    MutexGuard lock(&handle_->matchLock);
    return handle_->code == nullptr;
}

PatternHandle& Regexp::handle() const {
    if (!handle_) {
        throw ClosedError();
    }
    return *handle_;
}

// ============================================================================
// Introspection
// ============================================================================

int Regexp::numSubexp() const {
    PatternHandle& h = handle();
    MutexGuard lock(&h.matchLock);
    if (!h.code) {
        throw ClosedError();
    }
    uint32_t count = 0;
    pcre2_pattern_info(h.code, PCRE2_INFO_CAPTURECOUNT, &count);
    return static_cast<int>(count);
}

int Regexp::subexpIndex(const std::string& name) const {
    PatternHandle& h = handle();
    MutexGuard lock(&h.matchLock);
    if (!h.code) {
        throw ClosedError();
    }

    PCRE2_SPTR cname = reinterpret_cast<PCRE2_SPTR>(name.c_str());
    int rc = pcre2_substring_number_from_name(h.code, cname);
    if (rc >= 0) {
        return rc;
    }
    if (rc == PCRE2_ERROR_NOSUBSTRING) {
        return -1;
    }
    if (rc == PCRE2_ERROR_NOUNIQUESUBSTRING) {
        // Duplicate names (DupNames): lowest group number wins
        PCRE2_SPTR first = NULL;
        PCRE2_SPTR last = NULL;
        int entrySize = pcre2_substring_nametable_scan(h.code, cname, &first, &last);
        if (entrySize > 0) {
            int lowest = -1;
            for (PCRE2_SPTR entry = first; entry <= last; entry += entrySize) {
                int n = (entry[0] << 8) | entry[1];
                if (lowest < 0 || n < lowest) {
                    lowest = n;
                }
            }
            return lowest;
        }
    }
    throw RegexError(errorMessage(rc), rc);
}

std::vector<std::string> Regexp::subexpNames() const {
    PatternHandle& h = handle();
    MutexGuard lock(&h.matchLock);
    if (!h.code) {
        throw ClosedError();
    }

    uint32_t captureCount = 0;
    pcre2_pattern_info(h.code, PCRE2_INFO_CAPTURECOUNT, &captureCount);
    std::vector<std::string> names(captureCount + 1);

    uint32_t namecount = 0;
    pcre2_pattern_info(h.code, PCRE2_INFO_NAMECOUNT, &namecount);
    if (namecount == 0) {
        return names;
    }

    PCRE2_SPTR nameTable;
    uint32_t nameEntrySize;
    pcre2_pattern_info(h.code, PCRE2_INFO_NAMETABLE, &nameTable);
    pcre2_pattern_info(h.code, PCRE2_INFO_NAMEENTRYSIZE, &nameEntrySize);

    // Each entry: 2-byte group number, then the NUL-terminated name
    PCRE2_SPTR tabptr = nameTable;
    for (uint32_t i = 0; i < namecount; i++) {
        uint32_t n = (static_cast<uint32_t>(tabptr[0]) << 8) | tabptr[1];
        if (n < names.size() && names[n].empty()) {
            names[n] = reinterpret_cast<const char*>(tabptr + 2);
        }
        tabptr += nameEntrySize;
    }
    return names;
}

// ============================================================================
// Match context configuration
// ============================================================================

void Regexp::setMatchLimit(uint32_t limit) {
    PatternHandle& h = handle();
    MutexGuard lock(&h.matchLock);
    if (!h.mctx) {
        throw ClosedError();
    }
    pcre2_set_match_limit(h.mctx, limit);
}

void Regexp::setDepthLimit(uint32_t limit) {
    PatternHandle& h = handle();
    MutexGuard lock(&h.matchLock);
    if (!h.mctx) {
        throw ClosedError();
    }
    pcre2_set_depth_limit(h.mctx, limit);
}

void Regexp::setHeapLimit(uint32_t kibibytes) {
    PatternHandle& h = handle();
    MutexGuard lock(&h.matchLock);
    if (!h.mctx) {
        throw ClosedError();
    }
    pcre2_set_heap_limit(h.mctx, kibibytes);
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string quoteMeta(const std::string& s) {
    static const char* special = "\\^$.|?*+()[]{}";

    std::string result;
    result.reserve(s.size() * 2);
    for (char c : s) {
        if (c != '\0' && strchr(special, c)) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string pcre2Version() {
    PCRE2_UCHAR buffer[64];
    int len = pcre2_config(PCRE2_CONFIG_VERSION, buffer);
    if (len < 0) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(buffer));
}

} // namespace pcregex
