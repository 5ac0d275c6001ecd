// pcregex - Internal Core Header
// Copyright (c) 2026 greenteng.com
//
// This header defines internal types and helper functions shared between
// library modules. NOT for external use - use pcregex.h instead.

#ifndef PCREGEX_CORE_H
#define PCREGEX_CORE_H

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif
#include <pcre2.h>

#include "pcregex.h"

#include <exception>
#include <memory>
#include <string>

namespace pcregex {

// ============================================================================
// Locking
// ============================================================================

class MutexGuard {
public:
    explicit MutexGuard(PCREGEX_MUTEX* m) : m_(m) { pcregex_mutex_lock(m_); }
    ~MutexGuard() { pcregex_mutex_unlock(m_); }

    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;

private:
    PCREGEX_MUTEX* m_;
};

// ============================================================================
// Pattern Handle
// ============================================================================
// code and mctx are null once closed. matchLock guards both, and every
// pcre2_match call on them. calloutLock guards callout replacement and is
// always taken before matchLock.

struct PatternHandle {
    pcre2_code* code = nullptr;
    pcre2_match_context* mctx = nullptr;
    bool utf = false;

    PCREGEX_MUTEX matchLock;
    PCREGEX_MUTEX calloutLock;

    std::unique_ptr<CalloutFunc> callout;
    // Exception thrown by the callout during the running attempt
    std::exception_ptr calloutError;

    PatternHandle();
    ~PatternHandle();

    PatternHandle(const PatternHandle&) = delete;
    PatternHandle& operator=(const PatternHandle&) = delete;

    // Frees code and mctx; caller holds matchLock
    void release();
};

// ============================================================================
// Match Data
// ============================================================================
// Per-search scratch buffer sized from the pattern. Never shared between
// searches.

class MatchData {
public:
    // Throws ClosedError or ResourceError
    explicit MatchData(PatternHandle& handle);
    ~MatchData();

    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;

    pcre2_match_data* get() const { return md_; }

private:
    pcre2_match_data* md_ = nullptr;
};

// Runs one pcre2_match at offset under the match lock and copies the
// capture offsets into out. Returns the pcre2_match result code; throws
// ClosedError, or rethrows an exception raised by the callout.
int matchAttempt(PatternHandle& handle, MatchData& md, const std::string& subject,
                 size_t offset, uint32_t options, MatchRecord& out);

// Matched text of one span ("" for a group that did not participate)
std::string spanText(const std::string& subject, const Span& span);

// Applies a findAll-style cap to a result vector
template <typename T>
void limitMatches(std::vector<T>& items, int n) {
    if (n == 0) {
        items.clear();
    } else if (n > 0 && items.size() > static_cast<size_t>(n)) {
        items.resize(static_cast<size_t>(n));
    }
}

// Callout bridge entry point registered with pcre2_set_callout
int calloutTrampoline(pcre2_callout_block* block, void* data);

} // namespace pcregex

#endif // PCREGEX_CORE_H
