// pcregex - Callout Bridge
// Copyright (c) 2026 greenteng.com
//
// Copies PCRE2's callout block into an owned CalloutBlock and hands it to
// the registered CalloutFunc. See pcre2callout(3) for when PCRE2 calls out.
//
// The callout runs inside a match attempt, with the pattern's match lock
// held. It must not call back into the same Regexp.

#include "pcregex_core.h"

#include <utility>

namespace pcregex {

static std::string copyText(PCRE2_SPTR text, size_t length) {
    if (!text || length == 0) {
        return "";
    }
    return std::string(reinterpret_cast<const char*>(text), length);
}

static CalloutBlock marshalCallout(const pcre2_callout_block& block) {
    CalloutBlock cb;
    cb.version = block.version;
    cb.calloutNumber = block.callout_number;
    cb.captureTop = block.capture_top;
    cb.captureLast = block.capture_last;
    cb.startMatch = block.start_match;
    cb.currentPosition = block.current_position;
    cb.patternPosition = block.pattern_position;
    cb.nextItemLength = block.next_item_length;
    cb.calloutStringOffset = block.callout_string_offset;
    cb.calloutFlags = block.callout_flags;

    cb.subject = copyText(block.subject, block.subject_length);
    cb.calloutString = copyText(block.callout_string, block.callout_string_length);
    if (block.mark) {
        cb.mark = reinterpret_cast<const char*>(block.mark);
    }

    // Pair 0 (the whole match) is never set during a callout; groups
    // 1 .. capture_top-1 are the ones captured so far.
    const PCRE2_SIZE* ovector = block.offset_vector;
    const size_t length = block.subject_length;
    for (uint32_t i = 1; ovector && i < block.capture_top; i++) {
        PCRE2_SIZE start = ovector[2 * i];
        PCRE2_SIZE end = ovector[2 * i + 1];

        if (start == PCRE2_UNSET || start > length) {
            cb.substrings.push_back("");
        } else if (end == PCRE2_UNSET || end < start || end > length) {
            // PCRE2 fills both ends of a pair when the group closes, so an
            // unset end never comes out of pcre2_match itself. Anything
            // else runs to the end of the subject.
            cb.substrings.push_back(cb.subject.substr(start));
        } else {
            cb.substrings.push_back(cb.subject.substr(start, end - start));
        }
    }
    return cb;
}

int calloutTrampoline(pcre2_callout_block* block, void* data) {
    PatternHandle* h = static_cast<PatternHandle*>(data);
    if (!h || !h->callout || !*h->callout) {
        return 0;
    }

    // Nothing may unwind through pcre2_match. The exception is parked on
    // the handle and rethrown by matchAttempt once PCRE2 returns.
    try {
        CalloutBlock cb = marshalCallout(*block);
        return (*h->callout)(cb);
    } catch (...) {
        h->calloutError = std::current_exception();
        return PCRE2_ERROR_CALLOUT;
    }
}

void Regexp::setCallout(CalloutFunc fn) {
    PatternHandle& h = handle();

    MutexGuard calloutLock(&h.calloutLock);
    MutexGuard matchLock(&h.matchLock);
    if (!h.mctx) {
        throw ClosedError();
    }

    int rc;
    if (fn) {
        h.callout.reset(new CalloutFunc(std::move(fn)));
        rc = pcre2_set_callout(h.mctx, calloutTrampoline, &h);
    } else {
        rc = pcre2_set_callout(h.mctx, NULL, NULL);
        h.callout.reset();
    }
    if (rc < 0) {
        throw RegexError(errorMessage(rc), rc);
    }
    PCREGEX_LOG("callout %s for pattern %s", h.callout ? "installed" : "removed", expr_.c_str());
}

} // namespace pcregex
