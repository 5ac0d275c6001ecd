// pcregex - Compile Options
// Copyright (c) 2026 greenteng.com
//
// Each option is one PCRE2 compile bit, passed through verbatim.
// Combine with |, e.g. Caseless | Multiline

#ifndef PCREGEX_OPTIONS_H
#define PCREGEX_OPTIONS_H

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif
#include <pcre2.h>
#include <stdint.h>

namespace pcregex {

using CompileOptions = uint32_t;

enum CompileOption : uint32_t {
    Anchored          = PCRE2_ANCHORED,
    AllowEmptyClass   = PCRE2_ALLOW_EMPTY_CLASS,
    AltBsux           = PCRE2_ALT_BSUX,
    AltCircumflex     = PCRE2_ALT_CIRCUMFLEX,
    AltVerbnames      = PCRE2_ALT_VERBNAMES,
    AutoCallout       = PCRE2_AUTO_CALLOUT,
    Caseless          = PCRE2_CASELESS,
    DollarEndOnly     = PCRE2_DOLLAR_ENDONLY,
    DotAll            = PCRE2_DOTALL,
    DupNames          = PCRE2_DUPNAMES,
    EndAnchored       = PCRE2_ENDANCHORED,
    Extended          = PCRE2_EXTENDED,
    FirstLine         = PCRE2_FIRSTLINE,
    Literal           = PCRE2_LITERAL,
    MatchInvalidUTF   = PCRE2_MATCH_INVALID_UTF,
    MatchUnsetBackref = PCRE2_MATCH_UNSET_BACKREF,
    Multiline         = PCRE2_MULTILINE,
    NeverBackslashC   = PCRE2_NEVER_BACKSLASH_C,
    NeverUCP          = PCRE2_NEVER_UCP,
    NeverUTF          = PCRE2_NEVER_UTF,
    NoAutoCapture     = PCRE2_NO_AUTO_CAPTURE,
    NoAutoPossess     = PCRE2_NO_AUTO_POSSESS,
    NoDotStarAnchor   = PCRE2_NO_DOTSTAR_ANCHOR,
    NoStartOptimize   = PCRE2_NO_START_OPTIMIZE,
    NoUTFCheck        = PCRE2_NO_UTF_CHECK,
    UCP               = PCRE2_UCP,
    Ungreedy          = PCRE2_UNGREEDY,
    UseOffsetLimit    = PCRE2_USE_OFFSET_LIMIT,
    UTF               = PCRE2_UTF
};

// Flags reported in CalloutBlock::calloutFlags
enum CalloutFlag : uint32_t {
    CalloutStartMatch = PCRE2_CALLOUT_STARTMATCH,  // first callout of a new match attempt
    CalloutBacktrack  = PCRE2_CALLOUT_BACKTRACK    // backtracking happened since the last callout
};

} // namespace pcregex

#endif // PCREGEX_OPTIONS_H
