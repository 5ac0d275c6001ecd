// pcregex - Replacement and Splitting
// Copyright (c) 2026 greenteng.com
//
// All replace variants share one splice loop over the matches of the
// original subject. Offsets stay relative to the original subject; drift
// maps them into the output being rewritten.

#include "pcregex_core.h"

#include <ctype.h>
#include <stddef.h>

namespace pcregex {

// ============================================================================
// Splice
// ============================================================================

std::string Regexp::replace(const std::string& src, const Expander& expand) const {
    std::vector<MatchRecord> matches = search(src, true);
    if (matches.empty()) {
        return src;
    }

    std::string out(src);
    ptrdiff_t drift = 0;
    for (const MatchRecord& m : matches) {
        std::string repl = expand(m);
        const size_t start = m[0].start;
        const size_t length = m[0].end - m[0].start;

        out.replace(static_cast<size_t>(static_cast<ptrdiff_t>(start) + drift), length, repl);
        drift += static_cast<ptrdiff_t>(repl.size()) - static_cast<ptrdiff_t>(length);
    }
    return out;
}

std::string Regexp::replaceAll(const std::string& src, const std::string& tmpl) const {
    return replace(src, [&](const MatchRecord& m) {
        return expand(tmpl, src, m);
    });
}

std::string Regexp::replaceAllFunc(const std::string& src,
                                   const std::function<std::string(const std::string&)>& fn) const {
    return replace(src, [&](const MatchRecord& m) {
        return fn(spanText(src, m[0]));
    });
}

std::string Regexp::replaceAllLiteral(const std::string& src, const std::string& repl) const {
    return replace(src, [&](const MatchRecord&) {
        return repl;
    });
}

// ============================================================================
// Template expansion
// ============================================================================

static bool isNameChar(char c) {
    return isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool isNumber(const std::string& s) {
    for (char c : s) {
        if (!isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return !s.empty();
}

std::string Regexp::expand(const std::string& tmpl, const std::string& src, const MatchRecord& match) const {
    std::string out;
    out.reserve(tmpl.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] != '$' || i + 1 >= tmpl.size()) {
            out += tmpl[i++];
            continue;
        }

        std::string name;
        size_t next;
        if (tmpl[i + 1] == '$') {
            out += '$';
            i += 2;
            continue;
        } else if (tmpl[i + 1] == '{') {
            size_t close = tmpl.find('}', i + 2);
            if (close == std::string::npos || close == i + 2) {
                out += tmpl[i++];
                continue;
            }
            name = tmpl.substr(i + 2, close - i - 2);
            next = close + 1;
        } else {
            size_t j = i + 1;
            while (j < tmpl.size() && isNameChar(tmpl[j])) {
                j++;
            }
            if (j == i + 1) {
                out += tmpl[i++];
                continue;
            }
            name = tmpl.substr(i + 1, j - i - 1);
            next = j;
        }

        // Unknown names, missing groups and groups that did not
        // participate all expand to nothing.
        long index = -1;
        if (isNumber(name)) {
            if (name.size() <= 9) {
                index = std::stol(name);
            }
        } else {
            index = subexpIndex(name);
        }
        if (index >= 0 && static_cast<size_t>(index) < match.size()) {
            out += spanText(src, match[static_cast<size_t>(index)]);
        }
        i = next;
    }
    return out;
}

// ============================================================================
// Splitting
// ============================================================================

std::vector<std::string> Regexp::split(const std::string& s, int n) const {
    std::vector<std::string> pieces;
    if (n == 0) {
        return pieces;
    }
    if (!expr_.empty() && s.empty()) {
        pieces.push_back("");
        return pieces;
    }

    std::vector<Span> matches = findAllIndex(s, n);
    pieces.reserve(matches.size() + 1);

    size_t beg = 0;
    size_t end = 0;
    for (const Span& m : matches) {
        if (n > 0 && pieces.size() >= static_cast<size_t>(n - 1)) {
            break;
        }
        end = m.start;
        // A match ending at 0 leaves no text before it
        if (m.end != 0) {
            pieces.push_back(s.substr(beg, end - beg));
        }
        beg = m.end;
    }

    if (end != s.size()) {
        pieces.push_back(s.substr(beg));
    }
    return pieces;
}

} // namespace pcregex
