// pcregex - Match Iteration
// Copyright (c) 2026 greenteng.com
//
// Turns PCRE2's single "match at offset" attempt into ordered global
// matching. Every find, match, replace and split operation goes through
// Regexp::search.

#include "pcregex_core.h"

namespace pcregex {

// Offset of the first attempt after an empty match at pos. In UTF mode
// the cursor must land on a character boundary or PCRE2 rejects it.
static size_t advancePastEmpty(const PatternHandle& h, const std::string& subject, size_t pos) {
    size_t next = pos + 1;
    if (h.utf) {
        while (next < subject.size() && (static_cast<unsigned char>(subject[next]) & 0xC0) == 0x80) {
            next++;
        }
    }
    return next;
}

std::vector<MatchRecord> Regexp::search(const std::string& subject, bool wantAll) const {
    PatternHandle& h = handle();
    MatchData md(h);

    std::vector<MatchRecord> out;
    size_t offset = 0;

    while (offset <= subject.size()) {
        MatchRecord rec;
        int rc = matchAttempt(h, md, subject, offset, 0, rec);
        if (rc == PCRE2_ERROR_NOMATCH) {
            break;
        }
        if (rc < 0) {
            throw ExecError(rc);
        }

        const Span whole = rec[0];
        if (whole.start == whole.end) {
            // An empty match is only kept when some match was accepted
            // before it and it does not touch that match's end.
            offset = advancePastEmpty(h, subject, whole.end);
            if (out.empty() || whole.start == out.back()[0].end) {
                continue;
            }
            out.push_back(std::move(rec));
        } else {
            // Next attempt starts right where this match ended
            offset = whole.end;
            out.push_back(std::move(rec));
        }

        if (!wantAll) {
            break;
        }
    }
    return out;
}

// ============================================================================
// Find family
// ============================================================================

std::optional<std::string> Regexp::find(const std::string& subject) const {
    std::vector<MatchRecord> matches = search(subject, false);
    if (matches.empty()) {
        return std::nullopt;
    }
    return spanText(subject, matches[0][0]);
}

std::optional<Span> Regexp::findIndex(const std::string& subject) const {
    std::vector<MatchRecord> matches = search(subject, false);
    if (matches.empty()) {
        return std::nullopt;
    }
    return matches[0][0];
}

std::vector<std::string> Regexp::findAll(const std::string& subject, int n) const {
    std::vector<std::string> out;
    if (n == 0) {
        return out;
    }
    std::vector<MatchRecord> matches = search(subject, true);
    limitMatches(matches, n);

    out.reserve(matches.size());
    for (const MatchRecord& m : matches) {
        out.push_back(spanText(subject, m[0]));
    }
    return out;
}

std::vector<Span> Regexp::findAllIndex(const std::string& subject, int n) const {
    std::vector<Span> out;
    if (n == 0) {
        return out;
    }
    std::vector<MatchRecord> matches = search(subject, true);
    limitMatches(matches, n);

    out.reserve(matches.size());
    for (const MatchRecord& m : matches) {
        out.push_back(m[0]);
    }
    return out;
}

std::vector<std::string> Regexp::findSubmatch(const std::string& subject) const {
    std::vector<std::string> out;
    std::vector<MatchRecord> matches = search(subject, false);
    if (matches.empty()) {
        return out;
    }
    for (const Span& span : matches[0]) {
        out.push_back(spanText(subject, span));
    }
    return out;
}

MatchRecord Regexp::findSubmatchIndex(const std::string& subject) const {
    std::vector<MatchRecord> matches = search(subject, false);
    if (matches.empty()) {
        return MatchRecord();
    }
    return matches[0];
}

std::vector<std::vector<std::string>> Regexp::findAllSubmatch(const std::string& subject, int n) const {
    std::vector<std::vector<std::string>> out;
    if (n == 0) {
        return out;
    }
    std::vector<MatchRecord> matches = search(subject, true);
    limitMatches(matches, n);

    out.reserve(matches.size());
    for (const MatchRecord& m : matches) {
        std::vector<std::string> groups;
        groups.reserve(m.size());
        for (const Span& span : m) {
            groups.push_back(spanText(subject, span));
        }
        out.push_back(std::move(groups));
    }
    return out;
}

std::vector<MatchRecord> Regexp::findAllSubmatchIndex(const std::string& subject, int n) const {
    if (n == 0) {
        return std::vector<MatchRecord>();
    }
    std::vector<MatchRecord> matches = search(subject, true);
    limitMatches(matches, n);
    return matches;
}

std::map<std::string, std::string> Regexp::findNamedSubmatch(const std::string& subject) const {
    std::map<std::string, std::string> out;
    std::vector<MatchRecord> matches = search(subject, false);
    if (matches.empty()) {
        return out;
    }

    std::vector<std::string> names = subexpNames();
    const MatchRecord& m = matches[0];
    for (size_t i = 1; i < names.size() && i < m.size(); i++) {
        if (names[i].empty()) {
            continue;
        }
        // With DupNames the group that actually matched wins
        if (m[i].matched() || out.find(names[i]) == out.end()) {
            out[names[i]] = spanText(subject, m[i]);
        }
    }
    return out;
}

bool Regexp::match(const std::string& subject) const {
    return !search(subject, false).empty();
}

bool Regexp::fullMatch(const std::string& subject) const {
    PatternHandle& h = handle();
    MatchData md(h);

    MatchRecord rec;
    int rc = matchAttempt(h, md, subject, 0, PCRE2_ANCHORED | PCRE2_ENDANCHORED, rec);
    if (rc == PCRE2_ERROR_NOMATCH) {
        return false;
    }
    if (rc < 0) {
        throw ExecError(rc);
    }
    return true;
}

} // namespace pcregex
