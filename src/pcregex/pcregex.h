// pcregex - Public API
// Copyright (c) 2026 greenteng.com
//
// Perl-compatible regular expressions (PCRE2) behind a find / match /
// replace / split interface, plus shell-glob path matching.
//
// A Regexp may be shared between threads; match attempts on one pattern
// are serialized internally. Call close() when done (the destructor does
// it too).

#ifndef PCREGEX_H
#define PCREGEX_H

#include "pcregex_platform.h"
#include "pcregex_options.h"
#include "pcregex_error.h"
#include "version.h"

#include <stddef.h>
#include <stdint.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pcregex {

// ============================================================================
// Match Results
// ============================================================================

// Byte range [start, end) in a subject. A group that did not take part in
// the match has both ends set to npos.
struct Span {
    static constexpr size_t npos = static_cast<size_t>(-1);

    size_t start = npos;
    size_t end = npos;

    bool matched() const { return start != npos; }
    size_t length() const { return matched() ? end - start : 0; }

    bool operator==(const Span& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

// [0] is the whole match, [i] is capture group i
using MatchRecord = std::vector<Span>;

// ============================================================================
// Callouts
// ============================================================================

// Snapshot of PCRE2's progress at a callout point. Every string is an owned
// copy; the block is only valid for the duration of the callback.
struct CalloutBlock {
    uint32_t version = 0;
    uint32_t calloutNumber = 0;
    uint32_t captureTop = 0;
    uint32_t captureLast = 0;
    std::vector<std::string> substrings;  // groups 1 .. captureTop-1
    std::string mark;
    std::string subject;
    size_t startMatch = 0;
    size_t currentPosition = 0;
    size_t patternPosition = 0;
    size_t nextItemLength = 0;
    size_t calloutStringOffset = 0;
    std::string calloutString;
    uint32_t calloutFlags = 0;            // CalloutFlag bits
};

// Return 0 to continue, > 0 to fail at this point (PCRE2 backtracks),
// < 0 to abort the match with that error code.
using CalloutFunc = std::function<int32_t(const CalloutBlock&)>;

// ============================================================================
// Regexp
// ============================================================================

struct PatternHandle;

class PCREGEX_API Regexp {
public:
    using Expander = std::function<std::string(const MatchRecord&)>;

    // Throws CompileError
    static Regexp compile(const std::string& pattern, CompileOptions options = 0);

    Regexp(Regexp&& other) noexcept;
    Regexp& operator=(Regexp&& other) noexcept;
    Regexp(const Regexp&) = delete;
    Regexp& operator=(const Regexp&) = delete;
    ~Regexp();

    // Releases the compiled pattern and match context. Idempotent.
    void close();
    bool isClosed() const;

    // Pattern text used for compilation
    const std::string& str() const { return expr_; }

    // Number of capture groups
    int numSubexp() const;
    // Index of the group with this name, -1 if there is none
    int subexpIndex(const std::string& name) const;
    // Group names by index ("" for unnamed groups, [0] is always "")
    std::vector<std::string> subexpNames() const;

    // Match context limits; exceeding one surfaces as ExecError
    void setMatchLimit(uint32_t limit);
    void setDepthLimit(uint32_t limit);
    void setHeapLimit(uint32_t kibibytes);

    // Ordered, non-overlapping matches. With wantAll false at most one.
    std::vector<MatchRecord> search(const std::string& subject, bool wantAll) const;

    // Find family. n < 0: all matches, n == 0: none, n > 0: at most n.
    std::optional<std::string> find(const std::string& subject) const;
    std::optional<Span> findIndex(const std::string& subject) const;
    std::vector<std::string> findAll(const std::string& subject, int n) const;
    std::vector<Span> findAllIndex(const std::string& subject, int n) const;
    std::vector<std::string> findSubmatch(const std::string& subject) const;
    MatchRecord findSubmatchIndex(const std::string& subject) const;
    std::vector<std::vector<std::string>> findAllSubmatch(const std::string& subject, int n) const;
    std::vector<MatchRecord> findAllSubmatchIndex(const std::string& subject, int n) const;
    std::map<std::string, std::string> findNamedSubmatch(const std::string& subject) const;

    // True if the subject contains a match
    bool match(const std::string& subject) const;
    // True if the pattern matches the whole subject
    bool fullMatch(const std::string& subject) const;

    // Replacement. Subjects without a match come back unchanged.
    std::string replace(const std::string& src, const Expander& expand) const;
    std::string replaceAll(const std::string& src, const std::string& tmpl) const;
    std::string replaceAllFunc(const std::string& src,
                               const std::function<std::string(const std::string&)>& fn) const;
    std::string replaceAllLiteral(const std::string& src, const std::string& repl) const;

    // Expands $name, ${name}, $1, ${1} and $$ in tmpl against one match of src
    std::string expand(const std::string& tmpl, const std::string& src, const MatchRecord& match) const;

    // Substrings between matches. n as for findAll; n > 0 keeps the
    // unsplit remainder as the last element.
    std::vector<std::string> split(const std::string& s, int n) const;

    // Installs fn as the callout (nullptr removes it)
    void setCallout(CalloutFunc fn);

private:
    Regexp(std::unique_ptr<PatternHandle> handle, std::string expr);

    PatternHandle& handle() const;

    std::unique_ptr<PatternHandle> handle_;
    std::string expr_;
};

// Escapes every regex metacharacter in s
std::string quoteMeta(const std::string& s);

// Version of the linked PCRE2 library
std::string pcre2Version();

} // namespace pcregex

#ifdef PCREGEX_HAS_GLOB
#include "pcregex_glob.h"
#endif

#endif // PCREGEX_H
