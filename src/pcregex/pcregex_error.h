// pcregex - Error Types
// Copyright (c) 2026 greenteng.com
//
// Every failure the library reports is thrown as a RegexError subclass.
// "No match" and empty capture groups are ordinary results, never errors.

#ifndef PCREGEX_ERROR_H
#define PCREGEX_ERROR_H

#include <stddef.h>
#include <stdexcept>
#include <string>
#include <system_error>

namespace pcregex {

// Base of all pcregex errors; code is the PCRE2 error code, or 0
class RegexError : public std::runtime_error {
public:
    int code;
    RegexError(const std::string& msg, int c)
        : std::runtime_error(msg), code(c) {}
};

// Malformed pattern. offset is the byte in the pattern where PCRE2 gave up
// (0 means no specific position).
class CompileError : public RegexError {
public:
    size_t offset;
    std::string message;
    CompileError(const std::string& msg, int c, size_t off);
};

// pcre2_match failed for a reason other than "no match"
class ExecError : public RegexError {
public:
    explicit ExecError(int c);
};

// Glob to pattern translation failed
class ConvertError : public RegexError {
public:
    size_t offset;
    ConvertError(int c, size_t off);
};

// Glob base directory does not exist
class NotFoundError : public RegexError {
public:
    std::string path;
    explicit NotFoundError(const std::string& p)
        : RegexError("no such file or directory: " + p, 0), path(p) {}
};

// Directory listing failed during a glob walk
class WalkError : public RegexError {
public:
    std::string path;
    std::error_code error;
    WalkError(const std::string& p, std::error_code ec)
        : RegexError(p + ": " + ec.message(), 0), path(p), error(ec) {}
};

// Match data or match context could not be allocated
class ResourceError : public RegexError {
public:
    explicit ResourceError(const std::string& what);
};

// Operation on a closed or moved-from Regexp
class ClosedError : public RegexError {
public:
    ClosedError() : RegexError("regular expression is closed", 0) {}
};

// Text PCRE2 associates with an error code
std::string errorMessage(int code);

} // namespace pcregex

#endif // PCREGEX_ERROR_H
