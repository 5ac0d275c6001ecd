// pcregex - Error Types
// Copyright (c) 2026 greenteng.com

#include "pcregex_error.h"
#include "pcregex_core.h"

namespace pcregex {

std::string errorMessage(int code) {
    PCRE2_UCHAR buffer[256];
    int len = pcre2_get_error_message(code, buffer, sizeof(buffer));
    if (len < 0) {
        // PCRE2_ERROR_BADDATA (unknown code) or PCRE2_ERROR_NOMEMORY (truncated)
        if (len == PCRE2_ERROR_NOMEMORY) {
            return std::string(reinterpret_cast<const char*>(buffer));
        }
        return "unknown error code " + std::to_string(code);
    }
    return std::string(reinterpret_cast<const char*>(buffer), static_cast<size_t>(len));
}

static std::string withOffset(const std::string& msg, size_t offset) {
    if (offset == 0) {
        return msg;
    }
    return "offset " + std::to_string(offset) + ": " + msg;
}

CompileError::CompileError(const std::string& msg, int c, size_t off)
    : RegexError(withOffset(msg, off), c), offset(off), message(msg) {}

ExecError::ExecError(int c)
    : RegexError(errorMessage(c), c) {}

ConvertError::ConvertError(int c, size_t off)
    : RegexError(withOffset(errorMessage(c), off), c), offset(off) {}

ResourceError::ResourceError(const std::string& what)
    : RegexError("unable to allocate " + what, PCRE2_ERROR_NOMEMORY) {}

} // namespace pcregex
