// pcregex - Glob Support
// Copyright (c) 2026 greenteng.com
//
// Globs are translated to patterns by pcre2_pattern_convert. glob() then
// either lists one directory or walks a tree, depending on whether the
// glob contains "**".

#include "pcregex_core.h"

#ifdef PCREGEX_HAS_GLOB

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace pcregex {

// ============================================================================
// Translation
// ============================================================================

std::string convertGlob(const std::string& glob) {
    pcre2_convert_context* cvctx = pcre2_convert_context_create(NULL);
    if (!cvctx) {
        throw ResourceError("convert context");
    }
    pcre2_set_glob_separator(cvctx, PCREGEX_PATH_SEPARATOR);

    PCRE2_UCHAR* buffer = NULL;
    PCRE2_SIZE blength = 0;
    int rc = pcre2_pattern_convert(reinterpret_cast<PCRE2_SPTR>(glob.data()), glob.size(),
                                   PCRE2_CONVERT_GLOB, &buffer, &blength, cvctx);
    pcre2_convert_context_free(cvctx);

    if (rc != 0) {
        // On failure blength holds the offset of the error in the glob
        PCREGEX_LOG("glob conversion failed at offset %zu: %s", static_cast<size_t>(blength), glob.c_str());
        throw ConvertError(rc, blength);
    }

    std::string pattern(reinterpret_cast<const char*>(buffer), blength);
    pcre2_converted_pattern_free(buffer);
    return pattern;
}

Regexp compileGlob(const std::string& glob) {
    return Regexp::compile(convertGlob(glob));
}

// ============================================================================
// Filesystem helpers
// ============================================================================

static bool hasGlobChars(const std::string& s) {
    return s.find_first_of("*[]?") != std::string::npos;
}

// lstat-style: symlinks are not followed
static fs::file_type entryType(const std::string& path) {
    std::error_code ec;
    return fs::symlink_status(path, ec).type();
}

static bool entryExists(const std::string& path) {
    fs::file_type type = entryType(path);
    return type != fs::file_type::not_found && type != fs::file_type::none;
}

static std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == PCREGEX_PATH_SEPARATOR) {
        return dir + name;
    }
    return dir + PCREGEX_PATH_SEPARATOR + name;
}

// Entry names of one directory, sorted
static std::vector<std::string> listNames(const std::string& dir) {
    const std::string path = dir.empty() ? "." : dir;

    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        PCREGEX_LOG("cannot list %s: %s", path.c_str(), ec.message().c_str());
        throw WalkError(path, ec);
    }

    std::vector<std::string> names;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        PCREGEX_LOG("cannot list %s: %s", path.c_str(), ec.message().c_str());
        throw WalkError(path, ec);
    }

    std::sort(names.begin(), names.end());
    return names;
}

// Pre-order walk below dir, which itself has already been tested
static void walkTree(const Regexp& re, const std::string& dir, std::vector<std::string>& matches) {
    for (const std::string& name : listNames(dir)) {
        std::string path = joinPath(dir, name);
        if (re.match(path)) {
            matches.push_back(path);
        }
        if (entryType(path) == fs::file_type::directory) {
            walkTree(re, path, matches);
        }
    }
}

// Leading glob-free segments of the glob; "" means the current directory
static std::string baseDirectory(const std::string& globText) {
    std::string dir;
    size_t pos = 0;
    while (pos <= globText.size()) {
        size_t sep = globText.find(PCREGEX_PATH_SEPARATOR, pos);
        if (sep == std::string::npos) {
            sep = globText.size();
        }
        std::string segment = globText.substr(pos, sep - pos);
        if (hasGlobChars(segment)) {
            break;
        }
        if (!segment.empty()) {
            dir = joinPath(dir, segment);
        }
        pos = sep + 1;
    }

    if (!globText.empty() && globText[0] == PCREGEX_PATH_SEPARATOR) {
        dir = PCREGEX_PATH_SEPARATOR_STR + dir;
    }
    return dir;
}

// ============================================================================
// glob
// ============================================================================

std::vector<std::string> glob(const std::string& globText) {
    std::vector<std::string> matches;
    if (globText.empty()) {
        return matches;
    }

    // An existing path is its own only match
    if (entryExists(globText)) {
        matches.push_back(globText);
        return matches;
    }

    if (!hasGlobChars(globText)) {
        return matches;
    }

    std::string dir = baseDirectory(globText);
    if (!dir.empty() && !entryExists(dir)) {
        throw NotFoundError(dir);
    }

    Regexp re = compileGlob(globText);
    bool recursive = globText.find("**") != std::string::npos;
    PCREGEX_LOG("glob %s: base '%s', %s", globText.c_str(), dir.c_str(), recursive ? "recursive" : "flat");

    if (recursive) {
        if (!dir.empty()) {
            if (re.match(dir)) {
                matches.push_back(dir);
            }
            if (entryType(dir) == fs::file_type::directory) {
                walkTree(re, dir, matches);
            }
        } else {
            walkTree(re, dir, matches);
        }
    } else {
        for (const std::string& name : listNames(dir)) {
            std::string path = joinPath(dir, name);
            if (re.match(path)) {
                matches.push_back(path);
            }
        }
    }

    re.close();
    return matches;
}

} // namespace pcregex

#endif // PCREGEX_HAS_GLOB
