// pcregex - Glob Support
// Copyright (c) 2026 greenteng.com
//
// Shell-style globs translated by PCRE2 and matched against the filesystem

#ifndef PCREGEX_GLOB_H
#define PCREGEX_GLOB_H

#include <string>
#include <vector>

namespace pcregex {

class Regexp;

// Translates a glob into a PCRE2 pattern using the platform path
// separator. Throws ConvertError.
std::string convertGlob(const std::string& glob);

// convertGlob followed by Regexp::compile
Regexp compileGlob(const std::string& glob);

// Paths matching the glob, in lexical order. A glob containing "**" walks
// the whole tree below its base directory, which can be slow.
// Throws NotFoundError if the base directory is missing, WalkError if a
// directory cannot be listed.
std::vector<std::string> glob(const std::string& globText);

} // namespace pcregex

#endif // PCREGEX_GLOB_H
