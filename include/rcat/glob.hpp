#pragma once

#include <optional>
#include <string>

namespace rcat {

// A compiled gitignore-style pattern.
struct Pattern {
    std::string source;     // the line as written
    std::string glob;       // body without '!', leading '/' and trailing '/'
    bool negated = false;   // leading '!'
    bool anchored = false;  // matched against the whole relative path, not the basename
    bool dir_only = false;  // trailing '/'
};

// Match a glob against a '/'-separated path.
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9], \x (literal x).
// Malformed constructs such as an unclosed '[' match literally.
bool glob_match(const std::string& glob, const std::string& path);

// Compile one gitignore line. Returns nullopt for blank lines, comments and
// lines with an empty body. With `allow_negation` false a leading '!' is
// kept as a literal character.
std::optional<Pattern> compile_pattern(const std::string& line, bool allow_negation = true);

// Does `pattern` select `rel_path` (relative to the pattern's base directory)?
// The negation flag is not applied here; callers layer negations themselves.
bool pattern_matches(const Pattern& pattern, const std::string& rel_path, bool is_directory);

// One-shot convenience: compile and match. Blank patterns match nothing.
bool matches(const std::string& pattern, const std::string& rel_path, bool is_directory);

} // namespace rcat
