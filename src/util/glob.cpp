#include <rcat/glob.hpp>
#include <vector>

namespace rcat {

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

static std::string basename_of(const std::string& rel_path) {
    auto pos = rel_path.find_last_of('/');
    return pos == std::string::npos ? rel_path : rel_path.substr(pos + 1);
}

// Try to match a character class starting at pat[pi] == '['.
// On success sets `next` to the index just past ']' and `hit` to whether
// `c` is in the class. Returns false when the class is unterminated.
static bool match_class(const std::string& pat, size_t pi, char c,
                        size_t& next, bool& hit) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        i++;
    }
    bool matched = false;
    bool first = true;
    while (i < pat.size() && (pat[i] != ']' || first)) {
        first = false;
        char lo = pat[i];
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            char hi = pat[i + 2];
            if (c >= lo && c <= hi) matched = true;
            i += 3;
        } else {
            if (c == lo) matched = true;
            i++;
        }
    }
    if (i >= pat.size()) return false;
    next = i + 1;
    hit = negate ? !matched : matched;
    return true;
}

// Match a single segment against a pattern segment (no '/' in either).
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (si >= str.size()) return false;

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            size_t next = 0;
            bool hit = false;
            if (match_class(pat, pi, str[si], next, hit)) {
                if (!hit) return false;
                pi = next;
                si++;
                continue;
            }
            // Unterminated class: '[' is literal
        }

        if (pc == '\\' && pi + 1 < pat.size()) {
            pi++;
            pc = pat[pi];
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }
    return si == str.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) return true;
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_segment(ps, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    // Path used up. Leftover '**' may match nothing, except a trailing one
    // after a literal segment: "dir/**" selects what is inside dir, not dir.
    const size_t rest = pi;
    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
    if (si == path_segs.size() && pi == pat_segs.size() && rest < pi && rest > 0 &&
        pat_segs[rest - 1] != "**") {
        return false;
    }

    return pi == pat_segs.size() && si == path_segs.size();
}

// ---- Public API ----

bool glob_match(const std::string& glob, const std::string& path) {
    auto pat_segs = split_segments(normalize_path(glob));
    auto path_segs = split_segments(normalize_path(path));
    return match_segments(pat_segs, 0, path_segs, 0);
}

std::optional<Pattern> compile_pattern(const std::string& line, bool allow_negation) {
    std::string body = line;

    // Strip CR and unescaped trailing whitespace
    while (!body.empty() && (body.back() == '\r' || body.back() == '\n')) body.pop_back();
    while (!body.empty() && (body.back() == ' ' || body.back() == '\t')) {
        if (body.size() >= 2 && body[body.size() - 2] == '\\') {
            // "\ " keeps the space; drop the escape
            body.erase(body.size() - 2, 1);
            break;
        }
        body.pop_back();
    }

    if (body.empty() || body[0] == '#') return std::nullopt;

    Pattern p;
    p.source = line;

    if (allow_negation && body[0] == '!') {
        p.negated = true;
        body.erase(0, 1);
    } else if (body.size() >= 2 && body[0] == '\\' && (body[1] == '!' || body[1] == '#')) {
        body.erase(0, 1);
    }

    if (!body.empty() && body.back() == '/') {
        p.dir_only = true;
        while (!body.empty() && body.back() == '/') body.pop_back();
    }

    if (!body.empty() && body[0] == '/') {
        p.anchored = true;
        while (!body.empty() && body[0] == '/') body.erase(0, 1);
    } else if (body.find('/') != std::string::npos) {
        // A slash in the middle anchors the pattern to its base directory
        p.anchored = true;
    }

    if (body.empty()) return std::nullopt;

    p.glob = std::move(body);
    return p;
}

bool pattern_matches(const Pattern& pattern, const std::string& rel_path, bool is_directory) {
    if (pattern.dir_only && !is_directory) return false;
    if (rel_path.empty()) return false;

    if (pattern.anchored) {
        return glob_match(pattern.glob, rel_path);
    }
    return glob_match(pattern.glob, basename_of(rel_path));
}

bool matches(const std::string& pattern, const std::string& rel_path, bool is_directory) {
    auto compiled = compile_pattern(pattern);
    if (!compiled) return false;
    return pattern_matches(*compiled, rel_path, is_directory);
}

} // namespace rcat
