#pragma once

#include <rcat/entry.hpp>
#include <rcat/glob.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rcat {

// Name of the per-directory rule file.
inline constexpr const char* kIgnoreFileName = ".gitignore";

// Rules from one directory's .gitignore, scoped to that directory.
struct IgnoreRuleSet {
    std::string base_rel;           // directory relative to the walk root ("" = root)
    std::filesystem::path source;   // file the rules came from (empty when parsed from text)
    std::vector<Pattern> patterns;  // in file order

    bool empty() const { return patterns.empty(); }

    static IgnoreRuleSet parse(const std::string& content, std::string base_rel);

    // Load `dir/.gitignore`. A missing file yields an empty set; an
    // unreadable one yields an empty set and a warning.
    static IgnoreRuleSet load(const std::filesystem::path& dir, std::string base_rel);
};

// Immutable link in the chain of rule sets from the walk root down to a
// directory. Siblings share their ancestors; a chain is released when the
// last directory of its subtree has been expanded.
struct RuleChain {
    std::shared_ptr<const RuleChain> parent;
    IgnoreRuleSet rules;
    int depth = 0;

    // Chain for a child directory: `parent` extended with `rules`, or
    // `parent` itself when `rules` is empty.
    static std::shared_ptr<const RuleChain> extend(std::shared_ptr<const RuleChain> parent,
                                                   IgnoreRuleSet rules, int depth);
};

class IgnoreResolver {
public:
    // `exclude_patterns` are always active; `include_all` bypasses hidden
    // and gitignore filtering but not the excludes.
    IgnoreResolver(const std::vector<std::string>& exclude_patterns, bool include_all);

    bool include_all() const { return include_all_; }
    bool uses_gitignore() const { return !include_all_; }

    // Why `entry` must be skipped, or nullopt when it survives. `chain` is the
    // rule chain of the directory containing `entry`. Roots are never skipped.
    std::optional<SkipReason> skip_reason(const PathEntry& entry, const RuleChain* chain) const;

    bool should_skip(const PathEntry& entry, const RuleChain* chain) const {
        return skip_reason(entry, chain).has_value();
    }

    // Last-match-wins evaluation of the chain, shallow rule sets first.
    static bool gitignored(const PathEntry& entry, const RuleChain* chain);

private:
    bool excluded(const PathEntry& entry) const;

    std::vector<Pattern> excludes_;
    bool include_all_;
};

} // namespace rcat
