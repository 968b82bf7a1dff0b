#include <rcat/ignore.hpp>
#include <rcat/log.hpp>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace rcat {

// ---- IgnoreRuleSet ----

IgnoreRuleSet IgnoreRuleSet::parse(const std::string& content, std::string base_rel) {
    IgnoreRuleSet set;
    set.base_rel = std::move(base_rel);

    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (auto p = compile_pattern(line)) {
            set.patterns.push_back(std::move(*p));
        }
    }
    return set;
}

IgnoreRuleSet IgnoreRuleSet::load(const fs::path& dir, std::string base_rel) {
    fs::path file = dir / kIgnoreFileName;

    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        IgnoreRuleSet empty;
        empty.base_rel = std::move(base_rel);
        return empty;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        log::warn("cannot read %s, ignoring its rules", file.generic_string().c_str());
        IgnoreRuleSet empty;
        empty.base_rel = std::move(base_rel);
        return empty;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto set = parse(ss.str(), std::move(base_rel));
    set.source = file;
    log::debug("loaded %zu rule(s) from %s", set.patterns.size(), file.generic_string().c_str());
    return set;
}

// ---- RuleChain ----

std::shared_ptr<const RuleChain> RuleChain::extend(std::shared_ptr<const RuleChain> parent,
                                                   IgnoreRuleSet rules, int depth) {
    if (rules.empty()) return parent;
    auto node = std::make_shared<RuleChain>();
    node->parent = std::move(parent);
    node->rules = std::move(rules);
    node->depth = depth;
    return node;
}

// ---- IgnoreResolver ----

IgnoreResolver::IgnoreResolver(const std::vector<std::string>& exclude_patterns, bool include_all)
    : include_all_(include_all) {
    for (const auto& raw : exclude_patterns) {
        if (auto p = compile_pattern(raw, /*allow_negation=*/false)) {
            excludes_.push_back(std::move(*p));
        } else {
            log::debug("exclude pattern '%s' is empty, skipping", raw.c_str());
        }
    }
}

static bool is_hidden_name(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

// Path of `rel_path` relative to `base`, or nullopt when it lies outside.
static std::optional<std::string> relative_to(const std::string& rel_path, const std::string& base) {
    if (base.empty()) return rel_path;
    if (rel_path.size() > base.size() + 1 &&
        rel_path.compare(0, base.size(), base) == 0 &&
        rel_path[base.size()] == '/') {
        return rel_path.substr(base.size() + 1);
    }
    return std::nullopt;
}

bool IgnoreResolver::gitignored(const PathEntry& entry, const RuleChain* chain) {
    std::vector<const RuleChain*> links;
    for (const RuleChain* c = chain; c != nullptr; c = c->parent.get()) {
        links.push_back(c);
    }

    bool ignored = false;
    for (auto it = links.rbegin(); it != links.rend(); ++it) {
        const auto& rules = (*it)->rules;
        auto rel = relative_to(entry.rel_path, rules.base_rel);
        if (!rel) continue;
        for (const auto& p : rules.patterns) {
            if (pattern_matches(p, *rel, entry.is_dir())) {
                ignored = !p.negated;
            }
        }
    }
    return ignored;
}

bool IgnoreResolver::excluded(const PathEntry& entry) const {
    for (const auto& p : excludes_) {
        if (pattern_matches(p, entry.rel_path, entry.is_dir())) return true;
    }
    return false;
}

std::optional<SkipReason> IgnoreResolver::skip_reason(const PathEntry& entry,
                                                      const RuleChain* chain) const {
    if (entry.is_root()) return std::nullopt;

    if (!include_all_) {
        if (is_hidden_name(entry.name)) return SkipReason::Hidden;
        if (gitignored(entry, chain)) return SkipReason::Ignored;
    }
    if (excluded(entry)) return SkipReason::Excluded;
    return std::nullopt;
}

} // namespace rcat
