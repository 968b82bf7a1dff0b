#include <rcat/walker.hpp>
#include <rcat/log.hpp>
#include <algorithm>
#include <vector>

namespace fs = std::filesystem;

namespace rcat {

Walker::Walker(fs::path root, size_t root_index,
               const IgnoreResolver& resolver, VisitedSet& visited,
               WalkCallbacks callbacks)
    : root_(std::move(root)), root_index_(root_index),
      resolver_(resolver), visited_(visited), callbacks_(std::move(callbacks)) {}

Status Walker::open() {
    std::error_code ec;
    auto st = fs::status(root_, ec);
    if (ec || !fs::exists(st)) {
        if (!ec || ec == std::errc::no_such_file_or_directory) {
            return RcatError{RcatError::NotFound,
                "path does not exist: " + root_.generic_string()};
        }
        return RcatError{RcatError::IO,
            "cannot access " + root_.generic_string() + ": " + ec.message()};
    }

    PathEntry entry;
    entry.path = root_;
    entry.name = root_.filename().string();
    entry.depth = 0;
    entry.root_index = root_index_;

    if (fs::is_regular_file(st)) {
        entry.kind = EntryKind::File;
        entry.size = fs::file_size(root_, ec);
        if (ec) entry.size = 0;
        if (claim(entry)) {
            pending_.push_back(std::move(entry));
        } else {
            report_skip(entry, SkipReason::Duplicate);
        }
    } else if (fs::is_directory(st)) {
        entry.kind = EntryKind::Directory;
        if (claim(entry)) {
            dirs_.push_back(std::move(entry));
            queue_.push_back(DirTask{&dirs_.back(), nullptr});
        } else {
            report_skip(entry, SkipReason::Duplicate);
        }
    } else {
        return RcatError{RcatError::IO,
            "not a regular file or directory: " + root_.generic_string()};
    }

    opened_ = true;
    return ok_status();
}

std::optional<PathEntry> Walker::next() {
    if (!opened_) return std::nullopt;

    while (pending_.empty()) {
        if (queue_.empty()) return std::nullopt;
        DirTask task = queue_.front();
        queue_.pop_front();
        expand(task);
    }

    PathEntry out = std::move(pending_.front());
    pending_.pop_front();
    return out;
}

void Walker::expand(const DirTask& task) {
    const PathEntry& dir = *task.dir;
    if (callbacks_.directory_visited) callbacks_.directory_visited(dir);

    // This directory's own rules apply to its children.
    std::shared_ptr<const RuleChain> chain = task.chain;
    if (resolver_.uses_gitignore()) {
        auto rules = IgnoreRuleSet::load(dir.path, dir.rel_path);
        if (!rules.empty() && callbacks_.ignore_file_loaded) {
            callbacks_.ignore_file_loaded(rules.source);
        }
        chain = RuleChain::extend(std::move(chain), std::move(rules), dir.depth);
    }

    std::error_code ec;
    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(dir.path, ec);
    if (ec) {
        log::warn("cannot list %s: %s", dir.display().c_str(), ec.message().c_str());
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            log::warn("error while listing %s: %s", dir.display().c_str(), ec.message().c_str());
            break;
        }
        children.push_back(*it);
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    std::vector<const PathEntry*> subdirs;
    for (const auto& child : children) {
        PathEntry e;
        e.name = child.path().filename().string();
        e.path = dir.path / e.name;
        e.rel_path = dir.rel_path.empty() ? e.name : dir.rel_path + "/" + e.name;
        e.depth = dir.depth + 1;
        e.parent = &dir;
        e.root_index = root_index_;

        std::error_code sec;
        auto link_status = child.symlink_status(sec);
        if (sec) {
            log::warn("cannot stat %s: %s", e.display().c_str(), sec.message().c_str());
            continue;
        }
        e.is_symlink = fs::is_symlink(link_status);

        bool dangling = false;
        fs::file_status target = link_status;
        if (e.is_symlink) {
            target = child.status(sec);
            dangling = sec || !fs::exists(target);
        }

        if (fs::is_directory(target)) {
            e.kind = EntryKind::Directory;
        } else if (fs::is_regular_file(target) || dangling) {
            e.kind = EntryKind::File;
        } else {
            log::debug("skipping special file %s", e.display().c_str());
            continue;
        }

        if (auto reason = resolver_.skip_reason(e, chain.get())) {
            report_skip(e, *reason);
            continue;
        }

        // Links are never followed into directories.
        if (e.is_symlink && (dangling || e.is_dir())) {
            report_skip(e, SkipReason::Symlink);
            continue;
        }

        if (!claim(e)) {
            report_skip(e, SkipReason::Duplicate);
            continue;
        }

        if (e.is_dir()) {
            dirs_.push_back(std::move(e));
            subdirs.push_back(&dirs_.back());
        } else {
            e.size = child.file_size(sec);
            if (sec) e.size = 0;  // the read reports the real failure
            pending_.push_back(std::move(e));
        }
    }

    for (const PathEntry* sub : subdirs) {
        queue_.push_back(DirTask{sub, chain});
    }
}

bool Walker::claim(const PathEntry& entry) {
    std::error_code ec;
    auto canonical = fs::canonical(entry.path, ec);
    std::string key = ec
        ? fs::absolute(entry.path, ec).lexically_normal().generic_string()
        : canonical.generic_string();
    return visited_.insert(key).second;
}

void Walker::report_skip(const PathEntry& entry, SkipReason reason) {
    log::trace("skip %s (%s)", entry.display().c_str(), skip_reason_name(reason));
    if (callbacks_.skipped) callbacks_.skipped(entry, reason);
}

} // namespace rcat
