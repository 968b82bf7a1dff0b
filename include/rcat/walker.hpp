#pragma once

#include <rcat/entry.hpp>
#include <rcat/ignore.hpp>
#include <rcat/result.hpp>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace rcat {

// Observers for what the walker filters out. All callbacks run on the
// thread calling Walker::next().
struct WalkCallbacks {
    std::function<void(const PathEntry&)> directory_visited;
    std::function<void(const PathEntry&, SkipReason)> skipped;
    std::function<void(const std::filesystem::path&)> ignore_file_loaded;
};

// Canonical paths already produced during a run, shared by all roots.
using VisitedSet = std::unordered_set<std::string>;

// Breadth-first enumeration of candidate files under one root.
//
// Directories are expanded in FIFO order, so every candidate at depth d is
// returned before any candidate at depth d+1. Within a directory, children
// are sorted by name. Filtered subdirectories are never listed.
class Walker {
public:
    Walker(std::filesystem::path root, size_t root_index,
           const IgnoreResolver& resolver, VisitedSet& visited,
           WalkCallbacks callbacks = {});

    Walker(const Walker&) = delete;
    Walker& operator=(const Walker&) = delete;

    // Validate the root and seed the traversal. NotFound when the root does
    // not exist, IO when it cannot be inspected or is not a file/directory.
    Status open();

    // Next candidate file, or nullopt once the root is exhausted.
    std::optional<PathEntry> next();

    const std::filesystem::path& root() const { return root_; }

private:
    struct DirTask {
        const PathEntry* dir;
        std::shared_ptr<const RuleChain> chain;
    };

    void expand(const DirTask& task);
    bool claim(const PathEntry& entry);
    void report_skip(const PathEntry& entry, SkipReason reason);

    std::filesystem::path root_;
    size_t root_index_;
    const IgnoreResolver& resolver_;
    VisitedSet& visited_;
    WalkCallbacks callbacks_;

    std::deque<PathEntry> dirs_;     // stable storage for parent pointers
    std::deque<DirTask> queue_;      // directories awaiting expansion
    std::deque<PathEntry> pending_;  // files ready to hand out
    bool opened_ = false;
};

} // namespace rcat
