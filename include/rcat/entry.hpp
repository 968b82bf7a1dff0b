#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace rcat {

enum class EntryKind { File, Directory };

// A node produced during traversal. Immutable once created.
struct PathEntry {
    std::filesystem::path path;   // root argument joined with rel_path
    std::string rel_path;         // relative to the walk root, '/'-separated; "" for the root
    std::string name;             // final component
    EntryKind kind = EntryKind::File;
    int depth = 0;                // 0 for the root itself
    const PathEntry* parent = nullptr;  // owning walker keeps it alive
    uint64_t size = 0;            // bytes, files only, as listed
    bool is_symlink = false;
    size_t root_index = 0;

    bool is_dir() const { return kind == EntryKind::Directory; }
    bool is_root() const { return depth == 0; }

    // Path as shown in output headers.
    std::string display() const { return path.generic_string(); }
};

enum class SkipReason {
    Hidden,
    Ignored,
    Excluded,
    Oversized,
    Binary,
    ReadError,
    Budget,
    Duplicate,
    Symlink
};

const char* skip_reason_name(SkipReason reason);

} // namespace rcat
