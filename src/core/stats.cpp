#include <rcat/stats.hpp>
#include <rcat/size.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace rcat {

void Statistics::record_skip(const PathEntry& entry, SkipReason reason) {
    if (entry.is_dir()) {
        skipped_dirs[reason]++;
    } else {
        skipped_files[reason]++;
    }
}

void Statistics::record_extension(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext.size() < 2) return;
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    extensions[ext]++;
}

static uint64_t lookup(const std::map<SkipReason, uint64_t>& m, SkipReason reason) {
    auto it = m.find(reason);
    return it == m.end() ? 0 : it->second;
}

static uint64_t sum(const std::map<SkipReason, uint64_t>& m) {
    uint64_t total = 0;
    for (const auto& kv : m) total += kv.second;
    return total;
}

uint64_t Statistics::skipped(SkipReason reason) const {
    return lookup(skipped_files, reason);
}

uint64_t Statistics::dirs_skipped(SkipReason reason) const {
    return lookup(skipped_dirs, reason);
}

uint64_t Statistics::total_skipped_files() const {
    return sum(skipped_files);
}

uint64_t Statistics::total_skipped_dirs() const {
    return sum(skipped_dirs);
}

bool Statistics::same_counts(const Statistics& o) const {
    return files_processed == o.files_processed &&
           text_files == o.text_files &&
           binary_files == o.binary_files &&
           read_errors == o.read_errors &&
           directories_visited == o.directories_visited &&
           output_bytes == o.output_bytes &&
           truncated == o.truncated &&
           skipped_files == o.skipped_files &&
           skipped_dirs == o.skipped_dirs &&
           ignore_files == o.ignore_files &&
           extensions == o.extensions;
}

std::string Statistics::summary() const {
    double secs = std::chrono::duration<double>(elapsed).count();
    std::vector<std::string> lines;
    char buf[256];

    std::snprintf(buf, sizeof(buf), "Processed %llu files and %llu directories in %.2fs",
                  static_cast<unsigned long long>(files_processed),
                  static_cast<unsigned long long>(directories_visited), secs);
    lines.emplace_back(buf);

    if (!ignore_files.empty()) {
        std::string line = "Using .gitignore: ";
        for (size_t i = 0; i < ignore_files.size(); i++) {
            if (i > 0) line += ", ";
            line += ignore_files[i];
        }
        lines.push_back(line);
    }

    if (files_processed + binary_files + read_errors > 0) {
        std::snprintf(buf, sizeof(buf), "Files: %llu text, %llu binary, %llu unreadable",
                      static_cast<unsigned long long>(text_files),
                      static_cast<unsigned long long>(binary_files),
                      static_cast<unsigned long long>(read_errors));
        lines.emplace_back(buf);
    }

    uint64_t skipped_f = total_skipped_files();
    uint64_t skipped_d = total_skipped_dirs();
    if (skipped_f + skipped_d > 0) {
        std::map<SkipReason, uint64_t> by_reason = skipped_files;
        for (const auto& [reason, n] : skipped_dirs) by_reason[reason] += n;

        std::string reasons;
        for (const auto& [reason, n] : by_reason) {
            if (n == 0) continue;
            if (!reasons.empty()) reasons += ", ";
            reasons += std::to_string(n) + " " + skip_reason_name(reason);
        }
        std::snprintf(buf, sizeof(buf), "Skipped: %llu files, %llu directories (",
                      static_cast<unsigned long long>(skipped_f),
                      static_cast<unsigned long long>(skipped_d));
        lines.push_back(std::string(buf) + reasons + ")");
    }

    if (!extensions.empty()) {
        std::vector<std::pair<std::string, uint64_t>> top(extensions.begin(), extensions.end());
        std::stable_sort(top.begin(), top.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (top.size() > 10) top.resize(10);

        std::string line = "Top extensions: ";
        for (size_t i = 0; i < top.size(); i++) {
            if (i > 0) line += ", ";
            line += "." + top[i].first + " (" + std::to_string(top[i].second) + ")";
        }
        lines.push_back(line);
    }

    if (secs > 0.0) {
        double files_per_sec = static_cast<double>(files_processed) / secs;
        double mb_per_sec = static_cast<double>(output_bytes) / static_cast<double>(kMiB) / secs;
        std::snprintf(buf, sizeof(buf), "Speed: %.0f files/sec, %.2f MB/sec", files_per_sec, mb_per_sec);
        lines.emplace_back(buf);
    }

    if (truncated) {
        lines.push_back("Output truncated: total size limit reached");
    }

    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

} // namespace rcat
