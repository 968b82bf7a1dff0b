#pragma once

#include <rcat/aggregator.hpp>
#include <rcat/log.hpp>
#include <rcat/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rcat {

// Layered configuration: global > project-local > command line.
// Later layers override earlier ones field by field; exclude lists accumulate.
struct Config {
    uint64_t max_size = kDefaultMaxSize;
    uint64_t max_file_size = kDefaultMaxFileSize;
    bool include_all = false;
    bool to_stdout = false;
    unsigned threads = 0;
    log::Level log_level = log::Info;
    std::vector<std::string> excludes;

    // Track which fields were explicitly set (for merge)
    bool max_size_set = false;
    bool max_file_size_set = false;
    bool include_all_set = false;
    bool to_stdout_set = false;
    bool threads_set = false;
    bool log_level_set = false;

    // Load from a TOML file. `source` names the file in error messages.
    static Result<Config> load(const std::string& path);

    // Parse from a TOML string.
    static Result<Config> parse(const std::string& toml_str, const std::string& source = "");

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Load global and local files if they exist. A missing file is skipped;
    // a broken one is an error.
    static Result<Config> discover();

    AggregateOptions aggregate_options() const;
};

// ~/.rcat/config.toml, or "" when HOME is unset.
std::string global_config_path();

// .rcat.toml in the current directory.
std::string local_config_path();

} // namespace rcat
