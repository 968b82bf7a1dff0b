#include <rcat/config.hpp>
#include <rcat/size.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace rcat {

static RcatError config_error(const std::string& source, const std::string& msg) {
    return RcatError{RcatError::Config, msg, "", source, 0};
}

// Size values may be written as strings ("5MB") or plain byte counts.
static Result<std::optional<uint64_t>> read_size(const toml::table& tbl, const char* key,
                                                 const std::string& source) {
    auto node = tbl[key];
    if (!node) return Result<std::optional<uint64_t>>::ok(std::nullopt);

    if (auto s = node.as_string()) {
        auto parsed = parse_size(s->get());
        if (parsed.is_err()) {
            return config_error(source, std::string(key) + ": " + parsed.error().message);
        }
        return Result<std::optional<uint64_t>>::ok(parsed.value());
    }
    if (auto n = node.as_integer()) {
        if (n->get() <= 0) {
            return config_error(source, std::string(key) + ": size must be greater than 0");
        }
        return Result<std::optional<uint64_t>>::ok(static_cast<uint64_t>(n->get()));
    }
    return config_error(source, std::string(key) + ": expected a size string or integer");
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return RcatError{RcatError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [limits] section
    if (auto limits = doc["limits"].as_table()) {
        std::optional<uint64_t> v;
        RCAT_TRY_ASSIGN(v, read_size(*limits, "max-size", source));
        if (v) {
            cfg.max_size = *v;
            cfg.max_size_set = true;
        }
        RCAT_TRY_ASSIGN(v, read_size(*limits, "max-file-size", source));
        if (v) {
            cfg.max_file_size = *v;
            cfg.max_file_size_set = true;
        }
    }

    // [filter] section
    if (auto filter = doc["filter"].as_table()) {
        if (auto v = (*filter)["all"].value<bool>()) {
            cfg.include_all = *v;
            cfg.include_all_set = true;
        }
        if (auto excl = (*filter)["exclude"].as_array()) {
            for (const auto& item : *excl) {
                auto s = item.value_exact<std::string>();
                if (!s) return config_error(source, "filter.exclude: entries must be strings");
                cfg.excludes.push_back(*s);
            }
        } else if (auto s = (*filter)["exclude"].value<std::string>()) {
            cfg.excludes.push_back(*s);
        }
    }

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto v = (*output)["stdout"].value<bool>()) {
            cfg.to_stdout = *v;
            cfg.to_stdout_set = true;
        }
    }

    // [run] section
    if (auto run = doc["run"].as_table()) {
        if (auto v = (*run)["threads"].value<int64_t>()) {
            if (*v < 0) return config_error(source, "run.threads: must not be negative");
            cfg.threads = static_cast<unsigned>(*v);
            cfg.threads_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                auto err = std::move(lvl).error();
                err.file = source;
                return err;
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RcatError{RcatError::IO, "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.max_size_set) {
        max_size = other.max_size;
        max_size_set = true;
    }
    if (other.max_file_size_set) {
        max_file_size = other.max_file_size;
        max_file_size_set = true;
    }
    if (other.include_all_set) {
        include_all = other.include_all;
        include_all_set = true;
    }
    if (other.to_stdout_set) {
        to_stdout = other.to_stdout;
        to_stdout_set = true;
    }
    if (other.threads_set) {
        threads = other.threads;
        threads_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }

    // Excludes accumulate
    excludes.insert(excludes.end(), other.excludes.begin(), other.excludes.end());
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

static Result<std::optional<Config>> load_if_present(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    log::debug("loaded config %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

Result<Config> Config::discover() {
    std::optional<Config> global;
    std::optional<Config> local;
    RCAT_TRY_ASSIGN(global, load_if_present(global_config_path()));
    RCAT_TRY_ASSIGN(local, load_if_present(local_config_path()));
    return Result<Config>::ok(effective(global, local));
}

AggregateOptions Config::aggregate_options() const {
    AggregateOptions opts;
    opts.include_all = include_all;
    opts.max_total_size = max_size;
    opts.max_file_size = max_file_size;
    opts.exclude_patterns = excludes;
    opts.threads = threads;
    return opts;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.rcat/config.toml";
}

std::string local_config_path() {
    return ".rcat.toml";
}

} // namespace rcat
