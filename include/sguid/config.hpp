#pragma once

#include <sguid/log.hpp>
#include <sguid/result.hpp>
#include <sguid/short_guid.hpp>
#include <optional>
#include <string>

namespace sguid {

// Which textual forms the CLI prints for an identifier.
enum class OutputFormat { Short, Long, Both };

const char* output_format_name(OutputFormat fmt);
Result<OutputFormat> output_format_from_string(const std::string& name);

// Layered configuration: global > local > explicit --config file.
// Later layers override only the fields they set.
struct Config {
    Strictness strictness = Strictness::Strict;
    OutputFormat output = OutputFormat::Both;
    log::Level log_level = log::Info;
    std::optional<bool> color;  // unset: color when stderr is a TTY

    // Track which fields were explicitly set (for merge)
    bool strictness_set = false;
    bool output_set = false;
    bool log_level_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local,
                            const std::optional<Config>& explicit_file);
};

// ~/.sguid/config.toml, or "" when no home directory is known.
std::string global_config_path();

// .sguid.toml in the current directory.
std::string local_config_path();

} // namespace sguid
