#include <sguid/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sguid {

const char* output_format_name(OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::Short: return "short";
        case OutputFormat::Long:  return "long";
        case OutputFormat::Both:  return "both";
    }
    return "unknown";
}

Result<OutputFormat> output_format_from_string(const std::string& name) {
    if (name == "short") return Result<OutputFormat>::ok(OutputFormat::Short);
    if (name == "long")  return Result<OutputFormat>::ok(OutputFormat::Long);
    if (name == "both")  return Result<OutputFormat>::ok(OutputFormat::Both);
    return SguidError(SguidError::Config,
        "unknown output format '" + name + "'",
        "expected one of: short, long, both");
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SguidError{SguidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [decode] section
    if (auto decode = doc["decode"].as_table()) {
        if (auto v = (*decode)["strict"].value_exact<bool>()) {
            cfg.strictness = *v ? Strictness::Strict : Strictness::Lenient;
            cfg.strictness_set = true;
        } else if ((*decode)["strict"]) {
            return SguidError{SguidError::Config,
                "[decode] strict must be a boolean"};
        }
    }

    // [output] section
    if (auto output = doc["output"].as_table()) {
        if (auto v = (*output)["format"].value<std::string>()) {
            auto fmt = output_format_from_string(*v);
            if (fmt.is_err()) return std::move(fmt).error();
            cfg.output = fmt.value();
            cfg.output_set = true;
        } else if ((*output)["format"]) {
            return SguidError{SguidError::Config,
                "[output] format must be a string"};
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::level_from_string(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        } else if ((*lg)["level"]) {
            return SguidError{SguidError::Config,
                "[log] level must be a string"};
        }
        if (auto v = (*lg)["color"].value_exact<bool>()) {
            cfg.color = *v;
        } else if ((*lg)["color"]) {
            return SguidError{SguidError::Config,
                "[log] color must be a boolean"};
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SguidError{SguidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        SguidError err = std::move(cfg).error();
        err.hint = "in " + path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.strictness_set) {
        strictness = other.strictness;
        strictness_set = true;
    }
    if (other.output_set) {
        output = other.output;
        output_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color.has_value()) {
        color = other.color;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.sguid/config.toml";
}

std::string local_config_path() {
    return ".sguid.toml";
}

} // namespace sguid
