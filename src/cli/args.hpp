#pragma once

#include <sguid/log.hpp>
#include <sguid/result.hpp>
#include <sguid/short_guid.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sguid::cli {

extern const char USAGE[];

struct Invocation {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> config_path;
    std::optional<Strictness> strictness;
    std::optional<log::Level> level;
    bool no_color = false;
    bool help = false;
};

// Everything after a bare "--" is an argument, even if it looks like an
// option. Short guids may begin with "--".
Result<Invocation> parse_args(int argc, const char* const* argv);

} // namespace sguid::cli
