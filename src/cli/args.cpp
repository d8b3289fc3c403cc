#include "args.hpp"

namespace sguid::cli {

const char USAGE[] =
    "usage: sguid [options] <command> [--] [args]\n"
    "\n"
    "commands:\n"
    "  new [count]                       generate fresh identifiers\n"
    "  encode <uuid>...                  canonical UUID -> short guid\n"
    "  decode [--strict|--lenient] <s>   short guid -> canonical UUID\n"
    "  parse  [--strict|--lenient] <s>   either form -> both forms\n"
    "  sql <query>                       run a query with the SQL functions\n"
    "\n"
    "options:\n"
    "  --config <path>   extra config file (overrides ~/.sguid/config.toml\n"
    "                    and ./.sguid.toml)\n"
    "  -v, --verbose     debug logging\n"
    "  -q, --quiet       errors only\n"
    "  --no-color        disable colored log output\n"
    "  -h, --help        show this help\n"
    "  --                treat every later word as an argument; needed for\n"
    "                    short guids that start with \"--\"\n";

Result<Invocation> parse_args(int argc, const char* const* argv) {
    Invocation inv;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            inv.help = true;
        } else if (a == "-v" || a == "--verbose") {
            inv.level = log::Debug;
        } else if (a == "-q" || a == "--quiet") {
            inv.level = log::Error;
        } else if (a == "--no-color") {
            inv.no_color = true;
        } else if (a == "--strict") {
            inv.strictness = Strictness::Strict;
        } else if (a == "--lenient") {
            inv.strictness = Strictness::Lenient;
        } else if (a == "--config") {
            if (i + 1 >= argc) {
                return SguidError{SguidError::InvalidArg,
                    "--config requires a path", "usage: sguid --config <path> ..."};
            }
            inv.config_path = argv[++i];
        } else if (a == "--") {
            for (++i; i < argc; ++i) inv.args.push_back(argv[i]);
        } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            std::string hint = "run 'sguid --help' for usage";
            if (a.size() == SHORT_GUID_LENGTH) {
                hint = "if '" + a + "' is a short guid, pass it after '--'";
            }
            return SguidError{SguidError::InvalidArg, "unknown option: " + a, hint};
        } else if (inv.command.empty()) {
            inv.command = a;
        } else {
            // Short guids may start with '-', so a single dash is an argument
            inv.args.push_back(a);
        }
    }
    return Result<Invocation>::ok(std::move(inv));
}

} // namespace sguid::cli
