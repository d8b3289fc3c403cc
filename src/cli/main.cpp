// sguid: command-line front end for the short guid codec.
//
//     sguid new [count]
//     sguid encode <uuid>...
//     sguid decode [--strict|--lenient] <short>...
//     sguid parse  [--strict|--lenient] <text>...
//     sguid sql "<query>"
//     sguid decode -- --AAAAAAAAAAAAAAAAAAAA
//
// Exit status: 0 on success, 1 if any argument failed, 2 on usage errors.

#include "args.hpp"

#include <sguid/config.hpp>
#include <sguid/log.hpp>
#include <sguid/short_guid.hpp>
#include <sguid/sql_functions.hpp>
#include <sqlite3.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace sguid;
using sguid::cli::Invocation;

enum ExitCode { EXIT_OK = 0, EXIT_FAILED = 1, EXIT_USAGE = 2 };

// Global and local files are optional; an explicit --config must exist.
static Result<Config> load_config(const Invocation& inv) {
    std::optional<Config> global, local, explicit_file;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::exists(gpath)) {
        auto r = Config::load(gpath);
        if (r.is_err()) return std::move(r).error();
        log::debug("loaded global config: %s", gpath.c_str());
        global = r.value();
    }
    std::string lpath = local_config_path();
    if (fs::exists(lpath)) {
        auto r = Config::load(lpath);
        if (r.is_err()) return std::move(r).error();
        log::debug("loaded local config: %s", lpath.c_str());
        local = r.value();
    }
    if (inv.config_path) {
        auto r = Config::load(*inv.config_path);
        if (r.is_err()) return std::move(r).error();
        log::debug("loaded config: %s", inv.config_path->c_str());
        explicit_file = r.value();
    }
    return Result<Config>::ok(Config::effective(global, local, explicit_file));
}

static void print_id(const ShortGuid& g, OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::Short:
            std::printf("%s\n", g.value().c_str());
            break;
        case OutputFormat::Long:
            std::printf("%s\n", g.uuid().to_string().c_str());
            break;
        case OutputFormat::Both:
            std::printf("%s %s\n", g.value().c_str(), g.uuid().to_string().c_str());
            break;
    }
}

static int cmd_new(const Invocation& inv, const Config& cfg) {
    long count = 1;
    if (!inv.args.empty()) {
        char* end = nullptr;
        count = std::strtol(inv.args[0].c_str(), &end, 10);
        if (*end != '\0' || count < 1) {
            log::report(SguidError{SguidError::InvalidArg,
                "invalid count: " + inv.args[0], "expected a positive integer"});
            return EXIT_USAGE;
        }
    }
    for (long i = 0; i < count; ++i) {
        print_id(ShortGuid::new_guid(), cfg.output);
    }
    return EXIT_OK;
}

static int cmd_encode(const Invocation& inv) {
    int rc = EXIT_OK;
    for (const auto& arg : inv.args) {
        auto id = Uuid::from_string(arg);
        if (id.is_err()) {
            log::report(id.error());
            rc = EXIT_FAILED;
            continue;
        }
        std::printf("%s\n", encode(id.value()).c_str());
    }
    return rc;
}

static int cmd_decode(const Invocation& inv, Strictness strictness) {
    int rc = EXIT_OK;
    for (const auto& arg : inv.args) {
        auto id = decode(arg, strictness);
        if (id.is_err()) {
            log::report(id.error());
            rc = EXIT_FAILED;
            continue;
        }
        std::printf("%s\n", id.value().to_string().c_str());
    }
    return rc;
}

static int cmd_parse(const Invocation& inv, const Config& cfg, Strictness strictness) {
    int rc = EXIT_OK;
    for (const auto& arg : inv.args) {
        auto g = parse_short_guid(arg, strictness);
        if (g.is_err()) {
            log::report(g.error());
            rc = EXIT_FAILED;
            continue;
        }
        if (arg.empty()) {
            log::warn("empty input parsed as the nil identifier");
        }
        print_id(g.value(), cfg.output);
    }
    return rc;
}

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};

struct StmtFinalizer {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

static void print_column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_NULL:
            std::printf("NULL");
            break;
        case SQLITE_BLOB: {
            auto* p = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
            int n = sqlite3_column_bytes(stmt, col);
            std::printf("x'");
            for (int i = 0; i < n; ++i) std::printf("%02x", p[i]);
            std::printf("'");
            break;
        }
        default:
            std::printf("%s", reinterpret_cast<const char*>(sqlite3_column_text(stmt, col)));
            break;
    }
}

static Status run_sql(const std::string& query) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open(":memory:", &raw);
    std::unique_ptr<sqlite3, DbCloser> db(raw);
    if (rc != SQLITE_OK) {
        return SguidError{SguidError::Database,
            std::string("failed to open in-memory database: ") +
            (raw ? sqlite3_errmsg(raw) : "out of memory")};
    }
    SGUID_TRY(sql::register_functions(db.get()));

    sqlite3_stmt* stmt_raw = nullptr;
    rc = sqlite3_prepare_v2(db.get(), query.c_str(), -1, &stmt_raw, nullptr);
    std::unique_ptr<sqlite3_stmt, StmtFinalizer> stmt(stmt_raw);
    if (rc != SQLITE_OK) {
        return SguidError{SguidError::Database,
            std::string("SQLite prepare failed: ") + sqlite3_errmsg(db.get())};
    }

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        int cols = sqlite3_column_count(stmt.get());
        for (int c = 0; c < cols; ++c) {
            if (c > 0) std::printf("|");
            print_column(stmt.get(), c);
        }
        std::printf("\n");
    }
    if (rc != SQLITE_DONE) {
        return SguidError{SguidError::Database,
            std::string("SQLite query failed: ") + sqlite3_errmsg(db.get())};
    }
    return ok_status();
}

static int cmd_sql(const Invocation& inv) {
    if (inv.args.size() != 1) {
        log::report(SguidError{SguidError::InvalidArg,
            "sql expects exactly one query argument",
            "example: sguid sql \"SELECT encode_short_guid('c9a646d3-9c61-4cb7-bfcd-ee2522c8f633')\""});
        return EXIT_USAGE;
    }
    auto st = run_sql(inv.args[0]);
    if (st.is_err()) {
        log::report(st.error());
        return EXIT_FAILED;
    }
    return EXIT_OK;
}

int main(int argc, char** argv) {
    auto inv_r = cli::parse_args(argc, argv);
    if (inv_r.is_err()) {
        log::report(inv_r.error());
        return EXIT_USAGE;
    }
    const Invocation& inv = inv_r.value();

    if (inv.help || inv.command.empty()) {
        std::fputs(cli::USAGE, inv.help ? stdout : stderr);
        return inv.help ? EXIT_OK : EXIT_USAGE;
    }

    if (inv.no_color) log::set_color_enabled(false);
    if (inv.level) log::set_level(*inv.level);

    auto cfg_r = load_config(inv);
    if (cfg_r.is_err()) {
        log::report(cfg_r.error());
        return EXIT_FAILED;
    }
    const Config& cfg = cfg_r.value();

    // Command-line flags win over the config files
    if (!inv.level) log::set_level(cfg.log_level);
    if (!inv.no_color && cfg.color) log::set_color_enabled(*cfg.color);
    Strictness strictness = inv.strictness.value_or(cfg.strictness);
    log::debug("strictness: %s, output: %s",
               strictness_name(strictness), output_format_name(cfg.output));

    if (inv.command == "new") return cmd_new(inv, cfg);

    if (inv.command == "sql") return cmd_sql(inv);

    if (inv.args.empty()) {
        log::report(SguidError{SguidError::InvalidArg,
            inv.command + " expects at least one argument",
            "run 'sguid --help' for usage"});
        return EXIT_USAGE;
    }
    if (inv.command == "encode") return cmd_encode(inv);
    if (inv.command == "decode") return cmd_decode(inv, strictness);
    if (inv.command == "parse") return cmd_parse(inv, cfg, strictness);

    log::report(SguidError{SguidError::InvalidArg,
        "unknown command: " + inv.command, "run 'sguid --help' for usage"});
    return EXIT_USAGE;
}
