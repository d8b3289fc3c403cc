#include <sguid/sql_functions.hpp>
#include <sguid/short_guid.hpp>
#include <sqlite3.h>

#include <string>

namespace sguid::sql {

static std::string text_arg(sqlite3_value* v) {
    const unsigned char* p = sqlite3_value_text(v);
    int n = sqlite3_value_bytes(v);
    return p ? std::string(reinterpret_cast<const char*>(p), static_cast<size_t>(n))
             : std::string();
}

static void result_error(sqlite3_context* ctx, const SguidError& err) {
    sqlite3_result_error(ctx, err.message.c_str(), -1);
}

static void encode_fn(sqlite3_context* ctx, int, sqlite3_value** argv) {
    switch (sqlite3_value_type(argv[0])) {
        case SQLITE_NULL:
            sqlite3_result_null(ctx);
            return;
        case SQLITE_BLOB: {
            if (sqlite3_value_bytes(argv[0]) != 16) {
                sqlite3_result_error(ctx,
                    "encode_short_guid: BLOB argument must be 16 bytes", -1);
                return;
            }
            auto* raw = static_cast<const uint8_t*>(sqlite3_value_blob(argv[0]));
            std::string out = encode(Uuid::from_guid_bytes(raw));
            sqlite3_result_text(ctx, out.c_str(), static_cast<int>(out.size()),
                                SQLITE_TRANSIENT);
            return;
        }
        case SQLITE_TEXT: {
            auto id = Uuid::from_string(text_arg(argv[0]));
            if (id.is_err()) {
                result_error(ctx, id.error());
                return;
            }
            std::string out = encode(id.value());
            sqlite3_result_text(ctx, out.c_str(), static_cast<int>(out.size()),
                                SQLITE_TRANSIENT);
            return;
        }
        default:
            sqlite3_result_error(ctx,
                "encode_short_guid: expected a 16-byte BLOB or UUID TEXT", -1);
            return;
    }
}

static void decode_fn(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    auto id = decode(text_arg(argv[0]), Strictness::Lenient);
    if (id.is_err()) {
        result_error(ctx, id.error());
        return;
    }
    auto raw = id.value().to_guid_bytes();
    sqlite3_result_blob(ctx, raw.data(), static_cast<int>(raw.size()), SQLITE_TRANSIENT);
}

static void to_uuid_fn(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    auto id = decode(text_arg(argv[0]), Strictness::Lenient);
    if (id.is_err()) {
        result_error(ctx, id.error());
        return;
    }
    std::string out = id.value().to_string();
    sqlite3_result_text(ctx, out.c_str(), static_cast<int>(out.size()), SQLITE_TRANSIENT);
}

Status register_functions(sqlite3* db) {
    if (!db) {
        return SguidError(SguidError::InvalidArg, "no database connection");
    }

    struct Entry {
        const char* name;
        void (*fn)(sqlite3_context*, int, sqlite3_value**);
    };
    static const Entry entries[] = {
        {"encode_short_guid", encode_fn},
        {"decode_short_guid", decode_fn},
        {"short_guid_to_uuid", to_uuid_fn},
    };

    for (const auto& e : entries) {
        int rc = sqlite3_create_function_v2(db, e.name, 1,
            SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
            e.fn, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            return SguidError(SguidError::Database,
                std::string("failed to register ") + e.name + ": " + sqlite3_errmsg(db));
        }
    }
    return ok_status();
}

} // namespace sguid::sql
