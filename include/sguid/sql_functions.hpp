#pragma once

#include <sguid/result.hpp>

struct sqlite3;

namespace sguid::sql {

// Registers on `db`:
//   encode_short_guid(x)   16-byte BLOB (GUID layout) or UUID TEXT -> TEXT(22)
//   decode_short_guid(s)   TEXT -> 16-byte BLOB (GUID layout), lenient
//   short_guid_to_uuid(s)  TEXT -> canonical UUID TEXT, lenient
// NULL arguments yield NULL. Malformed arguments raise an SQL error.
Status register_functions(sqlite3* db);

} // namespace sguid::sql
