#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "subnet/manager/v1.hpp"

namespace subnet::db::sqlite {

using subnet::db::ErrorCode;
using subnet::db::Result;
using subnet::manager::v1::StorageValue;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindScope(sqlite3_stmt* st, int idx, model::Scope scope) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(scope));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static model::Scope ColScope(sqlite3_stmt* st, int col) {
    return static_cast<model::Scope>(sqlite3_column_int64(st, col));
}

// Values are stored as serialized StorageValue messages.
static StorageValue ColValue(sqlite3_stmt* st, int col) {
    StorageValue v;
    const void*  blob = sqlite3_column_blob(st, col);
    const int    size = sqlite3_column_bytes(st, col);
    if (blob != nullptr && !v.ParseFromArray(blob, size)) {
        throw std::runtime_error("sqlite: corrupt storage value");
    }
    return v;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS storage (item TEXT NOT NULL, scope INTEGER NOT NULL, subkey TEXT NOT NULL, "
        "value BLOB NOT NULL, PRIMARY KEY (item, scope, subkey)) WITHOUT ROWID;");
    db.Exec("SELECT item,scope,subkey,value FROM storage LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

std::optional<StorageValue> SqliteRepository::Get(Transaction& t, const model::StorageKey& key) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT value FROM storage WHERE item=? AND scope=? AND subkey=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st, 1, key.item);
    BindScope(st, 2, key.scope);
    BindText(st, 3, key.subkey);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        if (rc != SQLITE_DONE)
            throw std::runtime_error(std::string("sqlite read: ") + sqlite3_errmsg(db));
        return std::nullopt;
    }

    StorageValue v;
    try {
        v = ColValue(st, 0);
    } catch (...) {
        sqlite3_finalize(st);
        throw;
    }

    sqlite3_finalize(st);
    return v;
}

Result SqliteRepository::Put(Transaction& t, const model::StorageKey& key, const StorageValue& value) {
    auto* db = TX(t).Handle();

    const char* sql = "INSERT OR REPLACE INTO storage(item,scope,subkey,value) VALUES(?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const std::string bytes = value.SerializeAsString();

    BindText(st, 1, key.item);
    BindScope(st, 2, key.scope);
    BindText(st, 3, key.subkey);
    sqlite3_bind_blob(st, 4, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::Erase(Transaction& t, const model::StorageKey& key) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM storage WHERE item=? AND scope=? AND subkey=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, key.item);
    BindScope(st, 2, key.scope);
    BindText(st, 3, key.subkey);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteRepository::ErasePrefix(Transaction& t, const std::string& item, model::Scope scope) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM storage WHERE item=? AND scope=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, item);
    BindScope(st, 2, scope);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::StorageEntry>
SqliteRepository::Scan(Transaction& t, const std::string& item, std::optional<model::Scope> scope) {
    auto* db = TX(t).Handle();

    // BINARY collation keeps subkey order bytewise, matching the memory backend.
    const char* sql = scope
        ? "SELECT scope,subkey,value FROM storage WHERE item=? AND scope=? ORDER BY scope, subkey;"
        : "SELECT scope,subkey,value FROM storage WHERE item=? ORDER BY scope, subkey;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st, 1, item);
    if (scope) BindScope(st, 2, *scope);

    std::vector<model::StorageEntry> out;
    int rc = SQLITE_ROW;
    try {
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            model::StorageEntry e;
            e.key.item   = item;
            e.key.scope  = ColScope(st, 0);
            e.key.subkey = ColText(st, 1);
            e.value      = ColValue(st, 2);
            out.push_back(std::move(e));
        }
    } catch (...) {
        sqlite3_finalize(st);
        throw;
    }

    sqlite3_finalize(st);
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite scan: ") + sqlite3_errmsg(db));
    return out;
}

} // namespace subnet::db::sqlite
