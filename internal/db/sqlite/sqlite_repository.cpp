#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace usedgear::db::sqlite {

using usedgear::db::ErrorCode;
using usedgear::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static bool ColIsNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
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

Result SqliteRepository::ExecBound(sqlite3* db, const char* sql, const std::string& kind, const std::string& id) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, kind);
    BindText(st, 2, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::PutRecord(Transaction& t, const model::FlatRecord& r) {
    if (auto res = RequireWritable(t); !res)
        return res;
    auto* db = TX(t).Handle();

    if (r.kind.empty() || r.id.empty())
        return Result::Err(ErrorCode::ConstraintViolation, "record kind and id are required");

    // Whole-record replace: old attributes go first.
    if (auto res = ExecBound(db, "DELETE FROM market_record_attr WHERE kind=? AND id=?;", r.kind, r.id); !res)
        return res;
    if (auto res = ExecBound(db, "INSERT OR IGNORE INTO market_record(kind,id) VALUES(?,?);", r.kind, r.id); !res)
        return res;

    const char* sql = "INSERT INTO market_record_attr(kind,id,name,value) VALUES(?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    for (const auto& [name, value] : r.attributes) {
        sqlite3_reset(st);
        sqlite3_clear_bindings(st);
        BindText(st, 1, r.kind);
        BindText(st, 2, r.id);
        BindText(st, 3, name);
        BindText(st, 4, value);

        int rc = sqlite3_step(st);
        if (rc != SQLITE_DONE) {
            auto res = Translate(db, rc);
            sqlite3_finalize(st);
            return res;
        }
    }

    sqlite3_finalize(st);
    return Result::Ok();
}

std::optional<model::FlatRecord>
SqliteRepository::GetRecord(Transaction& t, const std::string& kind, const std::string& id) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT r.id, a.name, a.value FROM market_record r "
        "LEFT JOIN market_record_attr a ON a.kind=r.kind AND a.id=r.id "
        "WHERE r.kind=? AND r.id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, kind);
    BindText(st, 2, id);

    std::optional<model::FlatRecord> out;
    while (sqlite3_step(st) == SQLITE_ROW) {
        if (!out) {
            out.emplace();
            out->kind = kind;
            out->id   = ColText(st, 0);
        }
        if (!ColIsNull(st, 1))
            out->attributes[ColText(st, 1)] = ColText(st, 2);
    }

    sqlite3_finalize(st);
    return out;
}

std::vector<model::FlatRecord> SqliteRepository::ListRecords(Transaction& t, const std::string& kind) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT r.id, a.name, a.value FROM market_record r "
        "LEFT JOIN market_record_attr a ON a.kind=r.kind AND a.id=r.id "
        "WHERE r.kind=? ORDER BY r.id, a.name;";

    std::vector<model::FlatRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    BindText(st, 1, kind);

    while (sqlite3_step(st) == SQLITE_ROW) {
        auto id = ColText(st, 0);
        if (out.empty() || out.back().id != id) {
            model::FlatRecord record;
            record.kind = kind;
            record.id   = std::move(id);
            out.push_back(std::move(record));
        }
        if (!ColIsNull(st, 1))
            out.back().attributes[ColText(st, 1)] = ColText(st, 2);
    }

    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteRecord(Transaction& t, const std::string& kind, const std::string& id) {
    if (auto res = RequireWritable(t); !res)
        return res;
    auto* db = TX(t).Handle();

    if (auto res = ExecBound(db, "DELETE FROM market_record_attr WHERE kind=? AND id=?;", kind, id); !res)
        return res;
    if (auto res = ExecBound(db, "DELETE FROM market_record WHERE kind=? AND id=?;", kind, id); !res)
        return res;

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::ClearAll(Transaction& t) {
    if (auto res = RequireWritable(t); !res)
        return res;
    auto* db = TX(t).Handle();

    char* err = nullptr;
    int   rc  = sqlite3_exec(db, "DELETE FROM market_record_attr; DELETE FROM market_record;", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "clear failed";
        sqlite3_free(err);
        return Result::Err(ErrorCode::InternalError, msg);
    }
    return Result::Ok();
}

} // namespace usedgear::db::sqlite
