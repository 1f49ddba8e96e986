#ifndef PIIANON_CORE_AUDIT_STORE_HPP
#define PIIANON_CORE_AUDIT_STORE_HPP

#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

#include "core/audit_log.hpp"
#include "util/logger.hpp"

/**
 * @file audit_store.hpp
 * @brief Optional SQLite copy of the audit trail, shared by every file of a run.
 *
 * DESIGN GOALS:
 *   - Schema created on first use:
 *       audit_entries(id, source_file, pii_type, position, strategy, pass, timestamp)
 *   - All entries for one source file are written in a single transaction;
 *     any failed insert rolls the whole file back.
 *   - Calls are serialized with a mutex, so one store may be shared by
 *     directory workers.
 */

namespace piianon {
namespace core {

class AuditStore
{
public:
    explicit AuditStore(std::string dbPath)
        : m_dbPath(std::move(dbPath))
    {
    }

    const std::string& path() const { return m_dbPath; }

    /**
     * @return false (after logging) when the database cannot be opened or written.
     */
    bool record(const std::string &sourceFile, const std::vector<AuditEntry> &entries)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        sqlite3 *db = nullptr;
        if (!openDatabase(db)) {
            util::logger::error("AuditStore: could not open database: " + m_dbPath);
            if (db) {
                sqlite3_close(db);
            }
            return false;
        }
        if (!initSchema(db)) {
            sqlite3_close(db);
            return false;
        }
        if (!exec(db, "BEGIN TRANSACTION;")) {
            util::logger::error("AuditStore: could not start transaction");
            sqlite3_close(db);
            return false;
        }

        for (const auto &e : entries) {
            if (!insertEntry(db, sourceFile, e)) {
                util::logger::error("AuditStore: insert failed: " + std::string(sqlite3_errmsg(db)));
                exec(db, "ROLLBACK;");
                sqlite3_close(db);
                return false;
            }
        }

        if (!exec(db, "COMMIT;")) {
            util::logger::error("AuditStore: commit failed");
            exec(db, "ROLLBACK;");
            sqlite3_close(db);
            return false;
        }
        sqlite3_close(db);
        return true;
    }

    /**
     * @brief Number of stored entries, optionally for one source file. -1 on error.
     */
    long long count(const std::string &sourceFile = "")
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        sqlite3 *db = nullptr;
        if (!openDatabase(db) || !initSchema(db)) {
            if (db) {
                sqlite3_close(db);
            }
            return -1;
        }

        const char *sql = sourceFile.empty()
            ? "SELECT COUNT(*) FROM audit_entries;"
            : "SELECT COUNT(*) FROM audit_entries WHERE source_file = ?;";
        sqlite3_stmt *stmt = nullptr;
        long long result = -1;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK && stmt) {
            if (!sourceFile.empty()) {
                sqlite3_bind_text(stmt, 1, sourceFile.c_str(), -1, SQLITE_TRANSIENT);
            }
            if (sqlite3_step(stmt) == SQLITE_ROW) {
                result = sqlite3_column_int64(stmt, 0);
            }
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return result;
    }

private:
    bool openDatabase(sqlite3 *&db)
    {
        int rc = sqlite3_open(m_dbPath.c_str(), &db);
        return rc == SQLITE_OK && db != nullptr;
    }

    bool initSchema(sqlite3 *db)
    {
        const char *ddl = "CREATE TABLE IF NOT EXISTS audit_entries ("
                          " id INTEGER PRIMARY KEY AUTOINCREMENT,"
                          " source_file TEXT NOT NULL,"
                          " pii_type TEXT NOT NULL,"
                          " position INTEGER NOT NULL,"
                          " strategy TEXT NOT NULL,"
                          " pass INTEGER NOT NULL,"
                          " timestamp TEXT NOT NULL"
                          ");";
        char *errMsg = nullptr;
        int rc = sqlite3_exec(db, ddl, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            util::logger::error("AuditStore: schema error: " + std::string(errMsg ? errMsg : "unknown"));
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    static bool exec(sqlite3 *db, const char *sql)
    {
        return sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    }

    static bool insertEntry(sqlite3 *db, const std::string &sourceFile, const AuditEntry &e)
    {
        const char *sql = "INSERT INTO audit_entries (source_file, pii_type, position, strategy, pass, timestamp)"
                          " VALUES (?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK || !stmt) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, sourceFile.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, e.category.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(e.position));
        sqlite3_bind_text(stmt, 4, e.strategy.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(stmt, 5, e.pass);
        sqlite3_bind_text(stmt, 6, e.timestamp.c_str(), -1, SQLITE_TRANSIENT);

        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

    std::string m_dbPath;
    std::mutex m_mutex;
};

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_AUDIT_STORE_HPP
