#include "symcache/sqlite_ledger.hpp"
#include "symcache/log.hpp"

#include <chrono>
#include <sqlite3.h>
#include <thread>

namespace symcache {

namespace {

constexpr const char* LEDGER_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS symbol_entries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    identifier TEXT NOT NULL,
    filename TEXT NOT NULL,
    in_flight INTEGER NOT NULL DEFAULT 0,
    found INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    UNIQUE (identifier, filename)
);

CREATE INDEX IF NOT EXISTS idx_in_flight
    ON symbol_entries(in_flight) WHERE in_flight = 1;
)";

constexpr const char* ENTRY_COLUMNS = "id, name, identifier, filename, in_flight, found";

int64_t now_epoch() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

// Row layout matches ENTRY_COLUMNS
CacheEntry read_entry(sqlite3_stmt* stmt) {
    CacheEntry e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.key.name = column_string(stmt, 1);
    e.key.identifier = column_string(stmt, 2);
    e.key.filename = column_string(stmt, 3);
    e.in_flight = sqlite3_column_int(stmt, 4) != 0;
    e.found = sqlite3_column_int(stmt, 5) != 0;
    return e;
}

}  // namespace

SqliteLedger::SqliteLedger(const std::filesystem::path& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw LedgerError("Cannot open ledger " + db_path.string() + ": " + msg);
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, LEDGER_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw LedgerError("Cannot create ledger schema in " + db_path.string());
    }

    try {
        prepare_statements();
    } catch (const LedgerError&) {
        close();
        throw;
    }
}

void SqliteLedger::prepare_statements() {
    std::string cols = ENTRY_COLUMNS;
    stmt_find_ = prepare(("SELECT " + cols +
        " FROM symbol_entries WHERE identifier = ?1 AND filename = ?2").c_str());
    stmt_insert_ = prepare(
        "INSERT OR IGNORE INTO symbol_entries "
        "(name, identifier, filename, in_flight, found, created_at, updated_at) "
        "VALUES (?1, ?2, ?3, 0, ?4, ?5, ?5)");
    stmt_update_ = prepare(
        "UPDATE symbol_entries SET in_flight = ?3, found = ?4, updated_at = ?5 "
        "WHERE identifier = ?1 AND filename = ?2");
    stmt_mark_in_flight_ = prepare(
        "UPDATE symbol_entries SET in_flight = 1, updated_at = ?3 "
        "WHERE identifier = ?1 AND filename = ?2 AND in_flight = 0");
    stmt_list_in_flight_ = prepare(("SELECT " + cols +
        " FROM symbol_entries WHERE in_flight = 1 ORDER BY id").c_str());
    stmt_list_ = prepare(("SELECT " + cols +
        " FROM symbol_entries ORDER BY id LIMIT ?2 OFFSET ?1").c_str());
    stmt_counts_ = prepare(
        "SELECT COUNT(*), COALESCE(SUM(in_flight), 0), COALESCE(SUM(found), 0) "
        "FROM symbol_entries");
}

SqliteLedger::~SqliteLedger() {
    close();
}

void SqliteLedger::close() {
    // Finalize prepared statements
    for (auto** stmt : {&stmt_find_, &stmt_insert_, &stmt_update_, &stmt_mark_in_flight_,
                        &stmt_list_in_flight_, &stmt_list_, &stmt_counts_}) {
        if (*stmt) sqlite3_finalize(*stmt);
        *stmt = nullptr;
    }
    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

sqlite3_stmt* SqliteLedger::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw LedgerError(std::string("Cannot prepare statement: ") + sqlite3_errmsg(db_));
    }
    return stmt;
}

std::optional<CacheEntry> SqliteLedger::find_locked(const std::string& identifier,
                                                    const std::string& filename) {
    sqlite3_reset(stmt_find_);
    sqlite3_bind_text(stmt_find_, 1, identifier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_find_, 2, filename.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sql_step_retry(stmt_find_);
    if (rc == SQLITE_ROW) {
        auto entry = read_entry(stmt_find_);
        sqlite3_reset(stmt_find_);  // Release the read transaction
        return entry;
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("find_entry failed: ") + sqlite3_errmsg(db_));
    }
    return std::nullopt;
}

std::optional<CacheEntry> SqliteLedger::find_entry(const std::string& identifier,
                                                   const std::string& filename) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    return find_locked(identifier, filename);
}

CacheEntry SqliteLedger::create_entry(const std::string& identifier,
                                      const std::string& name,
                                      const std::string& filename,
                                      bool found) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);

    sqlite3_reset(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 2, identifier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 3, filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_, 4, found ? 1 : 0);
    sqlite3_bind_int64(stmt_insert_, 5, now_epoch());
    if (sql_step_retry(stmt_insert_) != SQLITE_DONE) {
        throw LedgerError(std::string("create_entry failed: ") + sqlite3_errmsg(db_));
    }

    // INSERT OR IGNORE: a concurrent creator may have won, read back whichever row exists
    auto entry = find_locked(identifier, filename);
    if (!entry) throw LedgerError("create_entry: row vanished after insert");
    return *entry;
}

void SqliteLedger::update_entry(const CacheEntry& entry) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_update_);
    sqlite3_bind_text(stmt_update_, 1, entry.key.identifier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_update_, 2, entry.key.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_update_, 3, entry.in_flight ? 1 : 0);
    sqlite3_bind_int(stmt_update_, 4, entry.found ? 1 : 0);
    sqlite3_bind_int64(stmt_update_, 5, now_epoch());
    if (sql_step_retry(stmt_update_) != SQLITE_DONE) {
        throw LedgerError(std::string("update_entry failed: ") + sqlite3_errmsg(db_));
    }
}

std::vector<CacheEntry> SqliteLedger::list_in_flight_entries() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    std::vector<CacheEntry> result;
    sqlite3_reset(stmt_list_in_flight_);
    int rc;
    while ((rc = sql_step_retry(stmt_list_in_flight_)) == SQLITE_ROW) {
        result.push_back(read_entry(stmt_list_in_flight_));
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("list_in_flight_entries failed: ") + sqlite3_errmsg(db_));
    }
    return result;
}

bool SqliteLedger::try_mark_in_flight(CacheEntry& entry) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    sqlite3_reset(stmt_mark_in_flight_);
    sqlite3_bind_text(stmt_mark_in_flight_, 1, entry.key.identifier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_mark_in_flight_, 2, entry.key.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_mark_in_flight_, 3, now_epoch());
    if (sql_step_retry(stmt_mark_in_flight_) != SQLITE_DONE) {
        throw LedgerError(std::string("try_mark_in_flight failed: ") + sqlite3_errmsg(db_));
    }
    if (sqlite3_changes(db_) != 1) return false;
    entry.in_flight = true;
    return true;
}

std::vector<CacheEntry> SqliteLedger::list_entries(size_t skip, size_t limit) {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    std::vector<CacheEntry> result;
    sqlite3_reset(stmt_list_);
    sqlite3_bind_int64(stmt_list_, 1, static_cast<int64_t>(skip));
    sqlite3_bind_int64(stmt_list_, 2, static_cast<int64_t>(limit));
    int rc;
    while ((rc = sql_step_retry(stmt_list_)) == SQLITE_ROW) {
        result.push_back(read_entry(stmt_list_));
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("list_entries failed: ") + sqlite3_errmsg(db_));
    }
    return result;
}

LedgerCounts SqliteLedger::counts() {
    std::lock_guard<std::mutex> db_lock(db_mutex_);
    LedgerCounts c;
    sqlite3_reset(stmt_counts_);
    if (sql_step_retry(stmt_counts_) == SQLITE_ROW) {
        c.total = static_cast<uint64_t>(sqlite3_column_int64(stmt_counts_, 0));
        c.in_flight = static_cast<uint64_t>(sqlite3_column_int64(stmt_counts_, 1));
        c.found = static_cast<uint64_t>(sqlite3_column_int64(stmt_counts_, 2));
    }
    sqlite3_reset(stmt_counts_);
    return c;
}

}  // namespace symcache
