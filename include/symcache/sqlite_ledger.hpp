#pragma once

#include "symcache/ledger.hpp"

#include <filesystem>
#include <mutex>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace symcache {

/// Ledger stored in a SQLite database (WAL mode).
///
/// A single connection is shared by all threads; db_mutex_ serializes
/// prepared statement usage. The in-flight flag is flipped with a conditional
/// UPDATE so two requests for the same key can never both win.
class SqliteLedger : public Ledger {
public:
    /// Opens (and creates if needed) the database. Throws LedgerError.
    explicit SqliteLedger(const std::filesystem::path& db_path);
    ~SqliteLedger() override;

    SqliteLedger(const SqliteLedger&) = delete;
    SqliteLedger& operator=(const SqliteLedger&) = delete;

    std::optional<CacheEntry> find_entry(const std::string& identifier,
                                         const std::string& filename) override;
    CacheEntry create_entry(const std::string& identifier,
                            const std::string& name,
                            const std::string& filename,
                            bool found = false) override;
    void update_entry(const CacheEntry& entry) override;
    std::vector<CacheEntry> list_in_flight_entries() override;
    bool try_mark_in_flight(CacheEntry& entry) override;
    std::vector<CacheEntry> list_entries(size_t skip, size_t limit) override;
    LedgerCounts counts() override;

private:
    void prepare_statements();
    void close();
    sqlite3_stmt* prepare(const char* sql);
    std::optional<CacheEntry> find_locked(const std::string& identifier,
                                          const std::string& filename);

    std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_find_ = nullptr;
    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_update_ = nullptr;
    sqlite3_stmt* stmt_mark_in_flight_ = nullptr;
    sqlite3_stmt* stmt_list_in_flight_ = nullptr;
    sqlite3_stmt* stmt_list_ = nullptr;
    sqlite3_stmt* stmt_counts_ = nullptr;
};

}  // namespace symcache
