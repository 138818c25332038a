#pragma once

#include "symcache/symbol_key.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace symcache {

/// Ledger record tracking the fetch state of one symbol.
struct CacheEntry {
    int64_t id = 0;
    SymbolKey key;
    bool in_flight = false;  // A background fetch owns this entry
    bool found = false;      // Last fetch produced an artifact
};

struct LedgerCounts {
    uint64_t total = 0;
    uint64_t in_flight = 0;
    uint64_t found = 0;
};

/// Raised when the backing store fails (I/O error, corrupt database).
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Persistent per-key state shared by request handlers and fetch workers.
///
/// Implementations must be safe to call from multiple threads. At most one
/// entry exists per (identifier, filename).
class Ledger {
public:
    virtual ~Ledger() = default;

    virtual std::optional<CacheEntry> find_entry(const std::string& identifier,
                                                 const std::string& filename) = 0;

    /// Create an entry. If one already exists for the key, returns it unchanged.
    virtual CacheEntry create_entry(const std::string& identifier,
                                    const std::string& name,
                                    const std::string& filename,
                                    bool found = false) = 0;

    /// Persist in_flight and found of an existing entry.
    virtual void update_entry(const CacheEntry& entry) = 0;

    virtual std::vector<CacheEntry> list_in_flight_entries() = 0;

    /// Atomically flip in_flight from false to true.
    /// Returns true (and sets entry.in_flight) only for the caller that flipped it.
    virtual bool try_mark_in_flight(CacheEntry& entry) = 0;

    /// Entries ordered by id, for listing.
    virtual std::vector<CacheEntry> list_entries(size_t skip, size_t limit) = 0;

    virtual LedgerCounts counts() = 0;
};

}  // namespace symcache
