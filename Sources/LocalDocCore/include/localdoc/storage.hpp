#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace localdoc {

// ============================================================================
// Stored records
// ============================================================================

enum class entry_state {
    cached,
    upserted,
    removed
};

const char* to_string(entry_state state);

/// Throws corrupt_storage for unknown names.
entry_state parse_entry_state(const std::string& name);

struct stored_record {
    doc_id_t id;
    entry_state state = entry_state::cached;
    std::optional<document> doc;    // absent for removed
    std::optional<document> base;   // upserted only

    json to_json() const;
    static stored_record from_json(const json& value);

    bool operator==(const stored_record& other) const {
        return id == other.id && state == other.state && doc == other.doc && base == other.base;
    }
};

// ============================================================================
// Adapter interface
// ============================================================================

/// Persistence for one collection. load_all reflects every prior successful
/// persist. Failures throw adapter_io_error or a subclass.
class storage_adapter {
public:
    virtual ~storage_adapter() = default;

    virtual std::vector<stored_record> load_all() = 0;

    /// Write upserts (full replacement per id) and delete removals, as one unit.
    virtual void persist(const std::vector<stored_record>& upserts,
                         const std::vector<doc_id_t>& removals) = 0;

    /// Delete everything stored for the collection.
    virtual void destroy() = 0;
};

class memory_storage : public storage_adapter {
public:
    std::vector<stored_record> load_all() override;
    void persist(const std::vector<stored_record>& upserts,
                 const std::vector<doc_id_t>& removals) override;
    void destroy() override;

private:
    std::mutex mutex_;
    std::map<doc_id_t, stored_record> records_;
};

/// Append-only JSON-lines file, replayed on load. One line per change:
///   {"op":"put","rec":{...}}  or  {"op":"del","id":"..."}
class log_file_storage : public storage_adapter {
public:
    explicit log_file_storage(std::string path);

    std::vector<stored_record> load_all() override;
    void persist(const std::vector<stored_record>& upserts,
                 const std::vector<doc_id_t>& removals) override;
    void destroy() override;

    /// Rewrite the file with only the live records.
    void compact();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;

    std::map<doc_id_t, stored_record> replay();
};

/// One table per collection in a shared SQLite database.
class sqlite_storage : public storage_adapter {
public:
    sqlite_storage(std::shared_ptr<sqlite_database> db, const std::string& collection_name);

    std::vector<stored_record> load_all() override;
    void persist(const std::vector<stored_record>& upserts,
                 const std::vector<doc_id_t>& removals) override;
    void destroy() override;

private:
    std::shared_ptr<sqlite_database> db_;
    std::string table_;
    std::mutex mutex_;

    void ensure_table();
};

// ============================================================================
// Selection
// ============================================================================

enum class storage_kind {
    memory,
    log_file,
    sqlite
};

const char* to_string(storage_kind kind);

struct storage_probe {
    bool sqlite_available = false;
    bool directory_writable = false;
    std::optional<storage_kind> preference;
};

/// Pure decision: a viable preference wins, then SQLite, then the log file,
/// then memory. File-backed kinds need a writable directory.
storage_kind choose_storage(const storage_probe& probe);

struct storage_config {
    std::optional<storage_kind> kind_preference;
    std::string directory;                              // empty: memory only
    std::string sqlite_file_name = "localdoc.sqlite";
};

/// Inspect the environment described by `config`.
storage_probe probe_storage(const storage_config& config);

/// Builds the adapter for a collection name. Returning nullptr is an error
/// the database reports as missing_adapter.
using storage_factory = std::function<std::unique_ptr<storage_adapter>(const std::string& collection_name)>;

/// Probe, choose, and build. When construction of the chosen kind throws, the
/// factory falls back to the next kind down (sqlite, log file, memory).
storage_factory make_storage_factory(const storage_config& config);

/// Every collection gets a fresh memory_storage.
storage_factory memory_storage_factory();

} // namespace localdoc

#endif // __cplusplus
