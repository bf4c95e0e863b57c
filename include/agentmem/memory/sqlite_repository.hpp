/*
 * agentmem - SQLite store
 *
 * Durable MemoryRepository over a single SQLite database. JSON-valued
 * fields (values, metadata, snapshot state, conflicts) are stored as text.
 * Optimistic locking is a single UPDATE guarded by "version = ?".
 */
#ifndef AGENTMEM_MEMORY_SQLITE_REPOSITORY_HPP
#define AGENTMEM_MEMORY_SQLITE_REPOSITORY_HPP

#include "repository.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <sqlite3.h>

namespace agentmem {

class SqliteRepository : public MemoryRepository {
public:
    SqliteRepository();
    virtual ~SqliteRepository();

    // Initialize database at path (":memory:" for a private in-process db)
    bool open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Schema management
    bool ensure_schema();

    virtual std::string backend() const { return "sqlite"; }

    virtual StoreStatus create_working(const WorkingMemory& memory);
    virtual StoreStatus get_working(const std::string& agent_id, const std::string& key,
                                    WorkingMemory& out);
    virtual StoreStatus update_working(const WorkingMemory& memory, int expected_version);
    virtual StoreStatus touch_working(const std::string& agent_id, const std::string& key,
                                      int64_t accessed_at);
    virtual StoreStatus delete_working(const std::string& agent_id, const std::string& key);
    virtual StoreStatus delete_working_if_expired(const std::string& agent_id, const std::string& key,
                                                  int64_t now_ms);
    virtual StoreStatus list_working(const std::string& agent_id, const MemoryFilters& filters,
                                     std::vector<WorkingMemory>& out);
    virtual StoreStatus clear_working(const std::string& agent_id, int& removed);

    virtual StoreStatus create_longterm(const LongtermMemory& memory);
    virtual StoreStatus get_longterm(const std::string& agent_id, const std::string& key,
                                     LongtermMemory& out);
    virtual StoreStatus update_longterm(const LongtermMemory& memory, int expected_version);
    virtual StoreStatus touch_longterm(const std::string& agent_id, const std::string& key,
                                       int64_t accessed_at);
    virtual StoreStatus delete_longterm(const std::string& agent_id, const std::string& key);
    virtual StoreStatus list_longterm(const std::string& agent_id, const MemoryFilters& filters,
                                      std::vector<LongtermMemory>& out);
    virtual StoreStatus search_longterm(const std::string& agent_id, const MemoryQuery& query,
                                        std::vector<LongtermMemory>& out);

    virtual StoreStatus create_snapshot(const StateSnapshot& snapshot);
    virtual StoreStatus get_snapshot(const std::string& snapshot_id, StateSnapshot& out);
    virtual StoreStatus list_snapshots(const std::string& agent_id, const SnapshotFilters& filters,
                                       std::vector<StateSnapshot>& out);
    virtual StoreStatus delete_snapshot(const std::string& snapshot_id);

    virtual StoreStatus get_sync_status(const std::string& agent_id, const std::string& instance_id,
                                        SyncStatus& out);
    virtual StoreStatus upsert_sync_status(const SyncStatus& status);
    virtual StoreStatus list_sync_status(const std::string& agent_id,
                                         std::vector<SyncStatus>& out);

    virtual StoreStatus cleanup_expired(int64_t now_ms, int& removed);

    virtual std::string last_error() const;

private:
    sqlite3* db_;
    // Error text of each thread's last failed call
    std::map<std::thread::id, std::string> last_errors_;
    mutable std::mutex mutex_;

    bool exec(const std::string& sql);
    StoreStatus set_error(StoreStatus status, const std::string& error);
    StoreStatus set_error_from_db();

    // Prepares sql into stmt; on failure records the error and returns false
    bool prepare(const char* sql, sqlite3_stmt** stmt);

    // Runs a DELETE/UPDATE keyed on (agent_id, key); NOT_FOUND when no row changed
    StoreStatus exec_keyed(const char* sql, const std::string& agent_id, const std::string& key,
                           const std::string& what);
    // Distinguishes NOT_FOUND from VERSION_MISMATCH after a guarded UPDATE matched nothing
    StoreStatus classify_failed_update(const char* table, const std::string& agent_id,
                                       const std::string& key);

    StoreStatus read_working(sqlite3_stmt* stmt, WorkingMemory& out);
    StoreStatus read_longterm(sqlite3_stmt* stmt, LongtermMemory& out);
    StoreStatus read_snapshot(sqlite3_stmt* stmt, StateSnapshot& out);
    StoreStatus read_sync_status(sqlite3_stmt* stmt, SyncStatus& out);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_SQLITE_REPOSITORY_HPP
