/*
 * agentmem - Persistence capability
 *
 * Abstract store consumed by the memory managers and the sync coordinator.
 * Implementations report outcomes as StoreStatus codes with details in
 * last_error(); the managers turn those into typed MemoryError exceptions.
 *
 * Version-checked updates are the only way to rewrite an entry's payload:
 * update_*(entry, expected_version) succeeds only when the stored version
 * still equals expected_version, and stores entry.version (which callers
 * set to expected_version + 1). Access telemetry (access_count and the
 * access timestamp) is owned by touch_*() and left as stored.
 */
#ifndef AGENTMEM_MEMORY_REPOSITORY_HPP
#define AGENTMEM_MEMORY_REPOSITORY_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace agentmem {

enum class StoreStatus {
    OK,
    NOT_FOUND,
    DUPLICATE,
    VERSION_MISMATCH,
    FAILED
};

inline const char* store_status_to_string(StoreStatus s) {
    switch (s) {
        case StoreStatus::OK: return "ok";
        case StoreStatus::NOT_FOUND: return "not found";
        case StoreStatus::DUPLICATE: return "duplicate key";
        case StoreStatus::VERSION_MISMATCH: return "version mismatch";
        case StoreStatus::FAILED: return "failed";
    }
    return "failed";
}

class MemoryRepository {
public:
    virtual ~MemoryRepository() {}

    // "memory", "sqlite", ...
    virtual std::string backend() const = 0;

    // Working memory
    virtual StoreStatus create_working(const WorkingMemory& memory) = 0;
    virtual StoreStatus get_working(const std::string& agent_id, const std::string& key,
                                    WorkingMemory& out) = 0;
    virtual StoreStatus update_working(const WorkingMemory& memory, int expected_version) = 0;
    // Telemetry only: access_count + 1, accessed_at = now; version untouched
    virtual StoreStatus touch_working(const std::string& agent_id, const std::string& key,
                                      int64_t accessed_at) = 0;
    virtual StoreStatus delete_working(const std::string& agent_id, const std::string& key) = 0;
    // Deletes only when the stored entry expired strictly before now_ms
    virtual StoreStatus delete_working_if_expired(const std::string& agent_id, const std::string& key,
                                                  int64_t now_ms) = 0;
    virtual StoreStatus list_working(const std::string& agent_id, const MemoryFilters& filters,
                                     std::vector<WorkingMemory>& out) = 0;
    virtual StoreStatus clear_working(const std::string& agent_id, int& removed) = 0;

    // Long-term memory
    virtual StoreStatus create_longterm(const LongtermMemory& memory) = 0;
    virtual StoreStatus get_longterm(const std::string& agent_id, const std::string& key,
                                     LongtermMemory& out) = 0;
    virtual StoreStatus update_longterm(const LongtermMemory& memory, int expected_version) = 0;
    virtual StoreStatus touch_longterm(const std::string& agent_id, const std::string& key,
                                       int64_t accessed_at) = 0;
    virtual StoreStatus delete_longterm(const std::string& agent_id, const std::string& key) = 0;
    virtual StoreStatus list_longterm(const std::string& agent_id, const MemoryFilters& filters,
                                      std::vector<LongtermMemory>& out) = 0;
    virtual StoreStatus search_longterm(const std::string& agent_id, const MemoryQuery& query,
                                        std::vector<LongtermMemory>& out) = 0;

    // Snapshots
    virtual StoreStatus create_snapshot(const StateSnapshot& snapshot) = 0;
    virtual StoreStatus get_snapshot(const std::string& snapshot_id, StateSnapshot& out) = 0;
    virtual StoreStatus list_snapshots(const std::string& agent_id, const SnapshotFilters& filters,
                                       std::vector<StateSnapshot>& out) = 0;
    virtual StoreStatus delete_snapshot(const std::string& snapshot_id) = 0;

    // Sync status, keyed by (agent_id, instance_id). Upsert replaces atomically.
    virtual StoreStatus get_sync_status(const std::string& agent_id, const std::string& instance_id,
                                        SyncStatus& out) = 0;
    virtual StoreStatus upsert_sync_status(const SyncStatus& status) = 0;
    virtual StoreStatus list_sync_status(const std::string& agent_id,
                                         std::vector<SyncStatus>& out) = 0;

    // Removes working entries and snapshots whose expiry is strictly before now_ms
    virtual StoreStatus cleanup_expired(int64_t now_ms, int& removed) = 0;

    // Detail of the calling thread's last failed operation
    virtual std::string last_error() const = 0;
};

// Turns a non-OK status into the matching MemoryError: NOT_FOUND ->
// NotFoundError, DUPLICATE -> AlreadyExistsError, anything else ->
// RepositoryError carrying entity/key/operation (detail is logged, not
// thrown). Version mismatches are handled by the callers, which know both
// versions.
void raise_store_error(StoreStatus status,
                       const std::string& entity,
                       const std::string& key,
                       const std::string& operation,
                       const std::string& detail);

} // namespace agentmem

#endif // AGENTMEM_MEMORY_REPOSITORY_HPP
