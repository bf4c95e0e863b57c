/*
 * agentmem - In-memory store
 *
 * Map-backed MemoryRepository used by tests and by the "memory" backend.
 * Each table has its own mutex; nothing survives the process.
 */
#ifndef AGENTMEM_MEMORY_IN_MEMORY_REPOSITORY_HPP
#define AGENTMEM_MEMORY_IN_MEMORY_REPOSITORY_HPP

#include "repository.hpp"
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace agentmem {

class InMemoryRepository : public MemoryRepository {
public:
    InMemoryRepository();
    virtual ~InMemoryRepository();

    virtual std::string backend() const { return "memory"; }

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
    typedef std::pair<std::string, std::string> EntryKey;   // (agent_id, key)

    std::map<EntryKey, WorkingMemory> working_;
    std::map<EntryKey, LongtermMemory> longterm_;
    std::map<std::string, StateSnapshot> snapshots_;
    std::map<EntryKey, SyncStatus> sync_;   // (agent_id, instance_id)

    mutable std::mutex working_mutex_;
    mutable std::mutex longterm_mutex_;
    mutable std::mutex snapshot_mutex_;
    mutable std::mutex sync_mutex_;

    // Error text of each thread's last failed call
    mutable std::mutex error_mutex_;
    std::map<std::thread::id, std::string> last_errors_;

    StoreStatus fail(StoreStatus status, const std::string& error);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_IN_MEMORY_REPOSITORY_HPP
