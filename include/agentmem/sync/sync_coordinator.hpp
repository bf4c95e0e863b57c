/*
 * agentmem - Sync Coordinator
 *
 * Reconciles one agent instance's view of memory with the shared store.
 *
 * Each coordinator is one instance (instance_id). It remembers the version
 * of every key it last saw and holds local edits staged against those
 * versions. A sync pass pushes edits whose base version is still current,
 * turns the rest into conflicts, and refreshes the view from the store.
 * Status per (agent_id, instance_id) moves
 *   synced -> syncing -> {synced | conflict | error}
 *
 * Features:
 * - On-demand sync_agent() and an optional periodic loop on its own thread
 * - Per-agent serialization of sync passes and status writes
 * - Batch conflict resolution with the configured strategy
 * - force_push / force_pull operator overrides
 */
#ifndef AGENTMEM_SYNC_SYNC_COORDINATOR_HPP
#define AGENTMEM_SYNC_SYNC_COORDINATOR_HPP

#include "conflict_resolver.hpp"
#include <agentmem/memory/types.hpp>
#include <agentmem/memory/repository.hpp>
#include <agentmem/core/utils.hpp>
#include <string>
#include <map>
#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <condition_variable>

namespace agentmem {

class SyncCoordinator {
public:
    // Empty instance_id generates a random one
    SyncCoordinator(std::shared_ptr<MemoryRepository> repo,
                    const std::string& instance_id = "",
                    ConflictStrategy strategy = ConflictStrategy::LAST_WRITE_WINS,
                    int64_t default_interval_ms = 5 * MS_PER_MINUTE);
    ~SyncCoordinator();

    // Lifecycle of the periodic loop. The first pass runs one interval after
    // start. interval_ms <= 0 uses the default interval.
    // Throws AlreadyRunningError / NotRunningError on misuse.
    void start_periodic_sync(const std::string& agent_id, int64_t interval_ms = 0);
    void stop_periodic_sync();
    bool is_running() const { return running_.load(); }

    // One reconciliation pass. Step failures are reported in the result.
    SyncResult sync_agent(const std::string& agent_id);

    // Record a local edit to an existing key, based on the version this
    // instance last saw (or the stored version for a key not seen yet)
    void stage_change(const std::string& agent_id,
                      MemoryType type,
                      const std::string& key,
                      const Json& value);
    int pending_changes(const std::string& agent_id) const;

    // Open conflicts recorded in the status
    std::vector<MemoryConflict> detect_conflicts(const std::string& agent_id);

    // Returns the number resolved; throws UnresolvedConflictsError if any remain
    int resolve_conflicts(const std::string& agent_id);

    // Overrides: local edits win / store wins. Both clear conflicts.
    SyncStatus force_push(const std::string& agent_id);
    SyncStatus force_pull(const std::string& agent_id);

    // Stored status, or a fresh synced one when none was written yet
    SyncStatus status(const std::string& agent_id);

    const std::string& instance_id() const { return instance_id_; }
    ConflictStrategy strategy() const;
    void set_strategy(ConflictStrategy strategy);

private:
    struct StagedChange {
        MemoryType type;
        std::string key;
        Json value;
        int base_version;
        int64_t staged_at;

        StagedChange() : type(MemoryType::WORKING), base_version(0), staged_at(0) {}
    };

    // What this instance knows about one agent. Keys are "<type>:<key>".
    struct AgentView {
        std::map<std::string, int> seen;
        std::map<std::string, StagedChange> staged;
    };

    // Stored version/value/time of one entry
    struct StoredEntry {
        MemoryType type;
        std::string key;
        Json value;
        int version;
        int64_t updated_at;

        StoredEntry() : type(MemoryType::WORKING), version(0), updated_at(0) {}
    };

    std::shared_ptr<MemoryRepository> repo_;
    ConflictResolver resolver_;
    std::string instance_id_;
    int64_t default_interval_ms_;

    mutable std::mutex strategy_mutex_;
    ConflictStrategy strategy_;

    // Periodic loop
    std::mutex lifecycle_mutex_;    // start/stop, including the join
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_;
    std::atomic<bool> running_;
    std::thread loop_thread_;

    // Per-agent serialization
    std::mutex agent_locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex> > agent_locks_;

    mutable std::mutex views_mutex_;
    std::map<std::string, AgentView> views_;

    void sync_loop(std::string agent_id, int64_t interval_ms);
    std::shared_ptr<std::mutex> agent_lock(const std::string& agent_id);

    static std::string view_key(MemoryType type, const std::string& key);
    SyncStatus load_status(const std::string& agent_id);
    void save_status(const SyncStatus& status);

    // Live working entries and all long-term entries, keyed by view_key
    void load_entries(const std::string& agent_id, std::map<std::string, StoredEntry>& out);
    bool read_entry(const std::string& agent_id, MemoryType type, const std::string& key,
                    StoredEntry& out);
    // Version-checked write of value over the stored entry
    StoreStatus write_entry(const std::string& agent_id, const StagedChange& change,
                            int expected_version);

    std::vector<StagedChange> take_staged(const std::string& agent_id);
    void restage(const std::string& agent_id, const StagedChange& change);
    void mark_seen(const std::string& agent_id, const std::string& vkey, int version);
    void apply_resolutions(const std::string& agent_id, const std::vector<ResolvedConflict>& resolved);

    static void merge_conflict(std::vector<MemoryConflict>& conflicts, const MemoryConflict& c);
};

} // namespace agentmem

#endif // AGENTMEM_SYNC_SYNC_COORDINATOR_HPP
