/*
 * agentmem - Memory Service
 *
 * Owns the store, the background dispatcher, the three memory managers and
 * the sync coordinator of one process, and exposes the maintenance
 * operations that span them.
 */
#ifndef AGENTMEM_SERVICE_MEMORY_SERVICE_HPP
#define AGENTMEM_SERVICE_MEMORY_SERVICE_HPP

#include <agentmem/memory/settings.hpp>
#include <agentmem/memory/working_memory.hpp>
#include <agentmem/memory/longterm_memory.hpp>
#include <agentmem/memory/snapshot.hpp>
#include <agentmem/sync/sync_coordinator.hpp>
#include <agentmem/core/task_dispatcher.hpp>
#include <memory>
#include <string>

namespace agentmem {

class MemoryService {
public:
    // Builds the configured store (throws RepositoryError when it cannot be opened)
    explicit MemoryService(const MemorySettings& settings);
    // Uses an existing store
    MemoryService(std::shared_ptr<MemoryRepository> repo, const MemorySettings& settings);
    ~MemoryService();

    MemoryService(const MemoryService&) = delete;
    MemoryService& operator=(const MemoryService&) = delete;

    WorkingMemoryManager& working() { return working_; }
    LongtermMemoryManager& longterm() { return longterm_; }
    SnapshotManager& snapshots() { return snapshots_; }
    // Also the way to resolve conflicts (serialized with sync passes)
    SyncCoordinator& sync() { return sync_; }
    TaskDispatcher& dispatcher() { return dispatcher_; }
    MemoryRepository& repository() { return *repo_; }
    const MemorySettings& settings() const { return settings_; }

    // Removes expired working entries and snapshots; returns how many
    int cleanup_expired();

    // Counts and serialized sizes of everything stored for agent_id
    MemoryStats stats(const std::string& agent_id);

    // Stops the periodic loop and drains background work. Idempotent.
    void shutdown();

private:
    MemorySettings settings_;
    std::shared_ptr<MemoryRepository> repo_;
    TaskDispatcher dispatcher_;
    WorkingMemoryManager working_;
    LongtermMemoryManager longterm_;
    SnapshotManager snapshots_;
    SyncCoordinator sync_;
    bool shut_down_;
};

} // namespace agentmem

#endif // AGENTMEM_SERVICE_MEMORY_SERVICE_HPP
