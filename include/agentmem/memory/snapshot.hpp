/*
 * agentmem - Snapshot manager
 *
 * Checksummed point-in-time captures of an agent's memory. The captured
 * state holds the live working entries in full plus the long-term key
 * inventory and per-category counts.
 *
 * Restore replaces the agent's working memory with the captured entries
 * that have not expired yet; long-term memory is left untouched.
 */
#ifndef AGENTMEM_MEMORY_SNAPSHOT_HPP
#define AGENTMEM_MEMORY_SNAPSHOT_HPP

#include "types.hpp"
#include "repository.hpp"
#include <memory>
#include <string>
#include <vector>

namespace agentmem {

class SnapshotManager {
public:
    explicit SnapshotManager(std::shared_ptr<MemoryRepository> repo);

    // type is a snapshot type name; empty or unknown names are manual snapshots
    StateSnapshot create(const std::string& agent_id,
                         const std::string& type = "manual",
                         const std::string& reason = "");
    StateSnapshot create(const std::string& agent_id, SnapshotType type, const std::string& reason);

    // Throws NotFoundError, OwnershipError (before any change), IntegrityError
    RestoreReport restore(const std::string& agent_id, const std::string& snapshot_id);

    std::vector<StateSnapshot> list(const std::string& agent_id,
                                    const SnapshotFilters& filters = SnapshotFilters());

    StateSnapshot get(const std::string& snapshot_id);

    // True when the stored checksum matches the state
    static bool verify(const StateSnapshot& snapshot);

    void remove(const std::string& snapshot_id);

private:
    std::shared_ptr<MemoryRepository> repo_;

    Json capture_state(const std::string& agent_id, int64_t now);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_SNAPSHOT_HPP
