/*
 * agentmem - Conflict resolution
 *
 * Picks a winner for a contested key and, in batch mode, writes the winner
 * back to the store and clears resolved conflicts from the SyncStatus.
 *
 * A local winner is written over the stored entry at the conflict's remote
 * version; if the store has moved on since the conflict was detected, the
 * write fails and the conflict stays open. A remote winner needs no write.
 */
#ifndef AGENTMEM_SYNC_CONFLICT_RESOLVER_HPP
#define AGENTMEM_SYNC_CONFLICT_RESOLVER_HPP

#include <agentmem/memory/types.hpp>
#include <agentmem/memory/repository.hpp>
#include <memory>
#include <string>
#include <vector>

namespace agentmem {

struct Resolution {
    Json value;
    bool local_won;
    int version;        // stored version holding the winning value

    Resolution() : local_won(false), version(0) {}
};

struct ResolvedConflict {
    MemoryConflict conflict;
    Resolution resolution;
};

class ConflictResolver {
public:
    explicit ConflictResolver(std::shared_ptr<MemoryRepository> repo);

    // Deterministic choice between local and remote. LAST_WRITE_WINS and
    // VERSION_BASED favor local on ties. MANUAL throws
    // ManualResolutionRequiredError.
    static Resolution resolve(const MemoryConflict& conflict, ConflictStrategy strategy);

    // Resolves and writes back one conflict for agent_id
    Resolution apply(const std::string& agent_id,
                     const MemoryConflict& conflict,
                     ConflictStrategy strategy);

    // Resolves every open conflict of (agent_id, instance_id). Resolved ones
    // are removed from the status, which returns to synced when none remain.
    // Successful resolutions are appended to resolved (when given) before
    // UnresolvedConflictsError reports the ones that failed.
    int resolve_all(const std::string& agent_id,
                    const std::string& instance_id,
                    ConflictStrategy strategy,
                    std::vector<ResolvedConflict>* resolved = nullptr);

private:
    std::shared_ptr<MemoryRepository> repo_;

    void write_back(const std::string& agent_id, const MemoryConflict& conflict,
                    Resolution& resolution);
};

} // namespace agentmem

#endif // AGENTMEM_SYNC_CONFLICT_RESOLVER_HPP
