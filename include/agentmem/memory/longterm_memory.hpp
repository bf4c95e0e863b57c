/*
 * agentmem - Long-term memory manager
 *
 * Durable, categorized knowledge per agent. Search is filter-based;
 * archive sweeps entries that satisfy every bound of an ArchiveCriteria.
 */
#ifndef AGENTMEM_MEMORY_LONGTERM_MEMORY_HPP
#define AGENTMEM_MEMORY_LONGTERM_MEMORY_HPP

#include "types.hpp"
#include "repository.hpp"
#include <agentmem/core/task_dispatcher.hpp>
#include <memory>
#include <string>
#include <vector>

namespace agentmem {

class LongtermMemoryManager {
public:
    LongtermMemoryManager(std::shared_ptr<MemoryRepository> repo, TaskDispatcher& dispatcher);

    // Empty category becomes "general"; importance 0 becomes 5 and
    // confidence 0 becomes 1.0. Importance is clamped to 1-10, confidence to 0-1.
    LongtermMemory remember(const std::string& agent_id,
                            const std::string& key,
                            const Json& value,
                            const std::string& category = "",
                            const MemoryMetadata& metadata = MemoryMetadata());

    LongtermMemory recall(const std::string& agent_id, const std::string& key);

    std::vector<LongtermMemory> search(const std::string& agent_id, const MemoryQuery& query);

    // Optimistic revision of value (and optionally metadata)
    LongtermMemory update(const std::string& agent_id,
                          const std::string& key,
                          const Json& value,
                          int expected_version);
    LongtermMemory update(const std::string& agent_id,
                          const std::string& key,
                          const Json& value,
                          const MemoryMetadata& metadata,
                          int expected_version);

    void forget(const std::string& agent_id, const std::string& key);

    // With criteria.dry_run nothing is removed; the report lists what would be
    ArchiveReport archive(const std::string& agent_id, const ArchiveCriteria& criteria);

private:
    std::shared_ptr<MemoryRepository> repo_;
    TaskDispatcher& dispatcher_;

    LongtermMemory apply_update(const LongtermMemory& current, int expected_version);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_LONGTERM_MEMORY_HPP
