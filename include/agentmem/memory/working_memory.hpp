/*
 * agentmem - Working memory manager
 *
 * TTL-bounded per-agent key/value context. Reads bump access telemetry in
 * the background; rewrites go through the optimistic version check.
 */
#ifndef AGENTMEM_MEMORY_WORKING_MEMORY_HPP
#define AGENTMEM_MEMORY_WORKING_MEMORY_HPP

#include "types.hpp"
#include "repository.hpp"
#include <agentmem/core/task_dispatcher.hpp>
#include <agentmem/core/utils.hpp>
#include <memory>
#include <string>
#include <vector>

namespace agentmem {

class WorkingMemoryManager {
public:
    WorkingMemoryManager(std::shared_ptr<MemoryRepository> repo,
                         TaskDispatcher& dispatcher,
                         int64_t default_ttl_ms = MS_PER_HOUR);

    // New entry at version 1. ttl_ms <= 0 uses the default TTL.
    // Throws ValidationError, AlreadyExistsError, RepositoryError.
    WorkingMemory store(const std::string& agent_id,
                        const std::string& key,
                        const Json& value,
                        int64_t ttl_ms,
                        const Json& metadata = Json::object());

    // Throws NotFoundError, or ExpiredError after scheduling removal of the entry
    WorkingMemory retrieve(const std::string& agent_id, const std::string& key);

    // Replace the value if the stored version is still expected_version.
    // Throws VersionConflictError when another writer got there first.
    WorkingMemory update(const std::string& agent_id,
                         const std::string& key,
                         const Json& value,
                         int expected_version);

    // Single attempt against the version read just before
    WorkingMemory update(const std::string& agent_id, const std::string& key, const Json& value);

    void remove(const std::string& agent_id, const std::string& key);

    // Returns the number of entries removed
    int clear(const std::string& agent_id);

    // Live entries only
    std::vector<WorkingMemory> list(const std::string& agent_id,
                                    const MemoryFilters& filters = MemoryFilters());

    int64_t default_ttl_ms() const { return default_ttl_ms_; }

private:
    std::shared_ptr<MemoryRepository> repo_;
    TaskDispatcher& dispatcher_;
    int64_t default_ttl_ms_;

    WorkingMemory load(const std::string& agent_id, const std::string& key);
    void schedule_touch(const std::string& agent_id, const std::string& key, int64_t now);
    void schedule_expired_delete(const std::string& agent_id, const std::string& key, int64_t now);
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_WORKING_MEMORY_HPP
