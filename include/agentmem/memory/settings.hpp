/*
 * agentmem - Memory service settings
 *
 * Typed view of the configuration keys the memory service reads, and the
 * factory that builds the configured store.
 */
#ifndef AGENTMEM_MEMORY_SETTINGS_HPP
#define AGENTMEM_MEMORY_SETTINGS_HPP

#include "types.hpp"
#include "repository.hpp"
#include <agentmem/core/config.hpp>
#include <agentmem/core/logger.hpp>
#include <memory>
#include <string>

namespace agentmem {

struct MemorySettings {
    std::string backend;            // "sqlite" or "memory"
    std::string db_path;
    LogLevel log_level;
    int64_t default_ttl_ms;         // working memory TTL when none is given
    int telemetry_workers;
    int64_t sync_interval_ms;
    ConflictStrategy sync_strategy;
    std::string instance_id;        // empty: a random id per coordinator

    MemorySettings();

    // Unknown values fall back to the defaults above (logged at WARN)
    static MemorySettings from_config(const Config& cfg);
};

// Builds and opens the configured store. Throws RepositoryError when the
// backend is unknown or cannot be opened.
std::shared_ptr<MemoryRepository> create_repository(const MemorySettings& settings);

} // namespace agentmem

#endif // AGENTMEM_MEMORY_SETTINGS_HPP
