#include <agentmem/service/memory_service.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/memory/serialization.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

namespace {

const MemorySettings& with_log_level(const MemorySettings& settings) {
    Logger::instance().set_level(settings.log_level);
    return settings;
}

} // namespace

MemoryService::MemoryService(const MemorySettings& settings)
    : MemoryService(create_repository(with_log_level(settings)), settings)
{
}

MemoryService::MemoryService(std::shared_ptr<MemoryRepository> repo, const MemorySettings& settings)
    : settings_(with_log_level(settings))
    , repo_(repo)
    , dispatcher_(static_cast<size_t>(settings.telemetry_workers), "telemetry")
    , working_(repo, dispatcher_, settings.default_ttl_ms)
    , longterm_(repo, dispatcher_)
    , snapshots_(repo)
    , sync_(repo, settings.instance_id, settings.sync_strategy, settings.sync_interval_ms)
    , shut_down_(false)
{
    if (!repo_) {
        throw ValidationError("memory service requires a repository");
    }
    LOG_INFO("[MemoryService] Ready (backend=%s, instance=%s, strategy=%s)",
             repo_->backend().c_str(), sync_.instance_id().c_str(),
             conflict_strategy_to_string(sync_.strategy()).c_str());
}

MemoryService::~MemoryService() {
    shutdown();
}

int MemoryService::cleanup_expired() {
    int removed = 0;
    StoreStatus st = repo_->cleanup_expired(current_timestamp_ms(), removed);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "expired entries", "*", "cleanup", repo_->last_error());
    }
    if (removed > 0) {
        LOG_INFO("[MemoryService] Cleaned up %d expired entries", removed);
    }
    return removed;
}

MemoryStats MemoryService::stats(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");

    MemoryStats stats;
    stats.agent_id = agent_id;

    std::vector<WorkingMemory> working;
    StoreStatus st = repo_->list_working(agent_id, MemoryFilters(), working);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", agent_id, "list", repo_->last_error());
    }
    stats.working_memory_count = static_cast<int>(working.size());
    for (size_t i = 0; i < working.size(); ++i) {
        stats.working_memory_size_bytes += static_cast<int64_t>(to_json(working[i]).dump().size());
    }

    std::vector<LongtermMemory> longterm;
    st = repo_->list_longterm(agent_id, MemoryFilters(), longterm);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", agent_id, "list", repo_->last_error());
    }
    stats.longterm_memory_count = static_cast<int>(longterm.size());
    for (size_t i = 0; i < longterm.size(); ++i) {
        stats.longterm_memory_size_bytes += static_cast<int64_t>(to_json(longterm[i]).dump().size());
    }

    // Newest first
    std::vector<StateSnapshot> snapshots = snapshots_.list(agent_id);
    stats.snapshot_count = static_cast<int>(snapshots.size());
    int64_t snapshot_bytes = 0;
    for (size_t i = 0; i < snapshots.size(); ++i) {
        snapshot_bytes += snapshots[i].metadata.size_bytes;
    }
    if (!snapshots.empty()) {
        stats.last_snapshot_at = snapshots.front().created_at;
    }

    std::vector<SyncStatus> statuses;
    st = repo_->list_sync_status(agent_id, statuses);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "sync status", agent_id, "list", repo_->last_error());
    }
    for (size_t i = 0; i < statuses.size(); ++i) {
        if (statuses[i].last_sync_at > stats.last_sync_at) {
            stats.last_sync_at = statuses[i].last_sync_at;
        }
    }

    stats.total_size_bytes = stats.working_memory_size_bytes + stats.longterm_memory_size_bytes +
                            snapshot_bytes;
    return stats;
}

void MemoryService::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    if (sync_.is_running()) {
        try {
            sync_.stop_periodic_sync();
        } catch (const NotRunningError& e) {
            LOG_DEBUG("[MemoryService] %s", e.what());
        }
    }
    dispatcher_.shutdown();
    LOG_INFO("[MemoryService] Shut down");
}

} // namespace agentmem
