#include <agentmem/sync/sync_coordinator.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <chrono>
#include <set>

namespace agentmem {

SyncCoordinator::SyncCoordinator(std::shared_ptr<MemoryRepository> repo,
                                 const std::string& instance_id,
                                 ConflictStrategy strategy,
                                 int64_t default_interval_ms)
    : repo_(repo)
    , resolver_(repo)
    , instance_id_(instance_id.empty() ? generate_uuid() : instance_id)
    , default_interval_ms_(default_interval_ms > 0 ? default_interval_ms : 5 * MS_PER_MINUTE)
    , strategy_(strategy)
    , stop_requested_(false)
    , running_(false)
{
    LOG_DEBUG("[SyncCoordinator] Instance %s using %s", instance_id_.c_str(),
              conflict_strategy_to_string(strategy_).c_str());
}

SyncCoordinator::~SyncCoordinator() {
    if (running_.load()) {
        try {
            stop_periodic_sync();
        } catch (const NotRunningError&) {
            // Stopped concurrently
        }
    }
}

// ============================================================================
// Periodic loop
// ============================================================================

void SyncCoordinator::start_periodic_sync(const std::string& agent_id, int64_t interval_ms) {
    require_non_empty(agent_id, "agent_id");

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        throw AlreadyRunningError("periodic sync already running on instance " + instance_id_);
    }
    if (interval_ms <= 0) interval_ms = default_interval_ms_;

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    loop_thread_ = std::thread(&SyncCoordinator::sync_loop, this, agent_id, interval_ms);

    LOG_INFO("[SyncCoordinator] Started periodic sync for %s every %lld ms (instance %s)",
             agent_id.c_str(), (long long)interval_ms, instance_id_.c_str());
}

void SyncCoordinator::stop_periodic_sync() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load()) {
        throw NotRunningError("periodic sync not running on instance " + instance_id_);
    }

    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = true;
    }
    loop_cv_.notify_all();

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    running_.store(false);

    LOG_INFO("[SyncCoordinator] Stopped periodic sync (instance %s)", instance_id_.c_str());
}

void SyncCoordinator::sync_loop(std::string agent_id, int64_t interval_ms) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(loop_mutex_);
            if (loop_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
                                  [this] { return stop_requested_; })) {
                break;
            }
        }

        // A failed pass is retried on the next tick
        try {
            SyncResult result = sync_agent(agent_id);
            if (!result.success) {
                LOG_WARN("[SyncCoordinator] Periodic sync of %s finished with errors: %s",
                         agent_id.c_str(), join(result.errors, "; ").c_str());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("[SyncCoordinator] Periodic sync of %s failed: %s", agent_id.c_str(), e.what());
        }
    }
    LOG_DEBUG("[SyncCoordinator] Loop for %s exited", agent_id.c_str());
}

// ============================================================================
// Sync pass
// ============================================================================

SyncResult SyncCoordinator::sync_agent(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");

    std::shared_ptr<std::mutex> agent_mutex = agent_lock(agent_id);
    std::lock_guard<std::mutex> guard(*agent_mutex);

    int64_t started = current_timestamp_ms();
    SyncResult result;
    result.agent_id = agent_id;
    result.synced_at = started;

    SyncStatus status;
    try {
        status = load_status(agent_id);
    } catch (const MemoryError& e) {
        result.errors.push_back(std::string("failed to get sync status: ") + e.what());
        result.duration_ms = current_timestamp_ms() - started;
        return result;
    }

    status.status = SyncState::SYNCING;
    status.last_sync_at = started;
    try {
        save_status(status);
    } catch (const MemoryError& e) {
        result.errors.push_back(std::string("failed to update sync status: ") + e.what());
    }

    // Push staged edits, or turn them into conflicts
    std::vector<StagedChange> staged = take_staged(agent_id);
    for (size_t i = 0; i < staged.size(); ++i) {
        const StagedChange& change = staged[i];
        std::string vk = view_key(change.type, change.key);

        try {
            StoredEntry current;
            if (!read_entry(agent_id, change.type, change.key, current)) {
                result.errors.push_back("'" + change.key + "' no longer exists; staged change dropped");
                continue;
            }

            if (current.version == change.base_version) {
                StoreStatus st = write_entry(agent_id, change, change.base_version);
                if (st == StoreStatus::OK) {
                    mark_seen(agent_id, vk, change.base_version + 1);
                    result.items_synced++;
                    continue;
                }
                if (st == StoreStatus::NOT_FOUND) {
                    result.errors.push_back("'" + change.key + "' no longer exists; staged change dropped");
                    continue;
                }
                if (st != StoreStatus::VERSION_MISMATCH) {
                    raise_store_error(st, memory_type_to_string(change.type), change.key, "push",
                                      repo_->last_error());
                }
                // Lost the race: whatever is stored now is the remote side
                if (!read_entry(agent_id, change.type, change.key, current)) {
                    result.errors.push_back("'" + change.key + "' no longer exists; staged change dropped");
                    continue;
                }
            }

            MemoryConflict conflict;
            conflict.key = change.key;
            conflict.memory_type = change.type;
            conflict.local_version = change.base_version;
            conflict.remote_version = current.version;
            conflict.local_value = change.value;
            conflict.remote_value = current.value;
            conflict.local_time = change.staged_at;
            conflict.remote_time = current.updated_at;
            conflict.detected_at = current_timestamp_ms();
            merge_conflict(status.conflicts, conflict);
            mark_seen(agent_id, vk, current.version);

            LOG_WARN("[SyncCoordinator] Conflict on %s/%s: local v%d, stored v%d",
                     agent_id.c_str(), change.key.c_str(), change.base_version, current.version);
        } catch (const MemoryError& e) {
            result.errors.push_back("push of '" + change.key + "' failed: " + e.what());
            restage(agent_id, change);
        }
    }

    // Pull: refresh the view from the store
    try {
        std::map<std::string, StoredEntry> entries;
        load_entries(agent_id, entries);

        std::lock_guard<std::mutex> lock(views_mutex_);
        AgentView& view = views_[agent_id];
        std::map<std::string, int> refreshed;
        for (std::map<std::string, StoredEntry>::const_iterator it = entries.begin();
             it != entries.end(); ++it) {
            std::map<std::string, int>::const_iterator seen = view.seen.find(it->first);
            if (seen == view.seen.end() || seen->second != it->second.version) {
                result.items_synced++;
            }
            refreshed[it->first] = it->second.version;
        }
        view.seen.swap(refreshed);
    } catch (const MemoryError& e) {
        result.errors.push_back(std::string("pull failed: ") + e.what());
    }

    if (!status.conflicts.empty()) {
        status.status = SyncState::CONFLICT;
    } else if (!result.errors.empty()) {
        status.status = SyncState::ERROR;
    } else {
        status.status = SyncState::SYNCED;
    }
    status.pending_changes = 0;
    status.sync_version++;
    status.last_sync_at = current_timestamp_ms();
    try {
        save_status(status);
    } catch (const MemoryError& e) {
        result.errors.push_back(std::string("failed to update final sync status: ") + e.what());
    }

    result.conflicts = status.conflicts;
    result.duration_ms = current_timestamp_ms() - started;
    result.success = result.errors.empty();

    LOG_INFO("[SyncCoordinator] Synced %s: %d items, %zu conflicts, %zu errors in %lld ms",
             agent_id.c_str(), result.items_synced, result.conflicts.size(),
             result.errors.size(), (long long)result.duration_ms);
    return result;
}

// ============================================================================
// Staging
// ============================================================================

void SyncCoordinator::stage_change(const std::string& agent_id,
                                   MemoryType type,
                                   const std::string& key,
                                   const Json& value) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    std::string vk = view_key(type, key);
    int64_t now = current_timestamp_ms();

    std::shared_ptr<std::mutex> agent_mutex = agent_lock(agent_id);
    std::lock_guard<std::mutex> guard(*agent_mutex);

    int base = 0;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(views_mutex_);
        AgentView& view = views_[agent_id];
        std::map<std::string, StagedChange>::iterator staged = view.staged.find(vk);
        if (staged != view.staged.end()) {
            // Later edit, same base
            staged->second.value = value;
            staged->second.staged_at = now;
            return;
        }
        std::map<std::string, int>::const_iterator seen = view.seen.find(vk);
        if (seen != view.seen.end()) {
            base = seen->second;
            known = true;
        }
    }

    if (!known) {
        StoredEntry current;
        if (!read_entry(agent_id, type, key, current)) {
            throw NotFoundError(memory_type_to_string(type) + " memory '" + key + "' not found");
        }
        base = current.version;
    }

    StagedChange change;
    change.type = type;
    change.key = key;
    change.value = value;
    change.base_version = base;
    change.staged_at = now;

    int pending = 0;
    {
        std::lock_guard<std::mutex> lock(views_mutex_);
        AgentView& view = views_[agent_id];
        view.staged[vk] = change;
        if (!known) view.seen[vk] = base;
        pending = static_cast<int>(view.staged.size());
    }

    SyncStatus status = load_status(agent_id);
    status.pending_changes = pending;
    save_status(status);

    LOG_DEBUG("[SyncCoordinator] Staged %s/%s on v%d (%d pending)",
              agent_id.c_str(), key.c_str(), base, pending);
}

int SyncCoordinator::pending_changes(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(views_mutex_);
    std::map<std::string, AgentView>::const_iterator it = views_.find(agent_id);
    return it == views_.end() ? 0 : static_cast<int>(it->second.staged.size());
}

std::vector<SyncCoordinator::StagedChange> SyncCoordinator::take_staged(const std::string& agent_id) {
    std::vector<StagedChange> out;
    std::lock_guard<std::mutex> lock(views_mutex_);
    AgentView& view = views_[agent_id];
    for (std::map<std::string, StagedChange>::const_iterator it = view.staged.begin();
         it != view.staged.end(); ++it) {
        out.push_back(it->second);
    }
    view.staged.clear();
    return out;
}

void SyncCoordinator::restage(const std::string& agent_id, const StagedChange& change) {
    std::lock_guard<std::mutex> lock(views_mutex_);
    AgentView& view = views_[agent_id];
    std::string vk = view_key(change.type, change.key);
    // A newer edit staged meanwhile wins
    if (view.staged.find(vk) == view.staged.end()) {
        view.staged[vk] = change;
    }
}

void SyncCoordinator::mark_seen(const std::string& agent_id, const std::string& vkey, int version) {
    std::lock_guard<std::mutex> lock(views_mutex_);
    views_[agent_id].seen[vkey] = version;
}

// ============================================================================
// Conflicts
// ============================================================================

std::vector<MemoryConflict> SyncCoordinator::detect_conflicts(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");
    return load_status(agent_id).conflicts;
}

int SyncCoordinator::resolve_conflicts(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");

    std::shared_ptr<std::mutex> agent_mutex = agent_lock(agent_id);
    std::lock_guard<std::mutex> guard(*agent_mutex);

    std::vector<ResolvedConflict> resolved;
    int count = 0;
    try {
        count = resolver_.resolve_all(agent_id, instance_id_, strategy(), &resolved);
    } catch (const UnresolvedConflictsError&) {
        apply_resolutions(agent_id, resolved);
        throw;
    }
    apply_resolutions(agent_id, resolved);
    return count;
}

void SyncCoordinator::apply_resolutions(const std::string& agent_id,
                                        const std::vector<ResolvedConflict>& resolved) {
    for (size_t i = 0; i < resolved.size(); ++i) {
        const MemoryConflict& c = resolved[i].conflict;
        mark_seen(agent_id, view_key(c.memory_type, c.key), resolved[i].resolution.version);
    }
}

void SyncCoordinator::merge_conflict(std::vector<MemoryConflict>& conflicts, const MemoryConflict& c) {
    for (size_t i = 0; i < conflicts.size(); ++i) {
        if (conflicts[i].same_target(c)) {
            conflicts[i] = c;
            return;
        }
    }
    conflicts.push_back(c);
}

// ============================================================================
// Overrides
// ============================================================================

SyncStatus SyncCoordinator::force_push(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");

    std::shared_ptr<std::mutex> agent_mutex = agent_lock(agent_id);
    std::lock_guard<std::mutex> guard(*agent_mutex);

    LOG_WARN("[SyncCoordinator] Force pushing local memory for %s (overwriting store)",
             agent_id.c_str());

    SyncStatus status = load_status(agent_id);

    // Open conflicts carry the local side; staged edits are newer still
    std::map<std::string, StagedChange> changes;
    for (size_t i = 0; i < status.conflicts.size(); ++i) {
        const MemoryConflict& c = status.conflicts[i];
        StagedChange change;
        change.type = c.memory_type;
        change.key = c.key;
        change.value = c.local_value;
        change.base_version = c.local_version;
        change.staged_at = c.local_time;
        changes[view_key(c.memory_type, c.key)] = change;
    }
    std::vector<StagedChange> staged = take_staged(agent_id);
    for (size_t i = 0; i < staged.size(); ++i) {
        changes[view_key(staged[i].type, staged[i].key)] = staged[i];
    }

    std::set<std::string> pushed;
    try {
        for (std::map<std::string, StagedChange>::const_iterator it = changes.begin();
             it != changes.end(); ++it) {
            const StagedChange& change = it->second;
            // Retry a few times against concurrent writers
            for (int attempt = 0; attempt < 3; ++attempt) {
                StoredEntry current;
                if (!read_entry(agent_id, change.type, change.key, current)) {
                    LOG_WARN("[SyncCoordinator] '%s' no longer exists, not pushed", change.key.c_str());
                    break;
                }
                StoreStatus st = write_entry(agent_id, change, current.version);
                if (st == StoreStatus::OK) {
                    mark_seen(agent_id, it->first, current.version + 1);
                    pushed.insert(it->first);
                    break;
                }
                if (st != StoreStatus::VERSION_MISMATCH && st != StoreStatus::NOT_FOUND) {
                    raise_store_error(st, memory_type_to_string(change.type), change.key, "force push",
                                      repo_->last_error());
                }
            }
        }
    } catch (const MemoryError& e) {
        // Unwritten staged edits stay queued; conflicts stay in the status
        for (size_t i = 0; i < staged.size(); ++i) {
            if (pushed.count(view_key(staged[i].type, staged[i].key)) == 0) {
                restage(agent_id, staged[i]);
            }
        }
        LOG_ERROR("[SyncCoordinator] Force push for %s failed after %zu writes: %s",
                  agent_id.c_str(), pushed.size(), e.what());
        throw;
    }

    int64_t now = current_timestamp_ms();
    status.conflicts.clear();
    status.pending_changes = 0;
    status.status = SyncState::SYNCED;
    status.last_sync_at = now;
    status.sync_version++;
    status.metadata.set("last_force_push", now);
    save_status(status);

    LOG_INFO("[SyncCoordinator] Force push for %s wrote %zu of %zu changes",
             agent_id.c_str(), pushed.size(), changes.size());
    return status;
}

SyncStatus SyncCoordinator::force_pull(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");

    std::shared_ptr<std::mutex> agent_mutex = agent_lock(agent_id);
    std::lock_guard<std::mutex> guard(*agent_mutex);

    LOG_WARN("[SyncCoordinator] Force pulling memory for %s (discarding local edits)",
             agent_id.c_str());

    SyncStatus status = load_status(agent_id);
    std::vector<StagedChange> discarded = take_staged(agent_id);

    std::map<std::string, StoredEntry> entries;
    load_entries(agent_id, entries);
    {
        std::lock_guard<std::mutex> lock(views_mutex_);
        AgentView& view = views_[agent_id];
        view.seen.clear();
        for (std::map<std::string, StoredEntry>::const_iterator it = entries.begin();
             it != entries.end(); ++it) {
            view.seen[it->first] = it->second.version;
        }
    }

    int64_t now = current_timestamp_ms();
    status.conflicts.clear();
    status.pending_changes = 0;
    status.status = SyncState::SYNCED;
    status.last_sync_at = now;
    status.sync_version++;
    status.metadata.set("last_force_pull", now);
    save_status(status);

    LOG_INFO("[SyncCoordinator] Force pull for %s: %zu entries, %zu local edits discarded",
             agent_id.c_str(), entries.size(), discarded.size());
    return status;
}

SyncStatus SyncCoordinator::status(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");
    return load_status(agent_id);
}

ConflictStrategy SyncCoordinator::strategy() const {
    std::lock_guard<std::mutex> lock(strategy_mutex_);
    return strategy_;
}

void SyncCoordinator::set_strategy(ConflictStrategy strategy) {
    {
        std::lock_guard<std::mutex> lock(strategy_mutex_);
        strategy_ = strategy;
    }
    LOG_INFO("[SyncCoordinator] Conflict strategy set to %s",
             conflict_strategy_to_string(strategy).c_str());
}

// ============================================================================
// Helpers
// ============================================================================

std::shared_ptr<std::mutex> SyncCoordinator::agent_lock(const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(agent_locks_mutex_);
    std::shared_ptr<std::mutex>& m = agent_locks_[agent_id];
    if (!m) m.reset(new std::mutex());
    return m;
}

std::string SyncCoordinator::view_key(MemoryType type, const std::string& key) {
    return memory_type_to_string(type) + ":" + key;
}

SyncStatus SyncCoordinator::load_status(const std::string& agent_id) {
    SyncStatus status;
    StoreStatus st = repo_->get_sync_status(agent_id, instance_id_, status);
    if (st == StoreStatus::NOT_FOUND) {
        SyncStatus fresh;
        fresh.agent_id = agent_id;
        fresh.instance_id = instance_id_;
        return fresh;
    }
    if (st != StoreStatus::OK) {
        raise_store_error(st, "sync status", agent_id, "get", repo_->last_error());
    }
    return status;
}

void SyncCoordinator::save_status(const SyncStatus& status) {
    StoreStatus st = repo_->upsert_sync_status(status);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "sync status", status.agent_id, "update", repo_->last_error());
    }
}

void SyncCoordinator::load_entries(const std::string& agent_id,
                                   std::map<std::string, StoredEntry>& out) {
    MemoryFilters live;
    live.live_at = current_timestamp_ms();

    std::vector<WorkingMemory> working;
    StoreStatus st = repo_->list_working(agent_id, live, working);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", agent_id, "list", repo_->last_error());
    }
    for (size_t i = 0; i < working.size(); ++i) {
        StoredEntry e;
        e.type = MemoryType::WORKING;
        e.key = working[i].key;
        e.value = working[i].value;
        e.version = working[i].version;
        e.updated_at = working[i].updated_at;
        out[view_key(e.type, e.key)] = e;
    }

    std::vector<LongtermMemory> longterm;
    st = repo_->list_longterm(agent_id, MemoryFilters(), longterm);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", agent_id, "list", repo_->last_error());
    }
    for (size_t i = 0; i < longterm.size(); ++i) {
        StoredEntry e;
        e.type = MemoryType::LONGTERM;
        e.key = longterm[i].key;
        e.value = longterm[i].value;
        e.version = longterm[i].version;
        e.updated_at = longterm[i].updated_at;
        out[view_key(e.type, e.key)] = e;
    }
}

bool SyncCoordinator::read_entry(const std::string& agent_id, MemoryType type,
                                 const std::string& key, StoredEntry& out) {
    StoreStatus st;
    out.type = type;
    out.key = key;
    if (type == MemoryType::WORKING) {
        WorkingMemory m;
        st = repo_->get_working(agent_id, key, m);
        if (st == StoreStatus::OK) {
            if (m.is_expired(current_timestamp_ms())) return false;
            out.value = m.value;
            out.version = m.version;
            out.updated_at = m.updated_at;
            return true;
        }
    } else {
        LongtermMemory m;
        st = repo_->get_longterm(agent_id, key, m);
        if (st == StoreStatus::OK) {
            out.value = m.value;
            out.version = m.version;
            out.updated_at = m.updated_at;
            return true;
        }
    }
    if (st == StoreStatus::NOT_FOUND) return false;
    raise_store_error(st, memory_type_to_string(type), key, "get", repo_->last_error());
    return false;
}

StoreStatus SyncCoordinator::write_entry(const std::string& agent_id, const StagedChange& change,
                                         int expected_version) {
    int64_t now = current_timestamp_ms();
    StoreStatus st;
    if (change.type == MemoryType::WORKING) {
        WorkingMemory m;
        st = repo_->get_working(agent_id, change.key, m);
        if (st != StoreStatus::OK) return st;
        m.value = change.value;
        m.updated_at = now;
        m.version = expected_version + 1;
        return repo_->update_working(m, expected_version);
    }
    LongtermMemory m;
    st = repo_->get_longterm(agent_id, change.key, m);
    if (st != StoreStatus::OK) return st;
    m.value = change.value;
    m.updated_at = now;
    m.version = expected_version + 1;
    return repo_->update_longterm(m, expected_version);
}

} // namespace agentmem
