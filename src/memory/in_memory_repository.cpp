#include <agentmem/memory/in_memory_repository.hpp>
#include <agentmem/memory/query.hpp>

namespace agentmem {

InMemoryRepository::InMemoryRepository() {}

InMemoryRepository::~InMemoryRepository() {}

StoreStatus InMemoryRepository::fail(StoreStatus status, const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_errors_[std::this_thread::get_id()] = error;
    return status;
}

std::string InMemoryRepository::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    std::map<std::thread::id, std::string>::const_iterator it =
        last_errors_.find(std::this_thread::get_id());
    return it == last_errors_.end() ? std::string() : it->second;
}

// ============================================================================
// Working memory
// ============================================================================

StoreStatus InMemoryRepository::create_working(const WorkingMemory& memory) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    EntryKey k(memory.agent_id, memory.key);
    if (working_.count(k)) {
        return fail(StoreStatus::DUPLICATE, "working memory '" + memory.key + "' already exists");
    }
    working_[k] = memory;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::get_working(const std::string& agent_id, const std::string& key,
                                            WorkingMemory& out) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    std::map<EntryKey, WorkingMemory>::const_iterator it = working_.find(EntryKey(agent_id, key));
    if (it == working_.end()) {
        return fail(StoreStatus::NOT_FOUND, "working memory '" + key + "' not found");
    }
    out = it->second;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::update_working(const WorkingMemory& memory, int expected_version) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    std::map<EntryKey, WorkingMemory>::iterator it =
        working_.find(EntryKey(memory.agent_id, memory.key));
    if (it == working_.end()) {
        return fail(StoreStatus::NOT_FOUND, "working memory '" + memory.key + "' not found");
    }
    if (it->second.version != expected_version) {
        return fail(StoreStatus::VERSION_MISMATCH, "working memory '" + memory.key + "' is at version " +
                    std::to_string(it->second.version));
    }
    WorkingMemory updated = memory;
    updated.id = it->second.id;
    updated.created_at = it->second.created_at;
    updated.accessed_at = it->second.accessed_at;
    updated.access_count = it->second.access_count;
    it->second = updated;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::touch_working(const std::string& agent_id, const std::string& key,
                                              int64_t accessed_at) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    std::map<EntryKey, WorkingMemory>::iterator it = working_.find(EntryKey(agent_id, key));
    if (it == working_.end()) {
        return fail(StoreStatus::NOT_FOUND, "working memory '" + key + "' not found");
    }
    it->second.access_count++;
    it->second.accessed_at = accessed_at;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::delete_working(const std::string& agent_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    if (working_.erase(EntryKey(agent_id, key)) == 0) {
        return fail(StoreStatus::NOT_FOUND, "working memory '" + key + "' not found");
    }
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::delete_working_if_expired(const std::string& agent_id,
                                                          const std::string& key,
                                                          int64_t now_ms) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    std::map<EntryKey, WorkingMemory>::iterator it = working_.find(EntryKey(agent_id, key));
    if (it == working_.end() || !it->second.is_expired(now_ms)) {
        return fail(StoreStatus::NOT_FOUND, "no expired working memory '" + key + "'");
    }
    working_.erase(it);
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::list_working(const std::string& agent_id, const MemoryFilters& filters,
                                             std::vector<WorkingMemory>& out) {
    std::vector<WorkingMemory> items;
    {
        std::lock_guard<std::mutex> lock(working_mutex_);
        std::map<EntryKey, WorkingMemory>::const_iterator it =
            working_.lower_bound(EntryKey(agent_id, ""));
        for (; it != working_.end() && it->first.first == agent_id; ++it) {
            items.push_back(it->second);
        }
    }
    apply_filters(items, filters);
    out.swap(items);
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::clear_working(const std::string& agent_id, int& removed) {
    std::lock_guard<std::mutex> lock(working_mutex_);
    removed = 0;
    std::map<EntryKey, WorkingMemory>::iterator it = working_.lower_bound(EntryKey(agent_id, ""));
    while (it != working_.end() && it->first.first == agent_id) {
        working_.erase(it++);
        removed++;
    }
    return StoreStatus::OK;
}

// ============================================================================
// Long-term memory
// ============================================================================

StoreStatus InMemoryRepository::create_longterm(const LongtermMemory& memory) {
    std::lock_guard<std::mutex> lock(longterm_mutex_);
    EntryKey k(memory.agent_id, memory.key);
    if (longterm_.count(k)) {
        return fail(StoreStatus::DUPLICATE, "long-term memory '" + memory.key + "' already exists");
    }
    longterm_[k] = memory;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::get_longterm(const std::string& agent_id, const std::string& key,
                                             LongtermMemory& out) {
    std::lock_guard<std::mutex> lock(longterm_mutex_);
    std::map<EntryKey, LongtermMemory>::const_iterator it = longterm_.find(EntryKey(agent_id, key));
    if (it == longterm_.end()) {
        return fail(StoreStatus::NOT_FOUND, "long-term memory '" + key + "' not found");
    }
    out = it->second;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::update_longterm(const LongtermMemory& memory, int expected_version) {
    std::lock_guard<std::mutex> lock(longterm_mutex_);
    std::map<EntryKey, LongtermMemory>::iterator it =
        longterm_.find(EntryKey(memory.agent_id, memory.key));
    if (it == longterm_.end()) {
        return fail(StoreStatus::NOT_FOUND, "long-term memory '" + memory.key + "' not found");
    }
    if (it->second.version != expected_version) {
        return fail(StoreStatus::VERSION_MISMATCH, "long-term memory '" + memory.key + "' is at version " +
                    std::to_string(it->second.version));
    }
    LongtermMemory updated = memory;
    updated.id = it->second.id;
    updated.created_at = it->second.created_at;
    updated.last_accessed = it->second.last_accessed;
    updated.access_count = it->second.access_count;
    it->second = updated;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::touch_longterm(const std::string& agent_id, const std::string& key,
                                               int64_t accessed_at) {
    std::lock_guard<std::mutex> lock(longterm_mutex_);
    std::map<EntryKey, LongtermMemory>::iterator it = longterm_.find(EntryKey(agent_id, key));
    if (it == longterm_.end()) {
        return fail(StoreStatus::NOT_FOUND, "long-term memory '" + key + "' not found");
    }
    it->second.access_count++;
    it->second.last_accessed = accessed_at;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::delete_longterm(const std::string& agent_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(longterm_mutex_);
    if (longterm_.erase(EntryKey(agent_id, key)) == 0) {
        return fail(StoreStatus::NOT_FOUND, "long-term memory '" + key + "' not found");
    }
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::list_longterm(const std::string& agent_id, const MemoryFilters& filters,
                                              std::vector<LongtermMemory>& out) {
    std::vector<LongtermMemory> items;
    {
        std::lock_guard<std::mutex> lock(longterm_mutex_);
        std::map<EntryKey, LongtermMemory>::const_iterator it =
            longterm_.lower_bound(EntryKey(agent_id, ""));
        for (; it != longterm_.end() && it->first.first == agent_id; ++it) {
            items.push_back(it->second);
        }
    }
    apply_filters(items, filters);
    out.swap(items);
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::search_longterm(const std::string& agent_id, const MemoryQuery& query,
                                                std::vector<LongtermMemory>& out) {
    return list_longterm(agent_id, query.filters, out);
}

// ============================================================================
// Snapshots
// ============================================================================

StoreStatus InMemoryRepository::create_snapshot(const StateSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (snapshots_.count(snapshot.id)) {
        return fail(StoreStatus::DUPLICATE, "snapshot '" + snapshot.id + "' already exists");
    }
    snapshots_[snapshot.id] = snapshot;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::get_snapshot(const std::string& snapshot_id, StateSnapshot& out) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    std::map<std::string, StateSnapshot>::const_iterator it = snapshots_.find(snapshot_id);
    if (it == snapshots_.end()) {
        return fail(StoreStatus::NOT_FOUND, "snapshot '" + snapshot_id + "' not found");
    }
    out = it->second;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::list_snapshots(const std::string& agent_id,
                                               const SnapshotFilters& filters,
                                               std::vector<StateSnapshot>& out) {
    std::vector<StateSnapshot> items;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        for (std::map<std::string, StateSnapshot>::const_iterator it = snapshots_.begin();
             it != snapshots_.end(); ++it) {
            if (it->second.agent_id == agent_id) items.push_back(it->second);
        }
    }
    apply_filters(items, filters);
    out.swap(items);
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::delete_snapshot(const std::string& snapshot_id) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (snapshots_.erase(snapshot_id) == 0) {
        return fail(StoreStatus::NOT_FOUND, "snapshot '" + snapshot_id + "' not found");
    }
    return StoreStatus::OK;
}

// ============================================================================
// Sync status
// ============================================================================

StoreStatus InMemoryRepository::get_sync_status(const std::string& agent_id,
                                                const std::string& instance_id,
                                                SyncStatus& out) {
    std::lock_guard<std::mutex> lock(sync_mutex_);
    std::map<EntryKey, SyncStatus>::const_iterator it = sync_.find(EntryKey(agent_id, instance_id));
    if (it == sync_.end()) {
        return fail(StoreStatus::NOT_FOUND, "no sync status for '" + agent_id + "'");
    }
    out = it->second;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::upsert_sync_status(const SyncStatus& status) {
    std::lock_guard<std::mutex> lock(sync_mutex_);
    sync_[EntryKey(status.agent_id, status.instance_id)] = status;
    return StoreStatus::OK;
}

StoreStatus InMemoryRepository::list_sync_status(const std::string& agent_id,
                                                 std::vector<SyncStatus>& out) {
    std::lock_guard<std::mutex> lock(sync_mutex_);
    out.clear();
    std::map<EntryKey, SyncStatus>::const_iterator it = sync_.lower_bound(EntryKey(agent_id, ""));
    for (; it != sync_.end() && it->first.first == agent_id; ++it) {
        out.push_back(it->second);
    }
    return StoreStatus::OK;
}

// ============================================================================
// Maintenance
// ============================================================================

StoreStatus InMemoryRepository::cleanup_expired(int64_t now_ms, int& removed) {
    removed = 0;
    {
        std::lock_guard<std::mutex> lock(working_mutex_);
        std::map<EntryKey, WorkingMemory>::iterator it = working_.begin();
        while (it != working_.end()) {
            if (it->second.is_expired(now_ms)) {
                working_.erase(it++);
                removed++;
            } else {
                ++it;
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        std::map<std::string, StateSnapshot>::iterator it = snapshots_.begin();
        while (it != snapshots_.end()) {
            if (it->second.expires_at > 0 && it->second.expires_at < now_ms) {
                snapshots_.erase(it++);
                removed++;
            } else {
                ++it;
            }
        }
    }
    return StoreStatus::OK;
}

} // namespace agentmem
