#include <agentmem/memory/snapshot.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <map>

namespace agentmem {

SnapshotManager::SnapshotManager(std::shared_ptr<MemoryRepository> repo)
    : repo_(repo)
{
}

StateSnapshot SnapshotManager::create(const std::string& agent_id,
                                      const std::string& type,
                                      const std::string& reason) {
    std::string name = to_lower(trim(type));
    SnapshotType t = string_to_snapshot_type(name);
    if (!name.empty() && snapshot_type_to_string(t) != name) {
        LOG_WARN("[Snapshot] Unknown snapshot type '%s', treating as manual", type.c_str());
    }
    return create(agent_id, t, reason);
}

StateSnapshot SnapshotManager::create(const std::string& agent_id,
                                      SnapshotType type,
                                      const std::string& reason) {
    require_non_empty(agent_id, "agent_id");

    int64_t now = current_timestamp_ms();

    StateSnapshot s;
    s.id = generate_uuid();
    s.agent_id = agent_id;
    s.snapshot_type = type;
    s.state = capture_state(agent_id, now);
    s.checksum = compute_state_checksum(s.state);
    s.metadata.trigger = snapshot_type_to_string(type);
    s.metadata.reason = reason.empty() ? "manual snapshot" : reason;
    s.metadata.size_bytes = static_cast<int64_t>(s.state.dump().size());
    s.metadata.compressed = false;
    s.created_at = now;
    s.expires_at = now + snapshot_retention_ms(type);
    s.version = 1;

    StoreStatus st = repo_->create_snapshot(s);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "snapshot", s.id, "create", repo_->last_error());
    }

    LOG_INFO("[Snapshot] Created %s snapshot %s for %s (%lld bytes)",
             s.metadata.trigger.c_str(), s.id.c_str(), agent_id.c_str(),
             (long long)s.metadata.size_bytes);
    return s;
}

Json SnapshotManager::capture_state(const std::string& agent_id, int64_t now) {
    MemoryFilters live;
    live.live_at = now;
    live.sort_by = "key";

    std::vector<WorkingMemory> working;
    StoreStatus st = repo_->list_working(agent_id, live, working);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", agent_id, "list", repo_->last_error());
    }

    MemoryFilters by_key;
    by_key.sort_by = "key";
    std::vector<LongtermMemory> longterm;
    st = repo_->list_longterm(agent_id, by_key, longterm);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", agent_id, "list", repo_->last_error());
    }

    Json entries = Json::array();
    std::vector<std::string> working_keys;
    for (size_t i = 0; i < working.size(); ++i) {
        const WorkingMemory& m = working[i];
        Json e = Json::object();
        e.set("key", m.key);
        e.set("value", m.value);
        e.set("metadata", m.metadata);
        e.set("expires_at", m.expires_at);
        e.set("version", m.version);
        entries.push(e);
        working_keys.push_back(m.key);
    }

    std::vector<std::string> longterm_keys;
    std::map<std::string, int> counts;
    for (size_t i = 0; i < longterm.size(); ++i) {
        longterm_keys.push_back(longterm[i].key);
        counts[longterm[i].category]++;
    }
    Json categories = Json::object();
    for (std::map<std::string, int>::const_iterator it = counts.begin(); it != counts.end(); ++it) {
        categories.set(it->first, it->second);
    }

    Json state = Json::object();
    state.set("agent_id", agent_id);
    state.set("snapshot_time", now);
    state.set("working_memory", entries);
    state.set("working_keys", Json::from_strings(working_keys));
    state.set("longterm_keys", Json::from_strings(longterm_keys));
    state.set("longterm_categories", categories);
    return state;
}

RestoreReport SnapshotManager::restore(const std::string& agent_id, const std::string& snapshot_id) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(snapshot_id, "snapshot_id");

    StateSnapshot s = get(snapshot_id);
    if (s.agent_id != agent_id) {
        throw OwnershipError("snapshot '" + snapshot_id + "' does not belong to agent '" +
                             agent_id + "'");
    }
    if (!verify(s)) {
        throw IntegrityError("snapshot '" + snapshot_id + "' failed checksum verification");
    }

    int64_t now = current_timestamp_ms();
    RestoreReport report;
    report.snapshot_id = snapshot_id;

    int removed = 0;
    StoreStatus st = repo_->clear_working(agent_id, removed);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", agent_id, "clear", repo_->last_error());
    }

    const std::vector<Json>& entries = s.state["working_memory"].as_array();
    for (size_t i = 0; i < entries.size(); ++i) {
        const Json& e = entries[i];

        WorkingMemory m;
        m.id = generate_uuid();
        m.agent_id = agent_id;
        m.key = e.get_string("key");
        m.value = e["value"];
        m.metadata = e["metadata"].is_object() ? e["metadata"] : Json::object();
        m.expires_at = e.get_int64("expires_at");
        m.created_at = now;
        m.updated_at = now;
        m.accessed_at = now;
        // Above the captured version, so views taken before the restore are stale
        m.version = e.get_int("version", 0) + 1;

        if (m.key.empty()) continue;
        if (m.is_expired(now)) {
            report.skipped_expired++;
            continue;
        }

        st = repo_->create_working(m);
        if (st != StoreStatus::OK) {
            raise_store_error(st, "working memory", m.key, "restore", repo_->last_error());
        }
        report.restored++;
    }

    LOG_INFO("[Snapshot] Restored %s for %s: %d entries (%d expired, %d replaced)",
             snapshot_id.c_str(), agent_id.c_str(), report.restored, report.skipped_expired, removed);
    return report;
}

std::vector<StateSnapshot> SnapshotManager::list(const std::string& agent_id,
                                                 const SnapshotFilters& filters) {
    require_non_empty(agent_id, "agent_id");

    std::vector<StateSnapshot> out;
    StoreStatus st = repo_->list_snapshots(agent_id, filters, out);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "snapshot", agent_id, "list", repo_->last_error());
    }
    return out;
}

StateSnapshot SnapshotManager::get(const std::string& snapshot_id) {
    require_non_empty(snapshot_id, "snapshot_id");

    StateSnapshot s;
    StoreStatus st = repo_->get_snapshot(snapshot_id, s);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "snapshot", snapshot_id, "get", repo_->last_error());
    }
    return s;
}

bool SnapshotManager::verify(const StateSnapshot& snapshot) {
    return !snapshot.checksum.empty() && compute_state_checksum(snapshot.state) == snapshot.checksum;
}

void SnapshotManager::remove(const std::string& snapshot_id) {
    require_non_empty(snapshot_id, "snapshot_id");

    StoreStatus st = repo_->delete_snapshot(snapshot_id);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "snapshot", snapshot_id, "delete", repo_->last_error());
    }
    LOG_DEBUG("[Snapshot] Deleted %s", snapshot_id.c_str());
}

} // namespace agentmem
