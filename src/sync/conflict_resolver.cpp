#include <agentmem/sync/conflict_resolver.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

namespace {

Resolution pick(const MemoryConflict& c, bool local) {
    Resolution r;
    r.local_won = local;
    r.value = local ? c.local_value : c.remote_value;
    r.version = c.remote_version;
    return r;
}

} // namespace

ConflictResolver::ConflictResolver(std::shared_ptr<MemoryRepository> repo)
    : repo_(repo)
{
}

Resolution ConflictResolver::resolve(const MemoryConflict& conflict, ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::LAST_WRITE_WINS:
            return pick(conflict, conflict.local_time >= conflict.remote_time);
        case ConflictStrategy::VERSION_BASED:
            return pick(conflict, conflict.local_version >= conflict.remote_version);
        case ConflictStrategy::LOCAL_WINS:
            return pick(conflict, true);
        case ConflictStrategy::REMOTE_WINS:
            return pick(conflict, false);
        case ConflictStrategy::MANUAL:
            break;
    }
    throw ManualResolutionRequiredError("conflict on '" + conflict.key +
                                        "' requires manual resolution");
}

Resolution ConflictResolver::apply(const std::string& agent_id,
                                   const MemoryConflict& conflict,
                                   ConflictStrategy strategy) {
    require_non_empty(agent_id, "agent_id");
    Resolution r = resolve(conflict, strategy);
    write_back(agent_id, conflict, r);
    LOG_DEBUG("[ConflictResolver] %s/%s resolved with %s (%s wins)",
              agent_id.c_str(), conflict.key.c_str(),
              conflict_strategy_to_string(strategy).c_str(), r.local_won ? "local" : "remote");
    return r;
}

void ConflictResolver::write_back(const std::string& agent_id, const MemoryConflict& conflict,
                                  Resolution& resolution) {
    // The store already holds the remote value
    if (!resolution.local_won) return;

    int expected = conflict.remote_version;
    int64_t now = current_timestamp_ms();
    StoreStatus st;

    if (conflict.memory_type == MemoryType::WORKING) {
        WorkingMemory m;
        st = repo_->get_working(agent_id, conflict.key, m);
        if (st != StoreStatus::OK) {
            raise_store_error(st, "working memory", conflict.key, "get", repo_->last_error());
        }
        m.value = resolution.value;
        m.updated_at = now;
        m.version = expected + 1;
        st = repo_->update_working(m, expected);
    } else {
        LongtermMemory m;
        st = repo_->get_longterm(agent_id, conflict.key, m);
        if (st != StoreStatus::OK) {
            raise_store_error(st, "long-term memory", conflict.key, "get", repo_->last_error());
        }
        m.value = resolution.value;
        m.updated_at = now;
        m.version = expected + 1;
        st = repo_->update_longterm(m, expected);
    }

    if (st == StoreStatus::VERSION_MISMATCH) {
        throw VersionConflictError("'" + conflict.key + "' changed again since the conflict was detected",
                                   expected, 0);
    }
    if (st != StoreStatus::OK) {
        raise_store_error(st, memory_type_to_string(conflict.memory_type), conflict.key,
                          "resolve", repo_->last_error());
    }
    resolution.version = expected + 1;
}

int ConflictResolver::resolve_all(const std::string& agent_id,
                                  const std::string& instance_id,
                                  ConflictStrategy strategy,
                                  std::vector<ResolvedConflict>* resolved) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(instance_id, "instance_id");

    SyncStatus status;
    StoreStatus st = repo_->get_sync_status(agent_id, instance_id, status);
    if (st == StoreStatus::NOT_FOUND) return 0;
    if (st != StoreStatus::OK) {
        raise_store_error(st, "sync status", agent_id, "get", repo_->last_error());
    }
    if (status.conflicts.empty()) return 0;

    LOG_INFO("[ConflictResolver] Resolving %zu conflicts for %s with %s",
             status.conflicts.size(), agent_id.c_str(),
             conflict_strategy_to_string(strategy).c_str());

    std::vector<MemoryConflict> remaining;
    int done = 0;
    for (size_t i = 0; i < status.conflicts.size(); ++i) {
        const MemoryConflict& c = status.conflicts[i];
        try {
            Resolution r = apply(agent_id, c, strategy);
            if (resolved) {
                ResolvedConflict rc;
                rc.conflict = c;
                rc.resolution = r;
                resolved->push_back(rc);
            }
            done++;
        } catch (const MemoryError& e) {
            // Kept open for a later attempt
            LOG_WARN("[ConflictResolver] Could not resolve '%s': %s", c.key.c_str(), e.what());
            remaining.push_back(c);
        }
    }

    status.conflicts = remaining;
    if (remaining.empty() && status.status == SyncState::CONFLICT) {
        status.status = SyncState::SYNCED;
    }
    st = repo_->upsert_sync_status(status);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "sync status", agent_id, "update", repo_->last_error());
    }

    LOG_INFO("[ConflictResolver] %s: %d resolved, %zu unresolved",
             agent_id.c_str(), done, remaining.size());

    if (!remaining.empty()) {
        throw UnresolvedConflictsError("failed to resolve " + std::to_string(remaining.size()) +
                                       " conflicts", static_cast<int>(remaining.size()));
    }
    return done;
}

} // namespace agentmem
