#include <agentmem/memory/working_memory.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

WorkingMemoryManager::WorkingMemoryManager(std::shared_ptr<MemoryRepository> repo,
                                           TaskDispatcher& dispatcher,
                                           int64_t default_ttl_ms)
    : repo_(repo)
    , dispatcher_(dispatcher)
    , default_ttl_ms_(default_ttl_ms > 0 ? default_ttl_ms : MS_PER_HOUR)
{
}

WorkingMemory WorkingMemoryManager::store(const std::string& agent_id,
                                          const std::string& key,
                                          const Json& value,
                                          int64_t ttl_ms,
                                          const Json& metadata) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");
    if (!metadata.is_object() && !metadata.is_null()) {
        throw ValidationError("metadata must be a JSON object");
    }

    int64_t now = current_timestamp_ms();

    WorkingMemory m;
    m.id = generate_uuid();
    m.agent_id = agent_id;
    m.key = key;
    m.value = value;
    m.metadata = metadata.is_object() ? metadata : Json::object();
    m.created_at = now;
    m.updated_at = now;
    m.accessed_at = now;
    m.access_count = 0;
    m.expires_at = now + (ttl_ms > 0 ? ttl_ms : default_ttl_ms_);
    m.version = 1;

    StoreStatus st = repo_->create_working(m);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", key, "create", repo_->last_error());
    }

    LOG_DEBUG("[WorkingMemory] Stored %s/%s (expires %s)", agent_id.c_str(), key.c_str(),
              format_timestamp_ms(m.expires_at).c_str());
    return m;
}

WorkingMemory WorkingMemoryManager::retrieve(const std::string& agent_id, const std::string& key) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    WorkingMemory m = load(agent_id, key);
    int64_t now = current_timestamp_ms();

    if (m.is_expired(now)) {
        schedule_expired_delete(agent_id, key, now);
        throw ExpiredError("working memory '" + key + "' expired at " +
                           format_timestamp_ms(m.expires_at));
    }

    schedule_touch(agent_id, key, now);
    return m;
}

WorkingMemory WorkingMemoryManager::update(const std::string& agent_id,
                                           const std::string& key,
                                           const Json& value,
                                           int expected_version) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    WorkingMemory current = load(agent_id, key);
    int64_t now = current_timestamp_ms();

    if (current.is_expired(now)) {
        schedule_expired_delete(agent_id, key, now);
        throw ExpiredError("working memory '" + key + "' expired at " +
                           format_timestamp_ms(current.expires_at));
    }
    if (current.version != expected_version) {
        throw VersionConflictError("working memory '" + key + "' changed since version " +
                                   std::to_string(expected_version),
                                   expected_version, current.version);
    }

    WorkingMemory updated = current;
    updated.value = value;
    updated.updated_at = now;
    updated.version = expected_version + 1;

    StoreStatus st = repo_->update_working(updated, expected_version);
    if (st == StoreStatus::VERSION_MISMATCH) {
        // Lost the race between the read above and the guarded write
        int actual = 0;
        WorkingMemory latest;
        if (repo_->get_working(agent_id, key, latest) == StoreStatus::OK) {
            actual = latest.version;
        }
        throw VersionConflictError("working memory '" + key + "' changed since version " +
                                   std::to_string(expected_version),
                                   expected_version, actual);
    }
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", key, "update", repo_->last_error());
    }

    LOG_DEBUG("[WorkingMemory] Updated %s/%s to version %d", agent_id.c_str(), key.c_str(),
              updated.version);
    return updated;
}

WorkingMemory WorkingMemoryManager::update(const std::string& agent_id,
                                           const std::string& key,
                                           const Json& value) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");
    WorkingMemory current = load(agent_id, key);
    return update(agent_id, key, value, current.version);
}

void WorkingMemoryManager::remove(const std::string& agent_id, const std::string& key) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    StoreStatus st = repo_->delete_working(agent_id, key);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", key, "delete", repo_->last_error());
    }
    LOG_DEBUG("[WorkingMemory] Deleted %s/%s", agent_id.c_str(), key.c_str());
}

int WorkingMemoryManager::clear(const std::string& agent_id) {
    require_non_empty(agent_id, "agent_id");

    int removed = 0;
    StoreStatus st = repo_->clear_working(agent_id, removed);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", agent_id, "clear", repo_->last_error());
    }
    LOG_INFO("[WorkingMemory] Cleared %d entries for agent %s", removed, agent_id.c_str());
    return removed;
}

std::vector<WorkingMemory> WorkingMemoryManager::list(const std::string& agent_id,
                                                      const MemoryFilters& filters) {
    require_non_empty(agent_id, "agent_id");

    MemoryFilters effective = filters;
    if (effective.live_at <= 0) effective.live_at = current_timestamp_ms();

    std::vector<WorkingMemory> out;
    StoreStatus st = repo_->list_working(agent_id, effective, out);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", agent_id, "list", repo_->last_error());
    }
    return out;
}

WorkingMemory WorkingMemoryManager::load(const std::string& agent_id, const std::string& key) {
    WorkingMemory m;
    StoreStatus st = repo_->get_working(agent_id, key, m);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "working memory", key, "get", repo_->last_error());
    }
    return m;
}

void WorkingMemoryManager::schedule_touch(const std::string& agent_id, const std::string& key,
                                          int64_t now) {
    std::shared_ptr<MemoryRepository> repo = repo_;
    dispatcher_.dispatch([repo, agent_id, key, now]() {
        StoreStatus st = repo->touch_working(agent_id, key, now);
        // Entry may be gone by now; only real store failures are worth a line
        if (st == StoreStatus::FAILED) {
            LOG_WARN("[WorkingMemory] Access update for %s/%s failed: %s",
                     agent_id.c_str(), key.c_str(), repo->last_error().c_str());
        }
    });
}

void WorkingMemoryManager::schedule_expired_delete(const std::string& agent_id,
                                                   const std::string& key, int64_t now) {
    std::shared_ptr<MemoryRepository> repo = repo_;
    dispatcher_.dispatch([repo, agent_id, key, now]() {
        StoreStatus st = repo->delete_working_if_expired(agent_id, key, now);
        if (st == StoreStatus::OK) {
            LOG_DEBUG("[WorkingMemory] Removed expired %s/%s", agent_id.c_str(), key.c_str());
        } else if (st == StoreStatus::FAILED) {
            LOG_WARN("[WorkingMemory] Removing expired %s/%s failed: %s",
                     agent_id.c_str(), key.c_str(), repo->last_error().c_str());
        }
    });
}

} // namespace agentmem
