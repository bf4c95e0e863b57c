#include <agentmem/memory/longterm_memory.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/memory/query.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

namespace {

MemoryMetadata normalize_metadata(const MemoryMetadata& in) {
    MemoryMetadata m = in;
    if (m.source.empty()) m.source = "manual";
    if (m.importance == 0) m.importance = 5;
    if (m.confidence == 0.0) m.confidence = 1.0;
    m.importance = clamp(m.importance, 1, 10);
    m.confidence = clamp(m.confidence, 0.0, 1.0);
    return m;
}

} // namespace

LongtermMemoryManager::LongtermMemoryManager(std::shared_ptr<MemoryRepository> repo,
                                             TaskDispatcher& dispatcher)
    : repo_(repo)
    , dispatcher_(dispatcher)
{
}

LongtermMemory LongtermMemoryManager::remember(const std::string& agent_id,
                                               const std::string& key,
                                               const Json& value,
                                               const std::string& category,
                                               const MemoryMetadata& metadata) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    int64_t now = current_timestamp_ms();

    LongtermMemory m;
    m.id = generate_uuid();
    m.agent_id = agent_id;
    m.key = key;
    m.category = category.empty() ? "general" : category;
    m.value = value;
    m.metadata = normalize_metadata(metadata);
    m.created_at = now;
    m.updated_at = now;
    m.last_accessed = now;
    m.access_count = 0;
    m.version = 1;

    StoreStatus st = repo_->create_longterm(m);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", key, "create", repo_->last_error());
    }

    LOG_DEBUG("[LongtermMemory] Remembered %s/%s in '%s' (importance %d)",
              agent_id.c_str(), key.c_str(), m.category.c_str(), m.metadata.importance);
    return m;
}

LongtermMemory LongtermMemoryManager::recall(const std::string& agent_id, const std::string& key) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    LongtermMemory m;
    StoreStatus st = repo_->get_longterm(agent_id, key, m);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", key, "get", repo_->last_error());
    }

    int64_t now = current_timestamp_ms();
    std::shared_ptr<MemoryRepository> repo = repo_;
    dispatcher_.dispatch([repo, agent_id, key, now]() {
        if (repo->touch_longterm(agent_id, key, now) == StoreStatus::FAILED) {
            LOG_WARN("[LongtermMemory] Access update for %s/%s failed: %s",
                     agent_id.c_str(), key.c_str(), repo->last_error().c_str());
        }
    });
    return m;
}

std::vector<LongtermMemory> LongtermMemoryManager::search(const std::string& agent_id,
                                                          const MemoryQuery& query) {
    require_non_empty(agent_id, "agent_id");

    std::vector<LongtermMemory> out;
    StoreStatus st = repo_->search_longterm(agent_id, query, out);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", agent_id, "search", repo_->last_error());
    }
    LOG_DEBUG("[LongtermMemory] Search for %s returned %zu entries", agent_id.c_str(), out.size());
    return out;
}

LongtermMemory LongtermMemoryManager::update(const std::string& agent_id,
                                             const std::string& key,
                                             const Json& value,
                                             int expected_version) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    LongtermMemory current;
    StoreStatus st = repo_->get_longterm(agent_id, key, current);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", key, "get", repo_->last_error());
    }
    current.value = value;
    return apply_update(current, expected_version);
}

LongtermMemory LongtermMemoryManager::update(const std::string& agent_id,
                                             const std::string& key,
                                             const Json& value,
                                             const MemoryMetadata& metadata,
                                             int expected_version) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    LongtermMemory current;
    StoreStatus st = repo_->get_longterm(agent_id, key, current);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", key, "get", repo_->last_error());
    }
    current.value = value;
    current.metadata = normalize_metadata(metadata);
    return apply_update(current, expected_version);
}

LongtermMemory LongtermMemoryManager::apply_update(const LongtermMemory& current,
                                                   int expected_version) {
    if (current.version != expected_version) {
        throw VersionConflictError("long-term memory '" + current.key + "' changed since version " +
                                   std::to_string(expected_version),
                                   expected_version, current.version);
    }

    LongtermMemory updated = current;
    updated.updated_at = current_timestamp_ms();
    updated.version = expected_version + 1;

    StoreStatus st = repo_->update_longterm(updated, expected_version);
    if (st == StoreStatus::VERSION_MISMATCH) {
        int actual = 0;
        LongtermMemory latest;
        if (repo_->get_longterm(current.agent_id, current.key, latest) == StoreStatus::OK) {
            actual = latest.version;
        }
        throw VersionConflictError("long-term memory '" + current.key + "' changed since version " +
                                   std::to_string(expected_version),
                                   expected_version, actual);
    }
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", current.key, "update", repo_->last_error());
    }
    return updated;
}

void LongtermMemoryManager::forget(const std::string& agent_id, const std::string& key) {
    require_non_empty(agent_id, "agent_id");
    require_non_empty(key, "key");

    StoreStatus st = repo_->delete_longterm(agent_id, key);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", key, "delete", repo_->last_error());
    }
    LOG_DEBUG("[LongtermMemory] Forgot %s/%s", agent_id.c_str(), key.c_str());
}

ArchiveReport LongtermMemoryManager::archive(const std::string& agent_id,
                                             const ArchiveCriteria& criteria) {
    require_non_empty(agent_id, "agent_id");

    std::vector<LongtermMemory> all;
    StoreStatus st = repo_->list_longterm(agent_id, MemoryFilters(), all);
    if (st != StoreStatus::OK) {
        raise_store_error(st, "long-term memory", agent_id, "list", repo_->last_error());
    }

    int64_t now = current_timestamp_ms();
    ArchiveReport report;
    report.dry_run = criteria.dry_run;
    for (size_t i = 0; i < all.size(); ++i) {
        if (archive_eligible(all[i], criteria, now)) {
            report.eligible_keys.push_back(all[i].key);
        }
    }

    if (criteria.dry_run) {
        LOG_INFO("[LongtermMemory] Archive dry run for %s: %zu eligible",
                 agent_id.c_str(), report.eligible_keys.size());
        return report;
    }

    for (size_t i = 0; i < report.eligible_keys.size(); ++i) {
        const std::string& key = report.eligible_keys[i];
        st = repo_->delete_longterm(agent_id, key);
        if (st == StoreStatus::OK) {
            report.archived++;
        } else if (st == StoreStatus::NOT_FOUND) {
            // Removed concurrently
            LOG_DEBUG("[LongtermMemory] %s/%s already gone", agent_id.c_str(), key.c_str());
        } else {
            raise_store_error(st, "long-term memory", key, "archive", repo_->last_error());
        }
    }

    LOG_INFO("[LongtermMemory] Archived %d of %zu eligible entries for %s",
             report.archived, report.eligible_keys.size(), agent_id.c_str());
    return report;
}

} // namespace agentmem
