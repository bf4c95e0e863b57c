#include <agentmem/memory/settings.hpp>
#include <agentmem/memory/errors.hpp>
#include <agentmem/memory/in_memory_repository.hpp>
#include <agentmem/memory/sqlite_repository.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

MemorySettings::MemorySettings()
    : backend("sqlite")
    , db_path("agentmem.db")
    , log_level(LogLevel::INFO)
    , default_ttl_ms(MS_PER_HOUR)
    , telemetry_workers(2)
    , sync_interval_ms(5 * MS_PER_MINUTE)
    , sync_strategy(ConflictStrategy::LAST_WRITE_WINS)
{
}

MemorySettings MemorySettings::from_config(const Config& cfg) {
    MemorySettings s;

    s.backend = to_lower(trim(cfg.get_string("backend", s.backend)));
    s.db_path = cfg.get_string("db_path", s.db_path);
    s.log_level = parse_log_level(cfg.get_string("log_level", "info"), s.log_level);

    int64_t ttl = cfg.get_int("working.default_ttl_ms", s.default_ttl_ms);
    if (ttl > 0) {
        s.default_ttl_ms = ttl;
    } else {
        LOG_WARN("[Settings] working.default_ttl_ms must be positive, using %lld ms",
                 (long long)s.default_ttl_ms);
    }

    int64_t workers = cfg.get_int("telemetry.workers", s.telemetry_workers);
    s.telemetry_workers = static_cast<int>(clamp<int64_t>(workers, 1, 64));

    int64_t interval = cfg.get_int("sync.interval_ms", s.sync_interval_ms);
    if (interval > 0) {
        s.sync_interval_ms = interval;
    } else {
        LOG_WARN("[Settings] sync.interval_ms must be positive, using %lld ms",
                 (long long)s.sync_interval_ms);
    }

    std::string strategy = cfg.get_string("sync.strategy", "");
    if (!strategy.empty() && !parse_conflict_strategy(strategy, s.sync_strategy)) {
        LOG_WARN("[Settings] Unknown sync.strategy '%s', using %s",
                 strategy.c_str(), conflict_strategy_to_string(s.sync_strategy).c_str());
    }

    s.instance_id = trim(cfg.get_string("sync.instance_id", ""));
    return s;
}

std::shared_ptr<MemoryRepository> create_repository(const MemorySettings& settings) {
    if (settings.backend == "memory") {
        LOG_INFO("[Settings] Using in-memory store");
        return std::shared_ptr<MemoryRepository>(new InMemoryRepository());
    }

    if (settings.backend != "sqlite") {
        throw RepositoryError("repository", settings.backend, "create",
                              "unknown backend (expected 'sqlite' or 'memory')");
    }

    std::shared_ptr<SqliteRepository> repo(new SqliteRepository());
    if (!repo->open(settings.db_path)) {
        throw RepositoryError("database", settings.db_path, "open", repo->last_error());
    }
    if (!repo->ensure_schema()) {
        throw RepositoryError("database", settings.db_path, "migrate", repo->last_error());
    }
    LOG_INFO("[Settings] Using SQLite store at %s", settings.db_path.c_str());
    return repo;
}

} // namespace agentmem
