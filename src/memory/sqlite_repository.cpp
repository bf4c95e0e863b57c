#include <agentmem/memory/sqlite_repository.hpp>
#include <agentmem/memory/serialization.hpp>
#include <agentmem/memory/query.hpp>
#include <agentmem/core/logger.hpp>

namespace agentmem {

namespace {

// Finalizes a prepared statement when the scope ends
struct StatementGuard {
    sqlite3_stmt* stmt;
    explicit StatementGuard(sqlite3_stmt* s) : stmt(s) {}
    ~StatementGuard() { if (stmt) sqlite3_finalize(stmt); }
};

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

// Empty column reads as null
bool column_json(sqlite3_stmt* stmt, int col, Json& out, std::string& error) {
    std::string text = column_string(stmt, col);
    if (text.empty()) {
        out = Json();
        return true;
    }
    try {
        out = Json::parse(text);
        return true;
    } catch (const JsonParseError& e) {
        error = e.what();
        return false;
    }
}

const char* WORKING_COLUMNS =
    "id, agent_id, key, value, metadata, created_at, updated_at, accessed_at, "
    "access_count, expires_at, version";

const char* LONGTERM_COLUMNS =
    "id, agent_id, key, category, value, metadata, created_at, updated_at, "
    "last_accessed, access_count, version";

const char* SNAPSHOT_COLUMNS =
    "id, agent_id, snapshot_type, state, checksum, metadata, created_at, expires_at, version";

const char* SYNC_COLUMNS =
    "agent_id, instance_id, last_sync_at, sync_version, pending_changes, conflicts, status, metadata";

Json snapshot_metadata_to_json(const SnapshotMetadata& m) {
    Json j = Json::object();
    j.set("trigger", m.trigger);
    j.set("reason", m.reason);
    j.set("size_bytes", m.size_bytes);
    j.set("compressed", m.compressed);
    return j;
}

SnapshotMetadata snapshot_metadata_from_json(const Json& j) {
    SnapshotMetadata m;
    m.trigger = j.get_string("trigger");
    m.reason = j.get_string("reason");
    m.size_bytes = j.get_int64("size_bytes");
    m.compressed = j.get_bool("compressed");
    return m;
}

} // namespace

SqliteRepository::SqliteRepository()
    : db_(nullptr)
{
}

SqliteRepository::~SqliteRepository() {
    close();
}

bool SqliteRepository::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        set_error_from_db();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL lets several instances share one file
    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG("[SqliteRepository] Opened %s", db_path.c_str());
    return true;
}

void SqliteRepository::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteRepository::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool SqliteRepository::ensure_schema() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        set_error(StoreStatus::FAILED, "Database not open");
        return false;
    }

    if (!exec(
        "CREATE TABLE IF NOT EXISTS working_memory ("
        "  id TEXT NOT NULL,"
        "  agent_id TEXT NOT NULL,"
        "  key TEXT NOT NULL,"
        "  value TEXT,"
        "  metadata TEXT,"
        "  created_at INTEGER,"
        "  updated_at INTEGER,"
        "  accessed_at INTEGER,"
        "  access_count INTEGER DEFAULT 0,"
        "  expires_at INTEGER,"
        "  version INTEGER NOT NULL,"
        "  PRIMARY KEY (agent_id, key)"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_working_expires ON working_memory(expires_at)")) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS longterm_memory ("
        "  id TEXT NOT NULL,"
        "  agent_id TEXT NOT NULL,"
        "  key TEXT NOT NULL,"
        "  category TEXT NOT NULL,"
        "  value TEXT,"
        "  metadata TEXT,"
        "  created_at INTEGER,"
        "  updated_at INTEGER,"
        "  last_accessed INTEGER,"
        "  access_count INTEGER DEFAULT 0,"
        "  version INTEGER NOT NULL,"
        "  PRIMARY KEY (agent_id, key)"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_longterm_category ON longterm_memory(agent_id, category)")) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS snapshots ("
        "  id TEXT PRIMARY KEY,"
        "  agent_id TEXT NOT NULL,"
        "  snapshot_type TEXT NOT NULL,"
        "  state TEXT,"
        "  checksum TEXT,"
        "  metadata TEXT,"
        "  created_at INTEGER,"
        "  expires_at INTEGER,"
        "  version INTEGER"
        ")"
    )) return false;

    if (!exec("CREATE INDEX IF NOT EXISTS idx_snapshots_agent ON snapshots(agent_id, created_at)")) return false;

    if (!exec(
        "CREATE TABLE IF NOT EXISTS sync_status ("
        "  agent_id TEXT NOT NULL,"
        "  instance_id TEXT NOT NULL,"
        "  last_sync_at INTEGER,"
        "  sync_version INTEGER,"
        "  pending_changes INTEGER,"
        "  conflicts TEXT,"
        "  status TEXT,"
        "  metadata TEXT,"
        "  PRIMARY KEY (agent_id, instance_id)"
        ")"
    )) return false;

    return true;
}

// ============================================================================
// Working memory
// ============================================================================

StoreStatus SqliteRepository::create_working(const WorkingMemory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "INSERT INTO working_memory (id, agent_id, key, value, metadata, created_at, updated_at, "
        "accessed_at, access_count, expires_at, version) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, memory.id);
    bind_text(stmt, 2, memory.agent_id);
    bind_text(stmt, 3, memory.key);
    bind_text(stmt, 4, memory.value.dump());
    bind_text(stmt, 5, memory.metadata.dump());
    sqlite3_bind_int64(stmt, 6, memory.created_at);
    sqlite3_bind_int64(stmt, 7, memory.updated_at);
    sqlite3_bind_int64(stmt, 8, memory.accessed_at);
    sqlite3_bind_int(stmt, 9, memory.access_count);
    sqlite3_bind_int64(stmt, 10, memory.expires_at);
    sqlite3_bind_int(stmt, 11, memory.version);

    int rc = sqlite3_step(stmt);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return set_error(StoreStatus::DUPLICATE, "working memory '" + memory.key + "' already exists");
    }
    if (rc != SQLITE_DONE) return set_error_from_db();
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::get_working(const std::string& agent_id, const std::string& key,
                                          WorkingMemory& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    std::string sql = std::string("SELECT ") + WORKING_COLUMNS +
                      " FROM working_memory WHERE agent_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    bind_text(stmt, 2, key);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return read_working(stmt, out);
    if (rc != SQLITE_DONE) return set_error_from_db();
    return set_error(StoreStatus::NOT_FOUND, "working memory '" + key + "' not found");
}

StoreStatus SqliteRepository::update_working(const WorkingMemory& memory, int expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "UPDATE working_memory SET value = ?, metadata = ?, updated_at = ?, expires_at = ?, "
        "version = ? WHERE agent_id = ? AND key = ? AND version = ?";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, memory.value.dump());
    bind_text(stmt, 2, memory.metadata.dump());
    sqlite3_bind_int64(stmt, 3, memory.updated_at);
    sqlite3_bind_int64(stmt, 4, memory.expires_at);
    sqlite3_bind_int(stmt, 5, memory.version);
    bind_text(stmt, 6, memory.agent_id);
    bind_text(stmt, 7, memory.key);
    sqlite3_bind_int(stmt, 8, expected_version);

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return classify_failed_update("working_memory", memory.agent_id, memory.key);
    }
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::touch_working(const std::string& agent_id, const std::string& key,
                                            int64_t accessed_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "UPDATE working_memory SET access_count = access_count + 1, accessed_at = ? "
        "WHERE agent_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    sqlite3_bind_int64(stmt, 1, accessed_at);
    bind_text(stmt, 2, agent_id);
    bind_text(stmt, 3, key);

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return set_error(StoreStatus::NOT_FOUND, "working memory '" + key + "' not found");
    }
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::delete_working(const std::string& agent_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");
    return exec_keyed("DELETE FROM working_memory WHERE agent_id = ? AND key = ?",
                      agent_id, key, "working memory");
}

StoreStatus SqliteRepository::delete_working_if_expired(const std::string& agent_id,
                                                        const std::string& key,
                                                        int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "DELETE FROM working_memory WHERE agent_id = ? AND key = ? "
        "AND expires_at > 0 AND expires_at < ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    bind_text(stmt, 2, key);
    sqlite3_bind_int64(stmt, 3, now_ms);

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return set_error(StoreStatus::NOT_FOUND, "no expired working memory '" + key + "'");
    }
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::list_working(const std::string& agent_id, const MemoryFilters& filters,
                                           std::vector<WorkingMemory>& out) {
    std::vector<WorkingMemory> items;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

        std::string sql = std::string("SELECT ") + WORKING_COLUMNS +
                          " FROM working_memory WHERE agent_id = ?";
        sqlite3_stmt* stmt = nullptr;
        if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
        StatementGuard guard(stmt);

        bind_text(stmt, 1, agent_id);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            WorkingMemory m;
            StoreStatus st = read_working(stmt, m);
            if (st != StoreStatus::OK) return st;
            items.push_back(m);
        }
        if (rc != SQLITE_DONE) return set_error_from_db();
    }
    apply_filters(items, filters);
    out.swap(items);
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::clear_working(const std::string& agent_id, int& removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = 0;
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    sqlite3_stmt* stmt = nullptr;
    if (!prepare("DELETE FROM working_memory WHERE agent_id = ?", &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    removed = sqlite3_changes(db_);
    return StoreStatus::OK;
}

// ============================================================================
// Long-term memory
// ============================================================================

StoreStatus SqliteRepository::create_longterm(const LongtermMemory& memory) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "INSERT INTO longterm_memory (id, agent_id, key, category, value, metadata, created_at, "
        "updated_at, last_accessed, access_count, version) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, memory.id);
    bind_text(stmt, 2, memory.agent_id);
    bind_text(stmt, 3, memory.key);
    bind_text(stmt, 4, memory.category);
    bind_text(stmt, 5, memory.value.dump());
    bind_text(stmt, 6, to_json(memory.metadata).dump());
    sqlite3_bind_int64(stmt, 7, memory.created_at);
    sqlite3_bind_int64(stmt, 8, memory.updated_at);
    sqlite3_bind_int64(stmt, 9, memory.last_accessed);
    sqlite3_bind_int(stmt, 10, memory.access_count);
    sqlite3_bind_int(stmt, 11, memory.version);

    int rc = sqlite3_step(stmt);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return set_error(StoreStatus::DUPLICATE, "long-term memory '" + memory.key + "' already exists");
    }
    if (rc != SQLITE_DONE) return set_error_from_db();
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::get_longterm(const std::string& agent_id, const std::string& key,
                                           LongtermMemory& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    std::string sql = std::string("SELECT ") + LONGTERM_COLUMNS +
                      " FROM longterm_memory WHERE agent_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    bind_text(stmt, 2, key);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return read_longterm(stmt, out);
    if (rc != SQLITE_DONE) return set_error_from_db();
    return set_error(StoreStatus::NOT_FOUND, "long-term memory '" + key + "' not found");
}

StoreStatus SqliteRepository::update_longterm(const LongtermMemory& memory, int expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "UPDATE longterm_memory SET category = ?, value = ?, metadata = ?, updated_at = ?, "
        "version = ? WHERE agent_id = ? AND key = ? AND version = ?";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, memory.category);
    bind_text(stmt, 2, memory.value.dump());
    bind_text(stmt, 3, to_json(memory.metadata).dump());
    sqlite3_bind_int64(stmt, 4, memory.updated_at);
    sqlite3_bind_int(stmt, 5, memory.version);
    bind_text(stmt, 6, memory.agent_id);
    bind_text(stmt, 7, memory.key);
    sqlite3_bind_int(stmt, 8, expected_version);

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return classify_failed_update("longterm_memory", memory.agent_id, memory.key);
    }
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::touch_longterm(const std::string& agent_id, const std::string& key,
                                             int64_t accessed_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "UPDATE longterm_memory SET access_count = access_count + 1, last_accessed = ? "
        "WHERE agent_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    sqlite3_bind_int64(stmt, 1, accessed_at);
    bind_text(stmt, 2, agent_id);
    bind_text(stmt, 3, key);

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return set_error(StoreStatus::NOT_FOUND, "long-term memory '" + key + "' not found");
    }
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::delete_longterm(const std::string& agent_id, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");
    return exec_keyed("DELETE FROM longterm_memory WHERE agent_id = ? AND key = ?",
                      agent_id, key, "long-term memory");
}

StoreStatus SqliteRepository::list_longterm(const std::string& agent_id, const MemoryFilters& filters,
                                            std::vector<LongtermMemory>& out) {
    std::vector<LongtermMemory> items;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

        std::string sql = std::string("SELECT ") + LONGTERM_COLUMNS +
                          " FROM longterm_memory WHERE agent_id = ?";
        if (!filters.category.empty()) sql += " AND category = ?";

        sqlite3_stmt* stmt = nullptr;
        if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
        StatementGuard guard(stmt);

        bind_text(stmt, 1, agent_id);
        if (!filters.category.empty()) bind_text(stmt, 2, filters.category);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            LongtermMemory m;
            StoreStatus st = read_longterm(stmt, m);
            if (st != StoreStatus::OK) return st;
            items.push_back(m);
        }
        if (rc != SQLITE_DONE) return set_error_from_db();
    }
    apply_filters(items, filters);
    out.swap(items);
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::search_longterm(const std::string& agent_id, const MemoryQuery& query,
                                              std::vector<LongtermMemory>& out) {
    return list_longterm(agent_id, query.filters, out);
}

// ============================================================================
// Snapshots
// ============================================================================

StoreStatus SqliteRepository::create_snapshot(const StateSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "INSERT INTO snapshots (id, agent_id, snapshot_type, state, checksum, metadata, created_at, "
        "expires_at, version) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, snapshot.id);
    bind_text(stmt, 2, snapshot.agent_id);
    bind_text(stmt, 3, snapshot_type_to_string(snapshot.snapshot_type));
    bind_text(stmt, 4, snapshot.state.dump());
    bind_text(stmt, 5, snapshot.checksum);
    bind_text(stmt, 6, snapshot_metadata_to_json(snapshot.metadata).dump());
    sqlite3_bind_int64(stmt, 7, snapshot.created_at);
    sqlite3_bind_int64(stmt, 8, snapshot.expires_at);
    sqlite3_bind_int(stmt, 9, snapshot.version);

    int rc = sqlite3_step(stmt);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return set_error(StoreStatus::DUPLICATE, "snapshot '" + snapshot.id + "' already exists");
    }
    if (rc != SQLITE_DONE) return set_error_from_db();
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::get_snapshot(const std::string& snapshot_id, StateSnapshot& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    std::string sql = std::string("SELECT ") + SNAPSHOT_COLUMNS + " FROM snapshots WHERE id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, snapshot_id);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return read_snapshot(stmt, out);
    if (rc != SQLITE_DONE) return set_error_from_db();
    return set_error(StoreStatus::NOT_FOUND, "snapshot '" + snapshot_id + "' not found");
}

StoreStatus SqliteRepository::list_snapshots(const std::string& agent_id,
                                             const SnapshotFilters& filters,
                                             std::vector<StateSnapshot>& out) {
    std::vector<StateSnapshot> items;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

        std::string sql = std::string("SELECT ") + SNAPSHOT_COLUMNS +
                          " FROM snapshots WHERE agent_id = ?";
        if (!filters.snapshot_type.empty()) sql += " AND snapshot_type = ?";

        sqlite3_stmt* stmt = nullptr;
        if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
        StatementGuard guard(stmt);

        bind_text(stmt, 1, agent_id);
        if (!filters.snapshot_type.empty()) bind_text(stmt, 2, filters.snapshot_type);

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            StateSnapshot s;
            StoreStatus st = read_snapshot(stmt, s);
            if (st != StoreStatus::OK) return st;
            items.push_back(s);
        }
        if (rc != SQLITE_DONE) return set_error_from_db();
    }
    apply_filters(items, filters);
    out.swap(items);
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::delete_snapshot(const std::string& snapshot_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    sqlite3_stmt* stmt = nullptr;
    if (!prepare("DELETE FROM snapshots WHERE id = ?", &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, snapshot_id);
    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return set_error(StoreStatus::NOT_FOUND, "snapshot '" + snapshot_id + "' not found");
    }
    return StoreStatus::OK;
}

// ============================================================================
// Sync status
// ============================================================================

StoreStatus SqliteRepository::get_sync_status(const std::string& agent_id,
                                              const std::string& instance_id,
                                              SyncStatus& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    std::string sql = std::string("SELECT ") + SYNC_COLUMNS +
                      " FROM sync_status WHERE agent_id = ? AND instance_id = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    bind_text(stmt, 2, instance_id);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return read_sync_status(stmt, out);
    if (rc != SQLITE_DONE) return set_error_from_db();
    return set_error(StoreStatus::NOT_FOUND, "no sync status for '" + agent_id + "'");
}

StoreStatus SqliteRepository::upsert_sync_status(const SyncStatus& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* sql =
        "INSERT INTO sync_status (agent_id, instance_id, last_sync_at, sync_version, "
        "pending_changes, conflicts, status, metadata) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(agent_id, instance_id) DO UPDATE SET "
        "last_sync_at = excluded.last_sync_at, sync_version = excluded.sync_version, "
        "pending_changes = excluded.pending_changes, conflicts = excluded.conflicts, "
        "status = excluded.status, metadata = excluded.metadata";

    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, status.agent_id);
    bind_text(stmt, 2, status.instance_id);
    sqlite3_bind_int64(stmt, 3, status.last_sync_at);
    sqlite3_bind_int(stmt, 4, status.sync_version);
    sqlite3_bind_int(stmt, 5, status.pending_changes);
    bind_text(stmt, 6, conflicts_to_json(status.conflicts).dump());
    bind_text(stmt, 7, sync_state_to_string(status.status));
    bind_text(stmt, 8, status.metadata.dump());

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::list_sync_status(const std::string& agent_id,
                                               std::vector<SyncStatus>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    std::string sql = std::string("SELECT ") + SYNC_COLUMNS +
                      " FROM sync_status WHERE agent_id = ? ORDER BY instance_id";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);

    std::vector<SyncStatus> items;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        SyncStatus s;
        StoreStatus st = read_sync_status(stmt, s);
        if (st != StoreStatus::OK) return st;
        items.push_back(s);
    }
    if (rc != SQLITE_DONE) return set_error_from_db();
    out.swap(items);
    return StoreStatus::OK;
}

// ============================================================================
// Maintenance
// ============================================================================

StoreStatus SqliteRepository::cleanup_expired(int64_t now_ms, int& removed) {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = 0;
    if (!db_) return set_error(StoreStatus::FAILED, "Database not open");

    const char* statements[] = {
        "DELETE FROM working_memory WHERE expires_at > 0 AND expires_at < ?",
        "DELETE FROM snapshots WHERE expires_at > 0 AND expires_at < ?"
    };

    for (size_t i = 0; i < 2; ++i) {
        sqlite3_stmt* stmt = nullptr;
        if (!prepare(statements[i], &stmt)) return StoreStatus::FAILED;
        StatementGuard guard(stmt);

        sqlite3_bind_int64(stmt, 1, now_ms);
        if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
        removed += sqlite3_changes(db_);
    }
    return StoreStatus::OK;
}

std::string SqliteRepository::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::thread::id, std::string>::const_iterator it =
        last_errors_.find(std::this_thread::get_id());
    return it == last_errors_.end() ? std::string() : it->second;
}

// ============================================================================
// Helpers (caller holds mutex_)
// ============================================================================

bool SqliteRepository::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        if (err_msg) {
            last_errors_[std::this_thread::get_id()] = err_msg;
            sqlite3_free(err_msg);
        }
        return false;
    }
    return true;
}

StoreStatus SqliteRepository::set_error(StoreStatus status, const std::string& error) {
    last_errors_[std::this_thread::get_id()] = error;
    return status;
}

StoreStatus SqliteRepository::set_error_from_db() {
    if (db_) {
        last_errors_[std::this_thread::get_id()] = sqlite3_errmsg(db_);
    }
    return StoreStatus::FAILED;
}

bool SqliteRepository::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        set_error_from_db();
        if (*stmt) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
        return false;
    }
    return true;
}

StoreStatus SqliteRepository::exec_keyed(const char* sql, const std::string& agent_id,
                                         const std::string& key, const std::string& what) {
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql, &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    bind_text(stmt, 2, key);

    if (sqlite3_step(stmt) != SQLITE_DONE) return set_error_from_db();
    if (sqlite3_changes(db_) == 0) {
        return set_error(StoreStatus::NOT_FOUND, what + " '" + key + "' not found");
    }
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::classify_failed_update(const char* table, const std::string& agent_id,
                                                     const std::string& key) {
    std::string sql = std::string("SELECT version FROM ") + table +
                      " WHERE agent_id = ? AND key = ?";
    sqlite3_stmt* stmt = nullptr;
    if (!prepare(sql.c_str(), &stmt)) return StoreStatus::FAILED;
    StatementGuard guard(stmt);

    bind_text(stmt, 1, agent_id);
    bind_text(stmt, 2, key);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return set_error(StoreStatus::VERSION_MISMATCH, "'" + key + "' is at version " +
                         std::to_string(sqlite3_column_int(stmt, 0)));
    }
    if (rc != SQLITE_DONE) return set_error_from_db();
    return set_error(StoreStatus::NOT_FOUND, "'" + key + "' not found");
}

StoreStatus SqliteRepository::read_working(sqlite3_stmt* stmt, WorkingMemory& out) {
    std::string error;
    out.id = column_string(stmt, 0);
    out.agent_id = column_string(stmt, 1);
    out.key = column_string(stmt, 2);
    if (!column_json(stmt, 3, out.value, error) || !column_json(stmt, 4, out.metadata, error)) {
        return set_error(StoreStatus::FAILED, "corrupt working memory '" + out.key + "': " + error);
    }
    if (!out.metadata.is_object()) out.metadata = Json::object();
    out.created_at = sqlite3_column_int64(stmt, 5);
    out.updated_at = sqlite3_column_int64(stmt, 6);
    out.accessed_at = sqlite3_column_int64(stmt, 7);
    out.access_count = sqlite3_column_int(stmt, 8);
    out.expires_at = sqlite3_column_int64(stmt, 9);
    out.version = sqlite3_column_int(stmt, 10);
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::read_longterm(sqlite3_stmt* stmt, LongtermMemory& out) {
    std::string error;
    Json metadata;
    out.id = column_string(stmt, 0);
    out.agent_id = column_string(stmt, 1);
    out.key = column_string(stmt, 2);
    out.category = column_string(stmt, 3);
    if (!column_json(stmt, 4, out.value, error) || !column_json(stmt, 5, metadata, error)) {
        return set_error(StoreStatus::FAILED, "corrupt long-term memory '" + out.key + "': " + error);
    }
    out.metadata = metadata_from_json(metadata);
    out.created_at = sqlite3_column_int64(stmt, 6);
    out.updated_at = sqlite3_column_int64(stmt, 7);
    out.last_accessed = sqlite3_column_int64(stmt, 8);
    out.access_count = sqlite3_column_int(stmt, 9);
    out.version = sqlite3_column_int(stmt, 10);
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::read_snapshot(sqlite3_stmt* stmt, StateSnapshot& out) {
    std::string error;
    Json metadata;
    out.id = column_string(stmt, 0);
    out.agent_id = column_string(stmt, 1);
    out.snapshot_type = string_to_snapshot_type(column_string(stmt, 2));
    if (!column_json(stmt, 3, out.state, error) || !column_json(stmt, 5, metadata, error)) {
        return set_error(StoreStatus::FAILED, "corrupt snapshot '" + out.id + "': " + error);
    }
    out.checksum = column_string(stmt, 4);
    out.metadata = snapshot_metadata_from_json(metadata);
    out.created_at = sqlite3_column_int64(stmt, 6);
    out.expires_at = sqlite3_column_int64(stmt, 7);
    out.version = sqlite3_column_int(stmt, 8);
    return StoreStatus::OK;
}

StoreStatus SqliteRepository::read_sync_status(sqlite3_stmt* stmt, SyncStatus& out) {
    std::string error;
    Json conflicts;
    out.agent_id = column_string(stmt, 0);
    out.instance_id = column_string(stmt, 1);
    out.last_sync_at = sqlite3_column_int64(stmt, 2);
    out.sync_version = sqlite3_column_int(stmt, 3);
    out.pending_changes = sqlite3_column_int(stmt, 4);
    if (!column_json(stmt, 5, conflicts, error) || !column_json(stmt, 7, out.metadata, error)) {
        return set_error(StoreStatus::FAILED, "corrupt sync status for '" + out.agent_id + "': " + error);
    }
    out.conflicts = conflicts_from_json(conflicts);
    out.status = string_to_sync_state(column_string(stmt, 6));
    if (!out.metadata.is_object()) out.metadata = Json::object();
    return StoreStatus::OK;
}

} // namespace agentmem
