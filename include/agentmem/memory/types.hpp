/*
 * agentmem - Memory Types
 *
 * Entities of the two-tier agent memory (working and long-term), state
 * snapshots, and the per-instance synchronization records.
 * All timestamps are Unix milliseconds; 0 means "unset".
 */
#ifndef AGENTMEM_MEMORY_TYPES_HPP
#define AGENTMEM_MEMORY_TYPES_HPP

#include <agentmem/core/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace agentmem {

// Which tier a key lives in
enum class MemoryType {
    WORKING,
    LONGTERM
};

inline std::string memory_type_to_string(MemoryType t) {
    switch (t) {
        case MemoryType::WORKING: return "working";
        case MemoryType::LONGTERM: return "longterm";
    }
    return "working";
}

inline MemoryType string_to_memory_type(const std::string& s) {
    if (s == "longterm") return MemoryType::LONGTERM;
    return MemoryType::WORKING;
}

// Short-lived task context owned by one agent, unique on (agent_id, key)
struct WorkingMemory {
    std::string id;
    std::string agent_id;
    std::string key;
    Json value;
    Json metadata;          // free-form object; "tags" is used by list filters
    int64_t created_at;
    int64_t updated_at;
    int64_t accessed_at;
    int access_count;
    int64_t expires_at;
    int version;            // starts at 1, +1 per successful update

    WorkingMemory()
        : metadata(Json::object())
        , created_at(0)
        , updated_at(0)
        , accessed_at(0)
        , access_count(0)
        , expires_at(0)
        , version(0)
    {}

    bool is_expired(int64_t now_ms) const { return expires_at > 0 && now_ms > expires_at; }
    std::vector<std::string> tags() const { return metadata["tags"].as_string_list(); }
};

// Structured metadata carried by every long-term entry
struct MemoryMetadata {
    std::string source;
    int importance;                     // 1-10
    double confidence;                  // 0.0-1.0
    std::vector<std::string> tags;
    std::vector<std::string> references; // keys of related memories
    std::vector<double> embedding;      // reserved for semantic ranking

    MemoryMetadata() : source("manual"), importance(5), confidence(1.0) {}
};

// Durable knowledge entry, unique on (agent_id, key)
struct LongtermMemory {
    std::string id;
    std::string agent_id;
    std::string category;
    std::string key;
    Json value;
    MemoryMetadata metadata;
    int64_t created_at;
    int64_t updated_at;
    int64_t last_accessed;
    int access_count;
    int version;

    LongtermMemory()
        : category("general")
        , created_at(0)
        , updated_at(0)
        , last_accessed(0)
        , access_count(0)
        , version(0)
    {}
};

// Snapshot kinds, each with its own retention window
enum class SnapshotType {
    PERIODIC,       // 7 days
    MANUAL,         // 30 days
    PRE_UPDATE,     // 90 days
    PRE_SHUTDOWN    // 90 days
};

inline std::string snapshot_type_to_string(SnapshotType t) {
    switch (t) {
        case SnapshotType::PERIODIC: return "periodic";
        case SnapshotType::MANUAL: return "manual";
        case SnapshotType::PRE_UPDATE: return "pre-update";
        case SnapshotType::PRE_SHUTDOWN: return "pre-shutdown";
    }
    return "manual";
}

// Unknown names map to MANUAL
inline SnapshotType string_to_snapshot_type(const std::string& s) {
    if (s == "periodic") return SnapshotType::PERIODIC;
    if (s == "pre-update") return SnapshotType::PRE_UPDATE;
    if (s == "pre-shutdown") return SnapshotType::PRE_SHUTDOWN;
    return SnapshotType::MANUAL;
}

int64_t snapshot_retention_ms(SnapshotType t);

struct SnapshotMetadata {
    std::string trigger;
    std::string reason;
    int64_t size_bytes;
    bool compressed;

    SnapshotMetadata() : size_bytes(0), compressed(false) {}
};

// Immutable point-in-time capture of agent state
struct StateSnapshot {
    std::string id;
    std::string agent_id;
    SnapshotType snapshot_type;
    Json state;
    std::string checksum;   // sha256 of state.dump() at creation
    SnapshotMetadata metadata;
    int64_t created_at;
    int64_t expires_at;
    int version;

    StateSnapshot()
        : snapshot_type(SnapshotType::MANUAL)
        , state(Json::object())
        , created_at(0)
        , expires_at(0)
        , version(1)
    {}
};

// Hash used for snapshot integrity
std::string compute_state_checksum(const Json& state);

enum class SyncState {
    SYNCED,
    SYNCING,
    CONFLICT,
    ERROR
};

inline std::string sync_state_to_string(SyncState s) {
    switch (s) {
        case SyncState::SYNCED: return "synced";
        case SyncState::SYNCING: return "syncing";
        case SyncState::CONFLICT: return "conflict";
        case SyncState::ERROR: return "error";
    }
    return "synced";
}

inline SyncState string_to_sync_state(const std::string& s) {
    if (s == "syncing") return SyncState::SYNCING;
    if (s == "conflict") return SyncState::CONFLICT;
    if (s == "error") return SyncState::ERROR;
    return SyncState::SYNCED;
}

// One contested key between this instance and the shared store
struct MemoryConflict {
    std::string key;
    MemoryType memory_type;
    int local_version;
    int remote_version;
    Json local_value;
    Json remote_value;
    int64_t local_time;
    int64_t remote_time;
    int64_t detected_at;

    MemoryConflict()
        : memory_type(MemoryType::WORKING)
        , local_version(0)
        , remote_version(0)
        , local_time(0)
        , remote_time(0)
        , detected_at(0)
    {}

    bool same_target(const MemoryConflict& other) const {
        return key == other.key && memory_type == other.memory_type;
    }
};

// One record per (agent_id, instance_id)
struct SyncStatus {
    std::string agent_id;
    std::string instance_id;
    int64_t last_sync_at;
    int sync_version;
    int pending_changes;
    std::vector<MemoryConflict> conflicts;
    SyncState status;
    Json metadata;

    SyncStatus()
        : last_sync_at(0)
        , sync_version(0)
        , pending_changes(0)
        , status(SyncState::SYNCED)
        , metadata(Json::object())
    {}
};

enum class ConflictStrategy {
    LAST_WRITE_WINS,
    VERSION_BASED,
    LOCAL_WINS,
    REMOTE_WINS,
    MANUAL
};

inline std::string conflict_strategy_to_string(ConflictStrategy s) {
    switch (s) {
        case ConflictStrategy::LAST_WRITE_WINS: return "last_write_wins";
        case ConflictStrategy::VERSION_BASED: return "version_based";
        case ConflictStrategy::LOCAL_WINS: return "local_wins";
        case ConflictStrategy::REMOTE_WINS: return "remote_wins";
        case ConflictStrategy::MANUAL: return "manual";
    }
    return "last_write_wins";
}

// Returns false for unknown names and leaves out untouched
bool parse_conflict_strategy(const std::string& s, ConflictStrategy& out);

// Outcome of one synchronization pass
struct SyncResult {
    std::string agent_id;
    int64_t synced_at;
    int64_t duration_ms;
    int items_synced;
    std::vector<MemoryConflict> conflicts;
    std::vector<std::string> errors;
    bool success;

    SyncResult() : synced_at(0), duration_ms(0), items_synced(0), success(false) {}
};

struct MemoryStats {
    std::string agent_id;
    int working_memory_count;
    int64_t working_memory_size_bytes;
    int longterm_memory_count;
    int64_t longterm_memory_size_bytes;
    int snapshot_count;
    int64_t total_size_bytes;
    int64_t last_sync_at;
    int64_t last_snapshot_at;

    MemoryStats()
        : working_memory_count(0)
        , working_memory_size_bytes(0)
        , longterm_memory_count(0)
        , longterm_memory_size_bytes(0)
        , snapshot_count(0)
        , total_size_bytes(0)
        , last_sync_at(0)
        , last_snapshot_at(0)
    {}
};

// ============================================================================
// Query descriptors
// ============================================================================

// Filters for working/long-term listing. Zero or empty means "not set".
struct MemoryFilters {
    std::vector<std::string> tags;  // match when any tag is shared
    std::string category;           // long-term only
    int min_importance;             // long-term only
    int64_t after_time;             // created_at >= after_time
    int64_t before_time;            // created_at <= before_time
    int64_t live_at;                // working only: skip entries expired before this
    int limit;
    int offset;
    std::string sort_by;
    bool sort_desc;

    MemoryFilters()
        : min_importance(0)
        , after_time(0)
        , before_time(0)
        , live_at(0)
        , limit(0)
        , offset(0)
        , sort_desc(false)
    {}
};

struct MemoryQuery {
    std::string query;      // carried, not used for ranking yet
    MemoryFilters filters;
};

struct SnapshotFilters {
    std::string snapshot_type;
    int64_t after_time;
    int64_t before_time;
    int limit;
    int offset;

    SnapshotFilters() : after_time(0), before_time(0), limit(0), offset(0) {}
};

// An entry is eligible only when it satisfies every bound that is set
struct ArchiveCriteria {
    int64_t older_than_ms;          // created_at <= now - older_than_ms
    int max_access_count;           // access_count <= max_access_count
    int max_importance;             // importance <= max_importance
    std::vector<std::string> categories;
    bool dry_run;

    ArchiveCriteria()
        : older_than_ms(0)
        , max_access_count(0)
        , max_importance(0)
        , dry_run(false)
    {}
};

struct ArchiveReport {
    std::vector<std::string> eligible_keys;
    int archived;
    bool dry_run;

    ArchiveReport() : archived(0), dry_run(false) {}
};

struct RestoreReport {
    std::string snapshot_id;
    int restored;
    int skipped_expired;

    RestoreReport() : restored(0), skipped_expired(0) {}
};

} // namespace agentmem

#endif // AGENTMEM_MEMORY_TYPES_HPP
