#include <agentmem/memory/types.hpp>
#include <agentmem/memory/serialization.hpp>
#include <agentmem/core/utils.hpp>

namespace agentmem {

int64_t snapshot_retention_ms(SnapshotType t) {
    switch (t) {
        case SnapshotType::PERIODIC: return 7 * MS_PER_DAY;
        case SnapshotType::MANUAL: return 30 * MS_PER_DAY;
        case SnapshotType::PRE_UPDATE: return 90 * MS_PER_DAY;
        case SnapshotType::PRE_SHUTDOWN: return 90 * MS_PER_DAY;
    }
    return 30 * MS_PER_DAY;
}

std::string compute_state_checksum(const Json& state) {
    return sha256_hex(state.dump());
}

bool parse_conflict_strategy(const std::string& s, ConflictStrategy& out) {
    std::string n = to_lower(trim(s));
    if (n == "last_write_wins") { out = ConflictStrategy::LAST_WRITE_WINS; return true; }
    if (n == "version_based") { out = ConflictStrategy::VERSION_BASED; return true; }
    if (n == "local_wins") { out = ConflictStrategy::LOCAL_WINS; return true; }
    if (n == "remote_wins") { out = ConflictStrategy::REMOTE_WINS; return true; }
    if (n == "manual") { out = ConflictStrategy::MANUAL; return true; }
    return false;
}

// ============================================================================
// Serialization
// ============================================================================

Json to_json(const WorkingMemory& m) {
    Json j = Json::object();
    j.set("id", m.id);
    j.set("agent_id", m.agent_id);
    j.set("key", m.key);
    j.set("value", m.value);
    j.set("metadata", m.metadata);
    j.set("created_at", m.created_at);
    j.set("updated_at", m.updated_at);
    j.set("accessed_at", m.accessed_at);
    j.set("access_count", m.access_count);
    j.set("expires_at", m.expires_at);
    j.set("version", m.version);
    return j;
}

Json doubles_to_json(const std::vector<double>& values) {
    Json j = Json::array();
    for (size_t i = 0; i < values.size(); ++i) j.push(Json(values[i]));
    return j;
}

std::vector<double> doubles_from_json(const Json& j) {
    std::vector<double> out;
    const std::vector<Json>& arr = j.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
        if (arr[i].is_number()) out.push_back(arr[i].as_number());
    }
    return out;
}

Json to_json(const MemoryMetadata& m) {
    Json j = Json::object();
    j.set("source", m.source);
    j.set("importance", m.importance);
    j.set("confidence", m.confidence);
    j.set("tags", Json::from_strings(m.tags));
    if (!m.references.empty()) j.set("references", Json::from_strings(m.references));
    if (!m.embedding.empty()) j.set("embedding", doubles_to_json(m.embedding));
    return j;
}

MemoryMetadata metadata_from_json(const Json& j) {
    MemoryMetadata m;
    m.source = j.get_string("source", m.source);
    m.importance = j.get_int("importance", m.importance);
    m.confidence = j.get_double("confidence", m.confidence);
    m.tags = j["tags"].as_string_list();
    m.references = j["references"].as_string_list();
    m.embedding = doubles_from_json(j["embedding"]);
    return m;
}

Json to_json(const LongtermMemory& m) {
    Json j = Json::object();
    j.set("id", m.id);
    j.set("agent_id", m.agent_id);
    j.set("category", m.category);
    j.set("key", m.key);
    j.set("value", m.value);
    j.set("metadata", to_json(m.metadata));
    j.set("created_at", m.created_at);
    j.set("updated_at", m.updated_at);
    j.set("last_accessed", m.last_accessed);
    j.set("access_count", m.access_count);
    j.set("version", m.version);
    return j;
}

Json to_json(const MemoryConflict& c) {
    Json j = Json::object();
    j.set("key", c.key);
    j.set("memory_type", memory_type_to_string(c.memory_type));
    j.set("local_version", c.local_version);
    j.set("remote_version", c.remote_version);
    j.set("local_value", c.local_value);
    j.set("remote_value", c.remote_value);
    j.set("local_time", c.local_time);
    j.set("remote_time", c.remote_time);
    j.set("detected_at", c.detected_at);
    return j;
}

MemoryConflict conflict_from_json(const Json& j) {
    MemoryConflict c;
    c.key = j.get_string("key");
    c.memory_type = string_to_memory_type(j.get_string("memory_type"));
    c.local_version = j.get_int("local_version");
    c.remote_version = j.get_int("remote_version");
    c.local_value = j["local_value"];
    c.remote_value = j["remote_value"];
    c.local_time = j.get_int64("local_time");
    c.remote_time = j.get_int64("remote_time");
    c.detected_at = j.get_int64("detected_at");
    return c;
}

Json conflicts_to_json(const std::vector<MemoryConflict>& conflicts) {
    Json j = Json::array();
    for (size_t i = 0; i < conflicts.size(); ++i) j.push(to_json(conflicts[i]));
    return j;
}

std::vector<MemoryConflict> conflicts_from_json(const Json& j) {
    std::vector<MemoryConflict> out;
    const std::vector<Json>& arr = j.as_array();
    for (size_t i = 0; i < arr.size(); ++i) out.push_back(conflict_from_json(arr[i]));
    return out;
}

} // namespace agentmem
