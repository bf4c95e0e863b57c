#include <agentmem/memory/query.hpp>
#include <algorithm>

namespace agentmem {

bool tags_intersect(const std::vector<std::string>& entry_tags,
                    const std::vector<std::string>& filter) {
    if (filter.empty()) return true;
    for (size_t i = 0; i < filter.size(); ++i) {
        if (std::find(entry_tags.begin(), entry_tags.end(), filter[i]) != entry_tags.end()) {
            return true;
        }
    }
    return false;
}

static bool in_time_window(int64_t created_at, int64_t after_time, int64_t before_time) {
    if (after_time > 0 && created_at < after_time) return false;
    if (before_time > 0 && created_at > before_time) return false;
    return true;
}

// offset/limit paging; limit 0 means unbounded
template<typename T>
static void paginate(std::vector<T>& items, int offset, int limit) {
    if (offset > 0) {
        if (static_cast<size_t>(offset) >= items.size()) {
            items.clear();
            return;
        }
        items.erase(items.begin(), items.begin() + offset);
    }
    if (limit > 0 && items.size() > static_cast<size_t>(limit)) {
        items.resize(static_cast<size_t>(limit));
    }
}

bool matches(const WorkingMemory& m, const MemoryFilters& filters) {
    if (filters.live_at > 0 && m.is_expired(filters.live_at)) return false;
    if (!in_time_window(m.created_at, filters.after_time, filters.before_time)) return false;
    return tags_intersect(m.tags(), filters.tags);
}

bool matches(const LongtermMemory& m, const MemoryFilters& filters) {
    if (!filters.category.empty() && m.category != filters.category) return false;
    if (filters.min_importance > 0 && m.metadata.importance < filters.min_importance) return false;
    if (!in_time_window(m.created_at, filters.after_time, filters.before_time)) return false;
    return tags_intersect(m.metadata.tags, filters.tags);
}

bool matches(const StateSnapshot& s, const SnapshotFilters& filters) {
    if (!filters.snapshot_type.empty() &&
        snapshot_type_to_string(s.snapshot_type) != filters.snapshot_type) {
        return false;
    }
    return in_time_window(s.created_at, filters.after_time, filters.before_time);
}

// ============================================================================
// Ordering
// ============================================================================

namespace {

struct WorkingOrder {
    std::string field;
    bool desc;

    int compare(const WorkingMemory& a, const WorkingMemory& b) const {
        if (field == "key") return a.key.compare(b.key);
        int64_t x = a.created_at, y = b.created_at;
        if (field == "updated_at") { x = a.updated_at; y = b.updated_at; }
        else if (field == "accessed_at") { x = a.accessed_at; y = b.accessed_at; }
        else if (field == "expires_at") { x = a.expires_at; y = b.expires_at; }
        else if (field == "access_count") { x = a.access_count; y = b.access_count; }
        else if (field == "version") { x = a.version; y = b.version; }
        return x < y ? -1 : (x > y ? 1 : 0);
    }

    bool operator()(const WorkingMemory& a, const WorkingMemory& b) const {
        int c = compare(a, b);
        return desc ? c > 0 : c < 0;
    }
};

struct LongtermOrder {
    std::string field;
    bool desc;

    int compare(const LongtermMemory& a, const LongtermMemory& b) const {
        if (field == "key") return a.key.compare(b.key);
        if (field == "category") return a.category.compare(b.category);
        if (field == "confidence") {
            double x = a.metadata.confidence, y = b.metadata.confidence;
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        int64_t x = a.created_at, y = b.created_at;
        if (field == "updated_at") { x = a.updated_at; y = b.updated_at; }
        else if (field == "last_accessed") { x = a.last_accessed; y = b.last_accessed; }
        else if (field == "access_count") { x = a.access_count; y = b.access_count; }
        else if (field == "importance") { x = a.metadata.importance; y = b.metadata.importance; }
        else if (field == "version") { x = a.version; y = b.version; }
        return x < y ? -1 : (x > y ? 1 : 0);
    }

    bool operator()(const LongtermMemory& a, const LongtermMemory& b) const {
        int c = compare(a, b);
        return desc ? c > 0 : c < 0;
    }
};

// Default long-term order: most important first, then newest
bool longterm_default_order(const LongtermMemory& a, const LongtermMemory& b) {
    if (a.metadata.importance != b.metadata.importance) {
        return a.metadata.importance > b.metadata.importance;
    }
    return a.created_at > b.created_at;
}

bool snapshot_newest_first(const StateSnapshot& a, const StateSnapshot& b) {
    return a.created_at > b.created_at;
}

} // namespace

void apply_filters(std::vector<WorkingMemory>& items, const MemoryFilters& filters) {
    std::vector<WorkingMemory> kept;
    kept.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (matches(items[i], filters)) kept.push_back(items[i]);
    }

    WorkingOrder order;
    if (filters.sort_by.empty()) {
        order.field = "created_at";
        order.desc = true;
    } else {
        order.field = filters.sort_by;
        order.desc = filters.sort_desc;
    }
    std::stable_sort(kept.begin(), kept.end(), order);

    paginate(kept, filters.offset, filters.limit);
    items.swap(kept);
}

void apply_filters(std::vector<LongtermMemory>& items, const MemoryFilters& filters) {
    std::vector<LongtermMemory> kept;
    kept.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (matches(items[i], filters)) kept.push_back(items[i]);
    }

    if (filters.sort_by.empty()) {
        std::stable_sort(kept.begin(), kept.end(), longterm_default_order);
    } else {
        LongtermOrder order;
        order.field = filters.sort_by;
        order.desc = filters.sort_desc;
        std::stable_sort(kept.begin(), kept.end(), order);
    }

    paginate(kept, filters.offset, filters.limit);
    items.swap(kept);
}

void apply_filters(std::vector<StateSnapshot>& items, const SnapshotFilters& filters) {
    std::vector<StateSnapshot> kept;
    kept.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (matches(items[i], filters)) kept.push_back(items[i]);
    }
    std::stable_sort(kept.begin(), kept.end(), snapshot_newest_first);
    paginate(kept, filters.offset, filters.limit);
    items.swap(kept);
}

bool archive_eligible(const LongtermMemory& m, const ArchiveCriteria& criteria, int64_t now_ms) {
    if (criteria.older_than_ms > 0 && m.created_at > now_ms - criteria.older_than_ms) return false;
    if (criteria.max_access_count > 0 && m.access_count > criteria.max_access_count) return false;
    if (criteria.max_importance > 0 && m.metadata.importance > criteria.max_importance) return false;
    if (!criteria.categories.empty() &&
        std::find(criteria.categories.begin(), criteria.categories.end(), m.category) ==
            criteria.categories.end()) {
        return false;
    }
    return true;
}

} // namespace agentmem
