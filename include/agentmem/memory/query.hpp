/*
 * agentmem - Shared query evaluation
 *
 * Filtering, ordering and pagination applied identically by every store
 * implementation.
 */
#ifndef AGENTMEM_MEMORY_QUERY_HPP
#define AGENTMEM_MEMORY_QUERY_HPP

#include "types.hpp"
#include <vector>
#include <string>

namespace agentmem {

// True when filter is empty or the two lists share at least one tag
bool tags_intersect(const std::vector<std::string>& entry_tags,
                    const std::vector<std::string>& filter);

bool matches(const WorkingMemory& m, const MemoryFilters& filters);
bool matches(const LongtermMemory& m, const MemoryFilters& filters);
bool matches(const StateSnapshot& s, const SnapshotFilters& filters);

// Filter, sort and page in place
void apply_filters(std::vector<WorkingMemory>& items, const MemoryFilters& filters);
void apply_filters(std::vector<LongtermMemory>& items, const MemoryFilters& filters);
void apply_filters(std::vector<StateSnapshot>& items, const SnapshotFilters& filters);

// Eligibility for an archive sweep at now_ms
bool archive_eligible(const LongtermMemory& m, const ArchiveCriteria& criteria, int64_t now_ms);

} // namespace agentmem

#endif // AGENTMEM_MEMORY_QUERY_HPP
