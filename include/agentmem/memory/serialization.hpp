/*
 * agentmem - JSON encoding of memory entities
 *
 * Used by the SQLite store for nested columns, by snapshots to capture
 * working memory, and by stats to size entries.
 */
#ifndef AGENTMEM_MEMORY_SERIALIZATION_HPP
#define AGENTMEM_MEMORY_SERIALIZATION_HPP

#include "types.hpp"

namespace agentmem {

Json to_json(const WorkingMemory& m);

Json to_json(const MemoryMetadata& m);
MemoryMetadata metadata_from_json(const Json& j);

Json to_json(const LongtermMemory& m);

Json to_json(const MemoryConflict& c);
MemoryConflict conflict_from_json(const Json& j);

Json conflicts_to_json(const std::vector<MemoryConflict>& conflicts);
std::vector<MemoryConflict> conflicts_from_json(const Json& j);

Json doubles_to_json(const std::vector<double>& values);
std::vector<double> doubles_from_json(const Json& j);

} // namespace agentmem

#endif // AGENTMEM_MEMORY_SERIALIZATION_HPP
