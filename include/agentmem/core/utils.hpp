#ifndef AGENTMEM_CORE_UTILS_HPP
#define AGENTMEM_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace agentmem {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

const int64_t MS_PER_SECOND = 1000;
const int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
const int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;
const int64_t MS_PER_DAY = 24 * MS_PER_HOUR;

// Sleep for the specified number of milliseconds
void sleep_ms(int64_t milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Compute SHA256 hash as lowercase hex string
std::string sha256_hex(const std::string& data);

} // namespace agentmem

#endif // AGENTMEM_CORE_UTILS_HPP
