#ifndef AGENTMEM_CORE_CONFIG_HPP
#define AGENTMEM_CORE_CONFIG_HPP

#include "json.hpp"
#include <string>
#include <cstdint>

namespace agentmem {

// JSON-backed configuration with environment overrides.
//
// Keys use dot notation for nested sections ("sync.interval_ms"). When the
// matching environment variable is set (AGENTMEM_SYNC_INTERVAL_MS for the key
// above) it takes precedence over the document.
class Config {
public:
    Config();

    // Load from JSON file
    bool load_file(const std::string& path);

    // Load from JSON string
    bool load_string(const std::string& json_str);

    std::string get_string(const std::string& key, const std::string& def = "") const;
    int64_t get_int(const std::string& key, int64_t def = 0) const;
    bool get_bool(const std::string& key, bool def = false) const;

    // Get nested object (null when absent)
    const Json& get_section(const std::string& key) const;

    // Raw data access
    const Json& data() const;

    std::string last_error() const { return last_error_; }

    // "sync.interval_ms" -> "AGENTMEM_SYNC_INTERVAL_MS"
    static std::string to_env_key(const std::string& key);

private:
    Json data_;
    std::string last_error_;

    const Json& lookup(const std::string& key) const;
    static bool env_value(const std::string& key, std::string& out);
};

} // namespace agentmem

#endif // AGENTMEM_CORE_CONFIG_HPP
