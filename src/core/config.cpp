#include <agentmem/core/config.hpp>
#include <agentmem/core/logger.hpp>
#include <agentmem/core/utils.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace agentmem {

Config::Config() : data_(Json::object()) {}

bool Config::load_file(const std::string& path) {
    std::ifstream f(path.c_str());
    if (!f.is_open()) {
        last_error_ = "cannot open config file: " + path;
        return false;
    }

    std::string content((std::istreambuf_iterator<char>(f)),
                        std::istreambuf_iterator<char>());
    if (!load_string(content)) {
        last_error_ = path + ": " + last_error_;
        return false;
    }
    LOG_DEBUG("Config: loaded %s", path.c_str());
    return true;
}

bool Config::load_string(const std::string& json_str) {
    try {
        Json parsed = Json::parse(json_str);
        if (!parsed.is_object()) {
            last_error_ = "config root must be a JSON object";
            return false;
        }
        data_ = parsed;
        last_error_.clear();
        return true;
    } catch (const JsonParseError& e) {
        last_error_ = e.what();
        return false;
    }
}

const Json& Config::lookup(const std::string& key) const {
    // Walk dot-separated sections ("sync.interval_ms")
    const Json* node = &data_;
    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        node = &(*node)[part];
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return *node;
}

std::string Config::to_env_key(const std::string& key) {
    std::string env = "AGENTMEM_";
    for (size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        env += (c == '.' || c == '-') ? '_' : c;
    }
    return to_upper(env);
}

bool Config::env_value(const std::string& key, std::string& out) {
    const char* v = std::getenv(to_env_key(key).c_str());
    if (!v) return false;
    out = v;
    return true;
}

std::string Config::get_string(const std::string& key, const std::string& def) const {
    std::string env;
    if (env_value(key, env)) {
        LOG_DEBUG("Config: '%s' taken from environment", key.c_str());
        return env;
    }
    const Json& v = lookup(key);
    if (v.is_string()) return v.as_string();

    LOG_DEBUG("Config: key '%s' not found", key.c_str());
    return def;
}

int64_t Config::get_int(const std::string& key, int64_t def) const {
    std::string env;
    if (env_value(key, env)) {
        char* end = NULL;
        long long parsed = std::strtoll(env.c_str(), &end, 10);
        if (end && *end == '\0' && !env.empty()) {
            return static_cast<int64_t>(parsed);
        }
        LOG_WARN("Config: ignoring non-numeric %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    const Json& v = lookup(key);
    if (v.is_number()) return v.as_int();
    return def;
}

bool Config::get_bool(const std::string& key, bool def) const {
    std::string env;
    if (env_value(key, env)) {
        std::string e = to_lower(trim(env));
        if (e == "1" || e == "true" || e == "yes" || e == "on") return true;
        if (e == "0" || e == "false" || e == "no" || e == "off") return false;
        LOG_WARN("Config: ignoring non-boolean %s='%s'", to_env_key(key).c_str(), env.c_str());
    }
    const Json& v = lookup(key);
    if (v.is_bool()) return v.as_bool();
    return def;
}

const Json& Config::get_section(const std::string& key) const {
    return lookup(key);
}

const Json& Config::data() const { return data_; }

} // namespace agentmem
