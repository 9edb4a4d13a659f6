#include "uplink/core/config.hpp"
#include <algorithm>
#include <cctype>

namespace uplink::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

uint64_t Config::get_uint64(const std::string& key, uint64_t default_value) const {
    auto value = get(key);
    if (!value || value->empty() || value->front() == '-') return default_value;
    
    auto parsed = get_as<uint64_t>(key);
    return parsed ? *parsed : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["log.level"] = "info";
    values_["log.file"] = "uplink.log";
    values_["storage.base_dir"] = "./uplink_data";
    values_["upload.max_file_size"] = "104857600";
    values_["upload.default_chunk_size"] = "5242880";
    values_["upload.min_chunk_size"] = "1048576";
    values_["upload.max_chunk_size"] = "67108864";
    values_["upload.max_chunk_retries"] = "5";
    values_["upload.backoff_base_ms"] = "1000";
    values_["upload.backoff_cap_ms"] = "30000";
    values_["upload.session_ttl_seconds"] = "86400";
    values_["upload.failed_grace_seconds"] = "7200";
    values_["upload.completed_retention_seconds"] = "3600";
    values_["upload.sliding_ttl"] = "false";
    values_["upload.max_concurrent_chunks"] = "4";
    values_["upload.max_sessions_per_owner"] = "0";
    values_["upload.finalize_attempts"] = "1";
    values_["sweeper.interval_seconds"] = "1800";
}

std::string Config::trim(const std::string& str) const {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    
    if (start >= end) {
        return "";
    }
    return std::string(start, end);
}

}
