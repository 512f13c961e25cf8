#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace rcy::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

uint64_t env_uint64_or(const char* name, uint64_t fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string str(val);
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        return fallback;
    }
    try {
        return std::stoull(str);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("RCY_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.admin.admin_id = env_or("RCY_ADMIN_ID", s.admin.admin_id);
    s.admin.custody_id = env_or("RCY_CUSTODY_ID", s.admin.custody_id);
    s.registry.max_points_per_unit = env_uint64_or("RCY_MAX_POINTS_PER_UNIT", s.registry.max_points_per_unit);
    s.events.event_log_path = env_or("RCY_EVENT_LOG", s.events.event_log_path);
    s.storage.backend = env_or("RCY_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("RCY_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.write_buffer_size = env_int_or("RCY_WRITE_BUFFER_SIZE", s.storage.write_buffer_size);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.storage.backend = "parquet";
    s.storage.data_directory = "data/prod";
    s.storage.write_buffer_size = 4096;
    s.events.event_log_path = "data/prod/events.jsonl";
    return s;
}

} // namespace rcy::config
