#pragma once

#include <cstdint>
#include <string>

namespace rcy::config {

struct AdminSettings {
    std::string admin_id = "admin";
    std::string custody_id = "custody";
};

struct RegistrySettings {
    uint64_t max_points_per_unit = 10000;
};

struct EventSettings {
    std::string event_log_path;           // empty: observations go to stdout
};

struct StorageSettings {
    std::string backend = "memory";       // "memory" or "parquet"
    std::string data_directory = "data";
    int write_buffer_size = 1024;
};

struct Settings {
    AdminSettings admin;
    RegistrySettings registry;
    EventSettings events;
    StorageSettings storage;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace rcy::config
