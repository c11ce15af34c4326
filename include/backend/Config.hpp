#pragma once

#include "model/ScanOptions.hpp"
#include "util/Logger.hpp"
#include <string>
#include <unordered_map>
#include <filesystem>

namespace rdu::backend {

struct Config {
    // Scan settings
    model::ScanOptions scan;
    bool propagate_refresh = false;

    // Logging
    std::filesystem::path log_file = util::Logger::DEFAULT_LOG_FILE;
    util::Logger::Level log_level = util::Logger::Level::Info;

    // Keybinds: action -> key name
    std::unordered_map<std::string, std::string> keybinds;
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static std::filesystem::path get_config_file();

private:
    static bool parse_bool(const std::string& key, const std::string& value, bool fallback);
};

}  // namespace rdu::backend
