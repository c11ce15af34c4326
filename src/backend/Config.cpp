#include "backend/Config.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace rdu::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

}  // namespace

Config ConfigLoader::load_config() {
    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    return Config{};
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg;

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring line " + std::to_string(line_no) + ": " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "scan") {
            if (key == "follow_links") {
                cfg.scan.follow_links = parse_bool(key, value, cfg.scan.follow_links);
            } else if (key == "one_file_system") {
                cfg.scan.one_file_system = parse_bool(key, value, cfg.scan.one_file_system);
            } else if (key == "propagate_refresh") {
                cfg.propagate_refresh = parse_bool(key, value, cfg.propagate_refresh);
            } else if (key == "threads") {
                try {
                    int threads = std::stoi(value);
                    if (threads < 0) throw std::out_of_range("negative");
                    cfg.scan.threads = static_cast<size_t>(threads);
                } catch (const std::exception&) {
                    util::Logger::warn("Config: Invalid thread count '" + value + "'");
                }
            }
        }
        else if (current_section == "logging") {
            if (key == "file") cfg.log_file = value;
            else if (key == "level") cfg.log_level = util::Logger::parse_level(value);
        }
        else if (current_section == "keybinds") {
            cfg.keybinds[key] = value;
        }
    }

    return cfg;
}

bool ConfigLoader::parse_bool(const std::string& key, const std::string& value, bool fallback) {
    if (value == "true") return true;
    if (value == "false") return false;
    util::Logger::warn("Config: Expected true/false for " + key + ", got '" + value + "'");
    return fallback;
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

}  // namespace rdu::backend
