#pragma once

#include <filesystem>
#include <string>

namespace rdu::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static constexpr const char* DEFAULT_LOG_FILE = "/tmp/rdu_debug.log";

    static void init(const std::filesystem::path& file = DEFAULT_LOG_FILE, Level min_level = Level::Info);
    static void set_min_level(Level level);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn"/"warning", "error"; anything else yields Info
    static Level parse_level(const std::string& name);
};

}  // namespace rdu::util
