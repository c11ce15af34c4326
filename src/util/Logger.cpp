#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace rdu::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Kept open for the process lifetime
static std::filesystem::path log_path = Logger::DEFAULT_LOG_FILE;
static Logger::Level min_log_level = Logger::Level::Info;

void Logger::init(const std::filesystem::path& file, Level min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = file;
    min_log_level = min_level;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_min_level(Level level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_log_level = level;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_log_level) return;
    if (!log_file.is_open()) {
        // Not initialized yet: append instead of truncating someone else's log
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    const char* level_str = "[INFO]  ";
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ") << level_str << message << '\n';
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return Level::Info;
}

}  // namespace rdu::util
