#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <thread>
#include <system_error>
#include <sys/stat.h>

namespace rdu::util {

std::filesystem::path Platform::get_config_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        auto path = std::filesystem::path(home) / ".config" / "rdu";
        Logger::debug("Platform: Config directory: " + path.string());
        return path;
    }
    Logger::warn("Platform: HOME env var not set, using fallback: .config/rdu");
    return ".config/rdu";
}

size_t Platform::available_parallelism() {
    size_t n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;
}

std::optional<std::uint64_t> Platform::get_volume_id(const std::filesystem::path& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(st.st_dev);
}

std::filesystem::path Platform::normalize_root(const std::filesystem::path& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    if (ec) {
        Logger::warn("Platform: Could not make " + path.string() + " absolute: " + ec.message());
        abs = path;
    }

    std::string s = abs.lexically_normal().string();
    // Strip trailing slashes so "a/b/" and "a/b" key the same node
    while (s.length() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return std::filesystem::path(s);
}

std::string Platform::error_string(int err) {
    return std::system_category().message(err);
}

}  // namespace rdu::util
