#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace rdu::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();

    // Worker count for parallel walks: hardware concurrency, 4 if unknown
    static size_t available_parallelism();

    // Device id of the filesystem holding path (follows symlinks).
    // nullopt when the path cannot be stat'ed.
    static std::optional<std::uint64_t> get_volume_id(const std::filesystem::path& path);

    // Absolute, lexically normal, no trailing separator (except for "/")
    static std::filesystem::path normalize_root(const std::filesystem::path& path);

    // strerror() for errno values, thread-safe
    static std::string error_string(int err);
};

}  // namespace rdu::util
