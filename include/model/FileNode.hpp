#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <filesystem>
#include <cstdint>
#include <cstddef>

namespace rdu::model {

/**
 * One file or directory of a scanned tree.
 *
 * A directory owns its children. The navigator keeps extra shared handles to
 * the node being displayed and to its ancestors, so nodes are shared_ptr
 * rather than uniquely owned. For a directory, size is the sum of all file
 * sizes below it as of the last build or refresh of that directory.
 */
struct FileNode {
    using Ptr = std::shared_ptr<FileNode>;
    using TimePoint = std::chrono::system_clock::time_point;

    std::string name;               // Display name (last path component)
    std::filesystem::path path;     // Absolute path
    std::uint64_t size = 0;
    bool is_directory = false;
    std::vector<Ptr> children;      // Order is the last applied sort
    std::size_t error_count = 0;    // Unreadable entries seen by this node's own scan
    std::optional<TimePoint> modified_time;

    FileNode() = default;
    FileNode(std::filesystem::path p, std::string n, std::uint64_t sz, bool is_dir,
             std::optional<TimePoint> mtime)
        : name(std::move(n)), path(std::move(p)), size(sz), is_directory(is_dir),
          modified_time(mtime) {}

    std::size_t child_count() const { return children.size(); }
};

}  // namespace rdu::model
