#pragma once

#include "model/FileNode.hpp"
#include "model/ScanOptions.hpp"
#include "util/DirectoryWalker.hpp"
#include <filesystem>
#include <optional>
#include <vector>
#include <string>

namespace rdu::backend {

/**
 * A walked path with its resolved metadata.
 */
struct ScannedEntry {
    std::filesystem::path path;
    std::uint64_t size = 0;              // 0 for anything but regular files
    bool is_directory = false;
    std::optional<model::FileNode::TimePoint> modified_time;
};

/**
 * TreeBuilder: turns the unordered output of an EntrySource into a rooted
 * tree with aggregated directory sizes.
 *
 * Aggregation never depends on the walk's yield order: entries are ordered by
 * path depth, linked parent-first in one forward pass, and directory sizes
 * are folded into their parents in one deepest-first reverse pass.
 */
class TreeBuilder {
public:
    TreeBuilder(util::EntrySource& source, model::ScanOptions options);

    /**
     * Scan root and build its tree. Per-entry failures are counted on the
     * returned root and logged; they never abort the scan.
     */
    [[nodiscard]] model::FileNode::Ptr build(const std::filesystem::path& root) const;

    /**
     * Link already collected entries under a root node and aggregate sizes.
     * Entries may arrive in any order; ones whose parent is missing are dropped.
     */
    [[nodiscard]] static model::FileNode::Ptr assemble(
        const std::filesystem::path& root,
        std::optional<model::FileNode::TimePoint> root_mtime,
        std::vector<ScannedEntry> entries,
        std::size_t error_count
    );

    const model::ScanOptions& options() const { return options_; }

    // Number of path components, used as the linking order
    static std::size_t path_depth(const std::filesystem::path& path);

    // Last path component for display, "" for "/"
    static std::string display_name(const std::filesystem::path& path);

private:
    util::EntrySource& source_;
    model::ScanOptions options_;
};

}  // namespace rdu::backend
