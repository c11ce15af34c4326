#include "backend/TreeBuilder.hpp"
#include "util/TimSort.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include "util/Logger.hpp"
#include <unordered_map>
#include <iterator>
#include <cerrno>
#include <sys/stat.h>

namespace rdu::backend {

namespace {

model::FileNode::TimePoint to_time_point(const struct timespec& ts) {
    auto since_epoch = std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
    return model::FileNode::TimePoint{
        std::chrono::duration_cast<model::FileNode::TimePoint::duration>(since_epoch)};
}

std::string strip_trailing_slashes(std::string s) {
    while (s.length() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

}  // namespace

TreeBuilder::TreeBuilder(util::EntrySource& source, model::ScanOptions options)
    : source_(source), options_(options) {}

std::size_t TreeBuilder::path_depth(const std::filesystem::path& path) {
    return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

std::string TreeBuilder::display_name(const std::filesystem::path& path) {
    return util::to_display_string(path.filename().string());
}

model::FileNode::Ptr TreeBuilder::build(const std::filesystem::path& root) const {
    const std::filesystem::path root_path = strip_trailing_slashes(root.string());

    std::optional<model::FileNode::TimePoint> root_mtime;
    struct stat root_stat;
    if (::stat(root_path.c_str(), &root_stat) == 0) {
        root_mtime = to_time_point(root_stat.st_mtim);
    } else {
        util::Logger::warn("TreeBuilder: Could not stat root " + root_path.string() + ": " +
                           util::Platform::error_string(errno));
    }

    std::optional<std::uint64_t> root_volume;
    if (options_.one_file_system) {
        root_volume = util::Platform::get_volume_id(root_path);
    }

    util::Logger::info("TreeBuilder: Scanning " + root_path.string() +
                       (options_.follow_links ? " (following links)" : "") +
                       (options_.one_file_system ? " (one file system)" : ""));

    auto items = source_.walk(root_path, options_);

    std::vector<ScannedEntry> entries;
    entries.reserve(items.size());
    std::size_t error_count = 0;

    for (auto& item : items) {
        if (!item.ok()) {
            ++error_count;
            util::Logger::warn("TreeBuilder: Walk error at " + item.path.string() + ": " + item.error);
            continue;
        }

        if (item.path == root_path) {
            continue;
        }

        if (root_volume) {
            auto volume = util::Platform::get_volume_id(item.path);
            if (volume && *volume != *root_volume) {
                continue;
            }
        }

        struct stat st;
        int rc = options_.follow_links ? ::stat(item.path.c_str(), &st)
                                       : ::lstat(item.path.c_str(), &st);
        if (rc != 0) {
            ++error_count;
            util::Logger::warn("TreeBuilder: Could not access " + item.path.string() + ": " +
                               util::Platform::error_string(errno));
            continue;
        }

        ScannedEntry entry;
        entry.path = std::move(item.path);
        entry.size = S_ISREG(st.st_mode) ? static_cast<std::uint64_t>(st.st_size) : 0;
        entry.is_directory = S_ISDIR(st.st_mode);
        entry.modified_time = to_time_point(st.st_mtim);
        entries.push_back(std::move(entry));
    }

    util::Logger::info("TreeBuilder: " + std::to_string(entries.size()) + " entries, " +
                       std::to_string(error_count) + " errors under " + root_path.string());

    return assemble(root_path, root_mtime, std::move(entries), error_count);
}

model::FileNode::Ptr TreeBuilder::assemble(
    const std::filesystem::path& root,
    std::optional<model::FileNode::TimePoint> root_mtime,
    std::vector<ScannedEntry> entries,
    std::size_t error_count
) {
    auto root_node = std::make_shared<model::FileNode>(root, display_name(root), 0, true, root_mtime);
    root_node->error_count = error_count;

    struct Pending {
        std::size_t depth;
        ScannedEntry entry;
    };

    std::vector<Pending> pending;
    pending.reserve(entries.size());
    for (auto& entry : entries) {
        std::size_t depth = path_depth(entry.path);
        pending.push_back({depth, std::move(entry)});
    }

    // A parent is always shallower than its children
    util::timsort(pending, [](const Pending& a, const Pending& b) {
        return a.depth < b.depth;
    });

    std::unordered_map<std::string, model::FileNode*> by_path;
    by_path.reserve(pending.size() + 1);
    by_path.emplace(root.string(), root_node.get());

    // Keeps orphans alive until the end of assembly
    std::vector<model::FileNode::Ptr> created;
    std::vector<model::FileNode*> parents;
    created.reserve(pending.size());
    parents.reserve(pending.size());

    for (auto& p : pending) {
        auto& e = p.entry;
        auto node = std::make_shared<model::FileNode>(
            e.path, display_name(e.path), e.size, e.is_directory, e.modified_time);

        model::FileNode* parent = nullptr;
        auto it = by_path.find(e.path.parent_path().string());
        if (it != by_path.end()) {
            parent = it->second;
            parent->children.push_back(node);
            // Directory totals are folded in by the reverse pass
            if (!e.is_directory) {
                parent->size += e.size;
            }
        } else {
            util::Logger::debug("TreeBuilder: No parent for " + e.path.string());
        }

        by_path.emplace(e.path.string(), node.get());
        created.push_back(std::move(node));
        parents.push_back(parent);
    }

    // Deepest first: every directory is final before it reaches its parent
    for (std::size_t i = created.size(); i-- > 0;) {
        if (created[i]->is_directory && parents[i]) {
            parents[i]->size += created[i]->size;
        }
    }

    return root_node;
}

}  // namespace rdu::backend
