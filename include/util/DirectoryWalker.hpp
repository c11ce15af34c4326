#pragma once

#include "model/ScanOptions.hpp"
#include <filesystem>
#include <vector>
#include <string>
#include <mutex>
#include <set>
#include <utility>
#include <cstdint>

namespace rdu::util {

class WorkerPool;

/**
 * One result of a walk: either a discovered path, or an error concerning a path.
 */
struct WalkItem {
    std::filesystem::path path;
    std::string error;  // empty on success

    bool ok() const { return error.empty(); }

    static WalkItem entry(std::filesystem::path p) { return {std::move(p), {}}; }
    static WalkItem failure(std::filesystem::path p, std::string message) {
        return {std::move(p), std::move(message)};
    }
};

/**
 * Enumerates every descendant of a root directory.
 *
 * walk() blocks until the enumeration is complete and returns the whole batch,
 * in no particular order. The root itself is not part of the result.
 */
class EntrySource {
public:
    virtual ~EntrySource() = default;

    [[nodiscard]] virtual std::vector<WalkItem> walk(
        const std::filesystem::path& root,
        const model::ScanOptions& options
    ) = 0;
};

/**
 * DirectoryWalker: parallel directory enumeration using the getdents64 syscall.
 *
 * Every directory is one job on a WorkerPool sized to the hardware. A job reads
 * the directory with large getdents64 batches, records each entry and submits
 * a job for every subdirectory. d_type avoids a stat() per entry; stat is only
 * needed for DT_UNKNOWN filesystems, followed symlinks and device checks.
 */
class DirectoryWalker : public EntrySource {
public:
    [[nodiscard]] std::vector<WalkItem> walk(
        const std::filesystem::path& root,
        const model::ScanOptions& options
    ) override;

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;  // 256KB getdents64 buffer

    struct WalkState {
        WorkerPool* pool = nullptr;
        model::ScanOptions options;
        std::uint64_t root_device = 0;
        bool root_device_known = false;

        std::mutex mutex;
        std::vector<WalkItem> items;
        std::set<std::pair<std::uint64_t, std::uint64_t>> visited;  // (dev, ino), follow_links only
    };

    static void scan_directory(const std::string& dir_path, WalkState& state);

    // Registers a directory for descent; false if it was already walked (symlink loop)
    static bool mark_visited(WalkState& state, std::uint64_t dev, std::uint64_t ino);
};

}  // namespace rdu::util
