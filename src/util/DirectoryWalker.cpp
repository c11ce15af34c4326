#include "util/DirectoryWalker.hpp"
#include "util/WorkerPool.hpp"
#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <cerrno>
#include <cstring>

namespace rdu::util {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;           // Inode number
    int64_t  d_off;           // Offset to next structure
    uint16_t d_reclen;        // Size of this dirent
    uint8_t  d_type;          // File type
    char     d_name[];        // Filename (null-terminated)
};

std::vector<WalkItem> DirectoryWalker::walk(
    const std::filesystem::path& root,
    const model::ScanOptions& options
) {
    // Normalize: strip trailing slashes to prevent // in paths
    std::string root_str = root.string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }

    WalkState state;
    state.options = options;

    struct stat root_stat;
    if (::stat(root_str.c_str(), &root_stat) == 0) {
        state.root_device = static_cast<std::uint64_t>(root_stat.st_dev);
        state.root_device_known = true;
        if (options.follow_links) {
            mark_visited(state, root_stat.st_dev, root_stat.st_ino);
        }
    }

    size_t threads = options.threads > 0 ? options.threads : Platform::available_parallelism();
    Logger::info("DirectoryWalker: Walking " + root_str + " with " + std::to_string(threads) + " threads");

    {
        WorkerPool pool(threads);
        state.pool = &pool;
        pool.submit([root_str, &state]() {
            scan_directory(root_str, state);
        });
        pool.wait_idle();
    }

    Logger::info("DirectoryWalker: Found " + std::to_string(state.items.size()) + " entries under " + root_str);
    return std::move(state.items);
}

bool DirectoryWalker::mark_visited(WalkState& state, std::uint64_t dev, std::uint64_t ino) {
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.visited.emplace(dev, ino).second;
}

void DirectoryWalker::scan_directory(const std::string& dir_path, WalkState& state) {
    const auto& options = state.options;

    int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        std::lock_guard<std::mutex> lock(state.mutex);
        state.items.push_back(WalkItem::failure(dir_path, "Could not open directory: " + Platform::error_string(err)));
        return;
    }

    // One buffer per worker thread, reused across directories
    thread_local std::vector<char> buffer(BUFFER_SIZE);

    const std::string prefix = (dir_path == "/") ? std::string() : dir_path;
    const int stat_flags = options.follow_links ? 0 : AT_SYMLINK_NOFOLLOW;
    const bool need_identity = options.one_file_system || options.follow_links;

    std::vector<WalkItem> found;
    std::vector<std::string> subdirs;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            if (errno == EINTR) continue;
            found.push_back(WalkItem::failure(dir_path, "getdents64 failed: " + Platform::error_string(errno)));
            break;
        }

        if (nread == 0) {
            // End of directory
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            if (std::strcmp(d->d_name, ".") == 0 || std::strcmp(d->d_name, "..") == 0) {
                continue;
            }

            std::string full_path = prefix + "/" + d->d_name;
            found.push_back(WalkItem::entry(full_path));

            bool descend = false;
            struct stat entry_stat;
            bool have_stat = false;

            if (d->d_type == DT_DIR) {
                descend = true;
            } else if (d->d_type == DT_UNKNOWN || (d->d_type == DT_LNK && options.follow_links)) {
                // Filesystem without d_type, or a link we have to resolve
                if (fstatat(fd, d->d_name, &entry_stat, stat_flags) == 0) {
                    have_stat = true;
                    descend = S_ISDIR(entry_stat.st_mode);
                }
            }

            if (!descend) continue;

            if (need_identity && !have_stat) {
                if (fstatat(fd, d->d_name, &entry_stat, stat_flags) != 0) {
                    // The tree builder reports the stat failure for this entry
                    continue;
                }
            }

            if (options.one_file_system && state.root_device_known &&
                static_cast<std::uint64_t>(entry_stat.st_dev) != state.root_device) {
                Logger::debug("DirectoryWalker: Not crossing into " + full_path);
                continue;
            }

            if (options.follow_links && !mark_visited(state, entry_stat.st_dev, entry_stat.st_ino)) {
                found.push_back(WalkItem::failure(full_path, "Filesystem loop detected, not descending"));
                continue;
            }

            subdirs.push_back(std::move(full_path));
        }
    }

    ::close(fd);

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.items.insert(state.items.end(),
                           std::make_move_iterator(found.begin()),
                           std::make_move_iterator(found.end()));
    }

    for (auto& sub : subdirs) {
        state.pool->submit([path = std::move(sub), &state]() {
            scan_directory(path, state);
        });
    }
}

}  // namespace rdu::util
