#pragma once

#include <cstddef>

namespace rdu::model {

struct ScanOptions {
    bool follow_links = false;      // stat() instead of lstat(), descend into linked dirs
    bool one_file_system = false;   // skip entries on a different device than the root
    size_t threads = 0;             // walker workers, 0 = hardware concurrency

    bool operator==(const ScanOptions&) const = default;
};

}  // namespace rdu::model
