#pragma once

namespace rdu::model {

enum class SortMode {
    Size,
    ModifiedTime,
    ItemCount,
};

inline const char* sort_mode_name(SortMode mode) {
    switch (mode) {
        case SortMode::Size:         return "size";
        case SortMode::ModifiedTime: return "mtime";
        case SortMode::ItemCount:    return "count";
    }
    return "size";
}

}  // namespace rdu::model
