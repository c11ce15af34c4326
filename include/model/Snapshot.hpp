#pragma once

#include "model/SortMode.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace rdu::model {

struct EntryRow {
    std::string name;
    std::uint64_t size = 0;
    bool is_directory = false;

    bool operator==(const EntryRow&) const = default;
};

/**
 * Read-only view of the navigator state, rebuilt for every frame.
 * Widgets render from this and never touch the tree directly.
 */
struct Snapshot {
    std::string current_path;
    std::uint64_t current_size = 0;      // Sum of the listed entries' sizes
    std::size_t current_errors = 0;
    std::vector<EntryRow> entries;       // Children of the displayed directory, sorted
    std::optional<std::size_t> selection;

    SortMode sort_mode = SortMode::Size;
    bool sort_ascending = false;

    std::optional<std::string> status_message;

    std::size_t item_count() const { return entries.size(); }
};

}  // namespace rdu::model
