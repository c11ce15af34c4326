#include "backend/Navigator.hpp"
#include "backend/SortEngine.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace rdu::backend {

Navigator::Navigator(model::FileNode::Ptr root, const TreeBuilder& builder, bool propagate_refresh)
    : root_(std::move(root)),
      builder_(builder),
      propagate_refresh_(propagate_refresh) {
    current_ = root_;
    apply_sort();
    reset_selection();
    util::Logger::info("Navigator: Browsing " + current_->path.string() + " (" +
                       std::to_string(child_count()) + " entries)");
}

void Navigator::apply_sort() {
    SortEngine::sort(*current_, sort_mode_, sort_ascending_);
}

void Navigator::reset_selection() {
    if (child_count() == 0) {
        selection_.reset();
    } else {
        selection_ = 0;
    }
}

void Navigator::next() {
    std::size_t len = child_count();
    if (len == 0) return;

    if (!selection_) {
        selection_ = 0;
    } else if (*selection_ + 1 >= len) {
        selection_ = 0;
    } else {
        selection_ = *selection_ + 1;
    }
}

void Navigator::previous() {
    std::size_t len = child_count();
    if (len == 0) return;

    if (!selection_) {
        selection_ = 0;
    } else if (*selection_ == 0) {
        selection_ = len - 1;
    } else {
        selection_ = *selection_ - 1;
    }
}

void Navigator::page_down() {
    std::size_t len = child_count();
    if (len == 0) return;

    if (!selection_) {
        selection_ = 0;
        return;
    }
    selection_ = std::min(*selection_ + PAGE_SIZE, len - 1);
}

void Navigator::page_up() {
    std::size_t len = child_count();
    if (len == 0) return;

    if (!selection_) {
        selection_ = 0;
        return;
    }
    selection_ = *selection_ > PAGE_SIZE ? *selection_ - PAGE_SIZE : 0;
}

void Navigator::go_to_first() {
    if (child_count() == 0) return;
    selection_ = 0;
}

void Navigator::go_to_last() {
    std::size_t len = child_count();
    if (len == 0) return;
    selection_ = len - 1;
}

void Navigator::enter_dir() {
    if (!selection_ || *selection_ >= child_count()) return;

    auto selected = current_->children[*selection_];
    if (!selected->is_directory) return;

    history_.push_back(current_);
    current_ = std::move(selected);
    apply_sort();
    reset_selection();
    util::Logger::debug("Navigator: Entered " + current_->path.string());
}

void Navigator::go_up() {
    if (history_.empty()) return;

    current_ = std::move(history_.back());
    history_.pop_back();
    apply_sort();
    reset_selection();
    util::Logger::debug("Navigator: Back to " + current_->path.string());
}

void Navigator::refresh() {
    status_message_ = "Rescanning...";
    util::Logger::info("Navigator: Refreshing " + current_->path.string());

    auto fresh = builder_.build(current_->path);

    const std::uint64_t old_size = current_->size;
    current_->children = std::move(fresh->children);
    current_->size = fresh->size;
    current_->error_count = fresh->error_count;

    if (propagate_refresh_) {
        // Every ancestor's total contains the old size of this directory
        for (auto& ancestor : history_) {
            ancestor->size = ancestor->size - old_size + current_->size;
        }
    }

    apply_sort();
    reset_selection();
    status_message_ = "Refresh complete!";
    util::Logger::info("Navigator: Refresh of " + current_->path.string() + " complete, size " +
                       std::to_string(old_size) + " -> " + std::to_string(current_->size));
}

void Navigator::toggle_sort(model::SortMode mode) {
    if (sort_mode_ == mode) {
        sort_ascending_ = !sort_ascending_;
    } else {
        sort_mode_ = mode;
        sort_ascending_ = false;
    }
    apply_sort();
    status_message_ = std::string("Sort: ") + model::sort_mode_name(sort_mode_) + " " +
                      (sort_ascending_ ? "asc" : "desc");
}

void Navigator::toggle_sort_by_size() { toggle_sort(model::SortMode::Size); }
void Navigator::toggle_sort_by_mtime() { toggle_sort(model::SortMode::ModifiedTime); }
void Navigator::toggle_sort_by_count() { toggle_sort(model::SortMode::ItemCount); }

model::Snapshot Navigator::snapshot() const {
    model::Snapshot snap;
    snap.current_path = util::to_display_string(current_->path.string());
    // The view is one level deep: headers and percentages use the sum of
    // the listed children, which stays consistent after a child's refresh
    snap.current_size = 0;
    for (const auto& child : current_->children) {
        snap.current_size += child->size;
    }
    snap.current_errors = current_->error_count;
    snap.selection = selection_;
    snap.sort_mode = sort_mode_;
    snap.sort_ascending = sort_ascending_;
    snap.status_message = status_message_;

    snap.entries.reserve(current_->children.size());
    for (const auto& child : current_->children) {
        snap.entries.push_back({child->name, child->size, child->is_directory});
    }
    return snap;
}

}  // namespace rdu::backend
