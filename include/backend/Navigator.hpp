#pragma once

#include "backend/TreeBuilder.hpp"
#include "model/FileNode.hpp"
#include "model/SortMode.hpp"
#include "model/Snapshot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rdu::backend {

/**
 * Navigator: the browsing state machine.
 *
 * Holds the displayed directory, the stack of its ancestors, the list
 * selection and the active sort. Every operation is total: on an empty
 * directory moves are no-ops and the selection stays absent.
 *
 * Refresh rebuilds only the displayed directory. Its own size is replaced,
 * ancestors keep the totals from their last build unless propagate_refresh
 * is set, in which case the size change is applied along the history stack.
 */
class Navigator {
public:
    static constexpr std::size_t PAGE_SIZE = 10;

    Navigator(model::FileNode::Ptr root, const TreeBuilder& builder, bool propagate_refresh = false);

    // Selection movement
    void next();
    void previous();
    void page_down();
    void page_up();
    void go_to_first();
    void go_to_last();

    // Traversal
    void enter_dir();
    void go_up();
    void refresh();

    // Sorting
    void toggle_sort_by_size();
    void toggle_sort_by_mtime();
    void toggle_sort_by_count();

    // Transient status line text
    void set_status(std::string message) { status_message_ = std::move(message); }
    void clear_status() { status_message_.reset(); }
    const std::optional<std::string>& status_message() const { return status_message_; }

    const model::FileNode::Ptr& root() const { return root_; }
    const model::FileNode::Ptr& current() const { return current_; }
    const std::vector<model::FileNode::Ptr>& history() const { return history_; }
    std::optional<std::size_t> selection() const { return selection_; }
    model::SortMode sort_mode() const { return sort_mode_; }
    bool sort_ascending() const { return sort_ascending_; }

    [[nodiscard]] model::Snapshot snapshot() const;

private:
    void toggle_sort(model::SortMode mode);
    void apply_sort();
    void reset_selection();
    std::size_t child_count() const { return current_->children.size(); }

    model::FileNode::Ptr root_;
    model::FileNode::Ptr current_;
    std::vector<model::FileNode::Ptr> history_;  // root first, parent of current last
    std::optional<std::size_t> selection_;

    model::SortMode sort_mode_ = model::SortMode::Size;
    bool sort_ascending_ = false;

    std::optional<std::string> status_message_;

    const TreeBuilder& builder_;
    bool propagate_refresh_ = false;
};

}  // namespace rdu::backend
