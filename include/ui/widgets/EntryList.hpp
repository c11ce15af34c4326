#pragma once

#include "ui/Component.hpp"

namespace rdu::ui::widgets {

/**
 * EntryList Widget
 *
 * One row per child of the displayed directory:
 *   "<size> | <percent>% | <bar> | <name>"
 * Directory names carry a leading '/'. The selected row is highlighted and
 * the list scrolls to keep it visible.
 */
class EntryList : public Component {
public:
    static constexpr int SIZE_COLUMNS = 10;
    static constexpr int PERCENT_COLUMNS = 5;
    static constexpr int BAR_COLUMNS = 10;

    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    int scroll_offset() const { return scroll_offset_; }

    // Percentage of parent_size taken by size, 0 for an empty parent
    static double percent_of(std::uint64_t size, std::uint64_t parent_size);

private:
    void update_scroll(const model::Snapshot& snap, int visible_rows);
    void render_row(Canvas& canvas, int x, int y, int width,
                    const model::EntryRow& row, std::uint64_t parent_size, bool selected) const;

    int scroll_offset_ = 0;
};

}  // namespace rdu::ui::widgets
