#include "ui/widgets/EntryList.hpp"
#include "ui/Formatting.hpp"
#include "config/Theme.hpp"
#include <algorithm>

namespace rdu::ui::widgets {

double EntryList::percent_of(std::uint64_t size, std::uint64_t parent_size) {
    if (parent_size == 0) return 0.0;
    return static_cast<double>(size) / static_cast<double>(parent_size) * 100.0;
}

void EntryList::update_scroll(const model::Snapshot& snap, int visible_rows) {
    int total = static_cast<int>(snap.item_count());
    if (visible_rows <= 0 || total <= visible_rows) {
        scroll_offset_ = 0;
        return;
    }

    if (snap.selection) {
        int selected = static_cast<int>(*snap.selection);
        if (selected < scroll_offset_) {
            scroll_offset_ = selected;
        }
        if (selected >= scroll_offset_ + visible_rows) {
            scroll_offset_ = selected - visible_rows + 1;
        }
    }

    // Never leave blank rows at the bottom while entries remain above
    scroll_offset_ = std::clamp(scroll_offset_, 0, total - visible_rows);
}

void EntryList::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    if (rect.empty()) return;

    update_scroll(snap, rect.height);

    int total = static_cast<int>(snap.item_count());
    int end_idx = std::min(scroll_offset_ + rect.height, total);

    for (int i = scroll_offset_; i < end_idx; ++i) {
        int y = rect.y + (i - scroll_offset_);
        bool selected = snap.selection && static_cast<int>(*snap.selection) == i;
        render_row(canvas, rect.x, y, rect.width, snap.entries[i], snap.current_size, selected);
    }
}

void EntryList::render_row(Canvas& canvas, int x, int y, int width,
                           const model::EntryRow& row, std::uint64_t parent_size, bool selected) const {
    const auto& theme = config::ThemeManager::get_theme();
    double percent = percent_of(row.size, parent_size);

    int cx = x;
    int right = x + width;
    auto draw = [&](const std::string& text, Style style) {
        if (cx >= right) return;
        std::string clipped = take_cols(text, right - cx);
        cx = canvas.draw_text(cx, y, clipped, style);
    };

    draw(rpad_trunc(format_size(row.size), SIZE_COLUMNS), theme.size);
    draw(" | ", theme.separator);
    draw(format_percent(percent, PERCENT_COLUMNS) + "%", theme.percent);
    draw(" | ", theme.separator);
    draw(trunc_pad(render_bar(percent, BAR_COLUMNS), BAR_COLUMNS), theme.bar);
    draw(" | ", theme.separator);
    draw((row.is_directory ? "/" : " ") + row.name,
         row.is_directory ? theme.directory_name : theme.file_name);

    if (selected) {
        canvas.set_style(x, y, width, theme.selection);
    }
}

}  // namespace rdu::ui::widgets
