#include "ui/widgets/StatusBar.hpp"
#include "ui/Formatting.hpp"
#include "config/Theme.hpp"

namespace rdu::ui::widgets {

std::string StatusBar::format_left(const model::Snapshot& snap) {
    return std::string("Sort mode: ") + model::sort_mode_name(snap.sort_mode) + " " +
           (snap.sort_ascending ? "ascending" : "descending") +
           "  Total disk usage: " + format_size(snap.current_size);
}

void StatusBar::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    if (rect.empty()) return;
    const auto& theme = config::ThemeManager::get_theme();

    std::string right;
    if (snap.status_message && !snap.status_message->empty()) {
        right = "  " + *snap.status_message;
    }

    canvas.draw_text(rect.x, rect.y, lr_align(rect.width, format_left(snap), right), theme.header);
}

SizeConstraints StatusBar::get_constraints() const {
    return SizeConstraints::fixed_height(1);
}

}  // namespace rdu::ui::widgets
