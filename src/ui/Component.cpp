#include "ui/Component.hpp"
#include "ui/Formatting.hpp"

namespace rdu::ui {

void Component::draw_line(Canvas& canvas, const LayoutRect& rect, int row,
                          const std::string& text, Style style) const {
    if (row < 0 || row >= rect.height || rect.width <= 0) return;
    canvas.draw_text(rect.x, rect.y + row, trunc_pad(text, rect.width), style);
}

LayoutRect Component::draw_box_border(Canvas& canvas, const LayoutRect& rect, Style border_style) const {
    canvas.fill_rect(rect.x, rect.y, rect.width, rect.height, Cell{" ", Style{}});
    canvas.draw_rect(rect.x, rect.y, rect.width, rect.height, border_style);

    return LayoutRect{
        rect.x + 1,
        rect.y + 1,
        rect.width - 2,
        rect.height - 2
    };
}

}  // namespace rdu::ui
