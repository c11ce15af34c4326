#include "ui/Color.hpp"

namespace rdu::ui {

int sgr_color_code(Color color, bool background) {
    if (color == Color::Default) return -1;

    int index = static_cast<int>(color) - 1;  // 0..15
    int base = background ? 40 : 30;
    if (index >= 8) {
        return base + 60 + (index - 8);  // Bright variants
    }
    return base + index;
}

} // namespace rdu::ui
