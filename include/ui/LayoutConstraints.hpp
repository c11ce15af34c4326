#pragma once

#include <optional>

namespace rdu::ui {

/**
 * Height hints for a widget in the vertical stack.
 * A widget without max_height takes the rows left after fixed ones.
 */
struct SizeConstraints {
    std::optional<int> min_height;
    std::optional<int> max_height;

    bool is_fixed() const { return max_height.has_value() && min_height == max_height; }

    static SizeConstraints fixed_height(int rows) {
        SizeConstraints c;
        c.min_height = rows;
        c.max_height = rows;
        return c;
    }
};

/**
 * Computed layout rectangle for a widget
 */
struct LayoutRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const LayoutRect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    bool operator!=(const LayoutRect& other) const {
        return !(*this == other);
    }

    bool empty() const { return width <= 0 || height <= 0; }
};

}  // namespace rdu::ui
