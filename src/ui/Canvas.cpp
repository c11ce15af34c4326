#include "ui/Canvas.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace rdu::ui {

namespace {
constexpr const char* REPLACEMENT_CHAR = "\xEF\xBF\xBD";
}

Canvas::Canvas(int width, int height) : width_(width), height_(height) {
    buffer_.resize(static_cast<size_t>(width) * static_cast<size_t>(height));
}

Cell& Canvas::at(int x, int y) {
    if (!is_in_bounds(x, y)) {
        static Cell dummy;
        dummy = Cell{};
        return dummy;
    }
    return buffer_[y * width_ + x];
}

const Cell& Canvas::at(int x, int y) const {
    if (!is_in_bounds(x, y)) {
        static const Cell dummy;
        return dummy;
    }
    return buffer_[y * width_ + x];
}

void Canvas::clear(const Cell& fill_cell) {
    std::fill(buffer_.begin(), buffer_.end(), fill_cell);
}

void Canvas::put(int x, int y, const std::string& grapheme, Style style) {
    if (is_in_bounds(x, y)) {
        buffer_[y * width_ + x] = Cell{grapheme, style};
    }
}

void Canvas::resize(int width, int height) {
    if (width_ == width && height_ == height) return;
    width_ = width;
    height_ = height;
    buffer_.clear();
    buffer_.resize(static_cast<size_t>(width) * static_cast<size_t>(height));
}

int Canvas::draw_text(int x, int y, std::string_view text, Style style) {
    if (y < 0 || y >= height_) return x;

    int current_x = x;
    int last_x = -1;  // cell holding the previous base character

    size_t i = 0;
    while (i < text.length()) {
        size_t start = i;
        UChar32 c = util::next_codepoint(text, i);

        std::string grapheme = (c < 0) ? std::string(REPLACEMENT_CHAR)
                                       : std::string(text.substr(start, i - start));
        int char_width = (c < 0) ? 1 : util::codepoint_width(c);

        if (char_width == 0) {
            // Combining marks ride along with the preceding character
            if (c >= 0x20 && last_x >= 0 && is_in_bounds(last_x, y)) {
                buffer_[y * width_ + last_x].content += grapheme;
            }
            continue;
        }

        if (current_x + char_width > width_) break;

        if (current_x >= 0) {
            put(current_x, y, grapheme, style);
            last_x = current_x;

            // Continuation cell for double-width characters
            if (char_width == 2) {
                put(current_x + 1, y, "", style);
            }
        }

        current_x += char_width;
    }
    return current_x;
}

void Canvas::draw_rect(int x, int y, int w, int h, Style style) {
    if (w <= 0 || h <= 0) return;

    put(x, y, "┌", style);
    put(x + w - 1, y, "┐", style);
    put(x, y + h - 1, "└", style);
    put(x + w - 1, y + h - 1, "┘", style);

    for (int i = 1; i < w - 1; ++i) {
        put(x + i, y, "─", style);
        put(x + i, y + h - 1, "─", style);
    }

    for (int i = 1; i < h - 1; ++i) {
        put(x, y + i, "│", style);
        put(x + w - 1, y + i, "│", style);
    }
}

void Canvas::fill_rect(int x, int y, int w, int h, const Cell& cell) {
    for (int cy = y; cy < y + h; ++cy) {
        for (int cx = x; cx < x + w; ++cx) {
            if (is_in_bounds(cx, cy)) {
                buffer_[cy * width_ + cx] = cell;
            }
        }
    }
}

void Canvas::set_style(int x, int y, int w, Style style) {
    for (int cx = x; cx < x + w; ++cx) {
        if (is_in_bounds(cx, y)) {
            buffer_[y * width_ + cx].style = style;
        }
    }
}

} // namespace rdu::ui
