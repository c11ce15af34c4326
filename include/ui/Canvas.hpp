#pragma once

#include "ui/Color.hpp"
#include <vector>
#include <string>
#include <string_view>

namespace rdu::ui {

/**
 * A single cell on the terminal grid.
 * Represents what is visually displayed at one coordinate.
 * The cell right of a double-width character holds empty content.
 */
struct Cell {
    std::string content = " "; // UTF-8 code point plus any combining marks
    Style style;

    bool operator==(const Cell& other) const {
        return content == other.content && style == other.style;
    }

    bool operator!=(const Cell& other) const {
        return !(*this == other);
    }
};

/**
 * A 2D grid of Cells representing a rendering surface.
 * Origin (0,0) is top-left.
 */
class Canvas {
public:
    Canvas(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }

    // Out of bounds access yields a scratch cell
    Cell& at(int x, int y);
    const Cell& at(int x, int y) const;

    void clear(const Cell& fill_cell = Cell{" ", {}});
    void put(int x, int y, const std::string& grapheme, Style style = {});

    // Plain UTF-8 text, clipped at the right edge.
    // Returns the x-coordinate after the last column drawn.
    int draw_text(int x, int y, std::string_view text, Style style = {});

    // Single-line box border
    void draw_rect(int x, int y, int w, int h, Style style = {});

    void fill_rect(int x, int y, int w, int h, const Cell& cell);

    // Repaint the style of a horizontal run, keeping its content
    void set_style(int x, int y, int w, Style style);

    // Resize the canvas (clears content)
    void resize(int width, int height);

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> buffer_;

    bool is_in_bounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width_ && y < height_;
    }
};

} // namespace rdu::ui
