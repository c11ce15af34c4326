#pragma once

#include "ui/Canvas.hpp"
#include "ui/LayoutConstraints.hpp"
#include "model/Snapshot.hpp"
#include <string>

namespace rdu::ui {

/**
 * Base class for the browser's screen regions.
 *
 * Components render to a Canvas inside the rectangle the Renderer assigned
 * to them. They are stateless with respect to the tree: everything they
 * show comes from the Snapshot.
 */
class Component {
public:
    virtual ~Component() = default;

    /**
     * Render this component to the canvas.
     *
     * @param canvas    The canvas to draw on
     * @param rect      Allocated screen space (x, y, width, height)
     * @param snap      Current navigator state
     */
    virtual void render(
        Canvas& canvas,
        const LayoutRect& rect,
        const model::Snapshot& snap
    ) = 0;

    /**
     * Height hints for the vertical layout.
     * Default: fill whatever is left.
     */
    virtual SizeConstraints get_constraints() const {
        return SizeConstraints{};
    }

protected:
    /**
     * Fill one row of rect with text padded (or cut) to the full width.
     */
    void draw_line(Canvas& canvas, const LayoutRect& rect, int row,
                   const std::string& text, Style style) const;

    /**
     * Draw a bordered box over a cleared background.
     * Returns the inner content rectangle (area inside border).
     */
    LayoutRect draw_box_border(Canvas& canvas, const LayoutRect& rect, Style border_style) const;
};

}  // namespace rdu::ui
