#pragma once

#include "ui/Component.hpp"

namespace rdu::ui::widgets {

class HelpOverlay : public Component {
public:
    static constexpr int BOX_WIDTH = 42;

    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;

    bool is_visible() const { return visible_; }
    void set_visible(bool v) { visible_ = v; }
    void toggle() { visible_ = !visible_; }

private:
    bool visible_ = false;
};

}  // namespace rdu::ui::widgets
