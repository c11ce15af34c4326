#pragma once

#include "ui/Component.hpp"

namespace rdu::ui::widgets {

// Footer: sort mode and total usage on the left, transient status on the right
class StatusBar : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;
    SizeConstraints get_constraints() const override;

    static std::string format_left(const model::Snapshot& snap);
};

}  // namespace rdu::ui::widgets
