#pragma once

#include "ui/Component.hpp"

namespace rdu::ui::widgets {

// " rdu v<version>    (press ? for help)" across the full width
class TitleBar : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;
    SizeConstraints get_constraints() const override;
};

}  // namespace rdu::ui::widgets
