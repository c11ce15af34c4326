#pragma once

#include "ui/Component.hpp"

namespace rdu::ui::widgets {

// " <path> (<N> visible, <size>)" for the directory being displayed
class DirectoryInfo : public Component {
public:
    void render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) override;
    SizeConstraints get_constraints() const override;

    static std::string format_line(const model::Snapshot& snap);
};

}  // namespace rdu::ui::widgets
