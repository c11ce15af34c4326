#include "ui/widgets/TitleBar.hpp"
#include "config/Theme.hpp"
#include "config/Version.hpp"

namespace rdu::ui::widgets {

void TitleBar::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot&) {
    const auto& theme = config::ThemeManager::get_theme();
    draw_line(canvas, rect, 0,
              std::string(" rdu v") + config::VERSION + "    (press ? for help)",
              theme.header);
}

SizeConstraints TitleBar::get_constraints() const {
    return SizeConstraints::fixed_height(1);
}

}  // namespace rdu::ui::widgets
