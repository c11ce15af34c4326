#include "ui/widgets/DirectoryInfo.hpp"
#include "ui/Formatting.hpp"
#include "config/Theme.hpp"

namespace rdu::ui::widgets {

std::string DirectoryInfo::format_line(const model::Snapshot& snap) {
    std::string line = " " + snap.current_path + " (" + std::to_string(snap.item_count()) +
                       " visible, " + format_size(snap.current_size);
    if (snap.current_errors > 0) {
        line += ", " + std::to_string(snap.current_errors) + " errors";
    }
    line += ")";
    return line;
}

void DirectoryInfo::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot& snap) {
    const auto& theme = config::ThemeManager::get_theme();
    draw_line(canvas, rect, 0, format_line(snap), theme.directory_info);
}

SizeConstraints DirectoryInfo::get_constraints() const {
    return SizeConstraints::fixed_height(1);
}

}  // namespace rdu::ui::widgets
