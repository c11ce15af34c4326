#include "ui/widgets/HelpOverlay.hpp"
#include "config/Theme.hpp"
#include <algorithm>
#include <vector>

namespace rdu::ui::widgets {

namespace {

enum class LineKind { Blank, Title, Heading, Text, Hint };

struct HelpLine {
    LineKind kind;
    const char* text;
};

const std::vector<HelpLine>& help_lines() {
    static const std::vector<HelpLine> lines = {
        {LineKind::Blank, ""},
        {LineKind::Title, "  rdu - Disk Usage Analyzer"},
        {LineKind::Blank, ""},
        {LineKind::Heading, "  Navigation:"},
        {LineKind::Text, "    j / ↓           Move down 1 item"},
        {LineKind::Text, "    k / ↑           Move up 1 item"},
        {LineKind::Text, "    Ctrl+d / PgDn   Move down 10 items"},
        {LineKind::Text, "    Ctrl+u / PgUp   Move up 10 items"},
        {LineKind::Text, "    H / Home        Go to first item"},
        {LineKind::Text, "    G / End         Go to last item"},
        {LineKind::Blank, ""},
        {LineKind::Heading, "  Actions:"},
        {LineKind::Text, "    o / l / Enter   Enter directory"},
        {LineKind::Text, "    u / h / Bksp    Go up one level"},
        {LineKind::Text, "    r               Refresh current view"},
        {LineKind::Blank, ""},
        {LineKind::Heading, "  Display:"},
        {LineKind::Text, "    s               Toggle sort by size"},
        {LineKind::Text, "    m               Toggle sort by mtime"},
        {LineKind::Text, "    c               Toggle sort by count"},
        {LineKind::Blank, ""},
        {LineKind::Heading, "  Other:"},
        {LineKind::Text, "    ?               Toggle this help"},
        {LineKind::Text, "    q / Esc         Quit"},
        {LineKind::Blank, ""},
        {LineKind::Hint, "  Press any key to close"},
        {LineKind::Blank, ""},
    };
    return lines;
}

}  // namespace

void HelpOverlay::render(Canvas& canvas, const LayoutRect& rect, const model::Snapshot&) {
    if (!visible_) return;

    const auto& theme = config::ThemeManager::get_theme();
    const auto& lines = help_lines();

    // Centered, clipped to the screen
    int box_width = std::min(BOX_WIDTH, rect.width);
    int box_height = std::min(static_cast<int>(lines.size()) + 2, rect.height);
    if (box_width < 3 || box_height < 3) return;

    LayoutRect help_rect{
        rect.x + (rect.width - box_width) / 2,
        rect.y + (rect.height - box_height) / 2,
        box_width,
        box_height
    };

    auto content_rect = draw_box_border(canvas, help_rect, theme.help_border);
    canvas.draw_text(help_rect.x + 2, help_rect.y, " Help ", theme.help_title);

    for (int i = 0; i < content_rect.height && i < static_cast<int>(lines.size()); ++i) {
        const auto& line = lines[i];
        Style style = theme.help_text;
        switch (line.kind) {
            case LineKind::Title: style = theme.help_title; break;
            case LineKind::Heading: style = theme.help_heading; break;
            case LineKind::Hint: style = theme.help_hint; break;
            case LineKind::Blank:
            case LineKind::Text: break;
        }
        draw_line(canvas, content_rect, i, line.text, style);
    }
}

}  // namespace rdu::ui::widgets
