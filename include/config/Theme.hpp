#pragma once

#include "ui/Color.hpp"

namespace rdu::config {

struct Theme {
    ui::Style header;          // title bar and footer
    ui::Style directory_info;
    ui::Style size;
    ui::Style percent;
    ui::Style bar;
    ui::Style directory_name;
    ui::Style file_name;
    ui::Style separator;
    ui::Style selection;
    ui::Style help_border;
    ui::Style help_title;
    ui::Style help_heading;
    ui::Style help_text;
    ui::Style help_hint;
};

class ThemeManager {
public:
    // Process-wide, read-only after first use
    static const Theme& get_theme();
};

}  // namespace rdu::config
