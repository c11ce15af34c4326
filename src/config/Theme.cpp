#include "config/Theme.hpp"

namespace rdu::config {

using ui::Attribute;
using ui::Color;

namespace {

Theme make_default_theme() {
    Theme t;
    t.header = {Color::Black, Color::White, Attribute::Bold};
    t.directory_info = {Color::BrightCyan, Color::Default, Attribute::Bold};
    t.size = {Color::Green, Color::Default, Attribute::None};
    t.percent = {Color::BrightWhite, Color::Default, Attribute::None};
    t.bar = {Color::Green, Color::Default, Attribute::None};
    t.directory_name = {Color::BrightCyan, Color::Default, Attribute::Bold};
    t.file_name = {Color::White, Color::Default, Attribute::None};
    t.separator = {Color::BrightBlack, Color::Default, Attribute::None};
    t.selection = {Color::Black, Color::BrightWhite, Attribute::None};
    t.help_border = {Color::BrightCyan, Color::Default, Attribute::None};
    t.help_title = {Color::BrightCyan, Color::Default, Attribute::Bold};
    t.help_heading = {Color::BrightYellow, Color::Default, Attribute::Bold};
    t.help_text = {Color::White, Color::Default, Attribute::None};
    t.help_hint = {Color::BrightBlack, Color::Default, Attribute::None};
    return t;
}

}  // namespace

const Theme& ThemeManager::get_theme() {
    static const Theme theme = make_default_theme();
    return theme;
}

}  // namespace rdu::config
