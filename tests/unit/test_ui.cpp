#include "../framework/SimpleTest.hpp"
#include "backend/Navigator.hpp"
#include "backend/TreeBuilder.hpp"
#include "config/KeyMap.hpp"
#include "config/Theme.hpp"
#include "ui/Canvas.hpp"
#include "ui/Renderer.hpp"
#include "ui/widgets/DirectoryInfo.hpp"
#include "ui/widgets/EntryList.hpp"
#include "ui/widgets/StatusBar.hpp"
#include "ui/widgets/HelpOverlay.hpp"
#include <cstdint>
#include <stdint.h>
#include <vector>

using namespace rdu::ui;
using rdu::backend::Navigator;
using rdu::backend::ScannedEntry;
using rdu::backend::TreeBuilder;

namespace {

class NullSource : public rdu::util::EntrySource {
public:
    std::vector<rdu::util::WalkItem> walk(const std::filesystem::path&,
                                          const rdu::model::ScanOptions&) override {
        return {};
    }
};

NullSource null_source;
TreeBuilder null_builder(null_source, {});

rdu::model::FileNode::Ptr sample_tree() {
    return TreeBuilder::assemble("/r", std::nullopt, {
        ScannedEntry{"/r/a.txt", 50, false, std::nullopt},
        ScannedEntry{"/r/dir", 0, true, std::nullopt},
        ScannedEntry{"/r/dir/b", 150, false, std::nullopt},
    }, 0);
}

InputEvent key(const std::string& name) {
    return InputEvent{InputEvent::Type::KeyPress, name.size() == 1 ? name[0] : 0, name};
}

std::string row_text(const Canvas& canvas, int y) {
    std::string text;
    for (int x = 0; x < canvas.width(); ++x) {
        text += canvas.at(x, y).content;
    }
    return text;
}

}  // namespace

TEST_CASE(test_canvas_draw_text_wide_and_clipped) {
    Canvas canvas(6, 1);
    canvas.clear();
    int end = canvas.draw_text(0, 0, "日本x");
    ASSERT_EQ(end, 5);
    ASSERT_EQ(canvas.at(0, 0).content, std::string("日"));
    ASSERT_EQ(canvas.at(1, 0).content, std::string(""));
    ASSERT_EQ(canvas.at(4, 0).content, std::string("x"));

    // A wide character that would straddle the edge is not drawn
    Canvas narrow(3, 1);
    narrow.clear();
    ASSERT_EQ(narrow.draw_text(0, 0, "a日本"), 3);
    ASSERT_EQ(narrow.at(2, 0).content, std::string(""));
    narrow.clear();
    ASSERT_EQ(narrow.draw_text(0, 0, "ab日"), 2);
    ASSERT_EQ(narrow.at(2, 0).content, std::string(" "));
}

TEST_CASE(test_canvas_invalid_utf8_and_combining) {
    Canvas canvas(4, 1);
    canvas.clear();
    canvas.draw_text(0, 0, std::string("a") + '\xff' + "e\xCC\x81");
    ASSERT_EQ(canvas.at(1, 0).content, std::string("\xEF\xBF\xBD"));
    ASSERT_EQ(canvas.at(2, 0).content, std::string("e\xCC\x81"));
    ASSERT_EQ(canvas.at(3, 0).content, std::string(" "));
}

TEST_CASE(test_directory_info_line) {
    rdu::model::Snapshot snap;
    snap.current_path = "/home/user";
    snap.current_size = 2048;
    snap.entries.resize(3);
    ASSERT_EQ(widgets::DirectoryInfo::format_line(snap), std::string(" /home/user (3 visible, 2.0 KiB)"));

    snap.current_errors = 2;
    ASSERT_EQ(widgets::DirectoryInfo::format_line(snap),
              std::string(" /home/user (3 visible, 2.0 KiB, 2 errors)"));
}

TEST_CASE(test_status_bar_left_text) {
    rdu::model::Snapshot snap;
    snap.current_size = 160;
    snap.sort_mode = rdu::model::SortMode::ModifiedTime;
    snap.sort_ascending = true;
    ASSERT_EQ(widgets::StatusBar::format_left(snap),
              std::string("Sort mode: mtime ascending  Total disk usage: 160 B"));
}

TEST_CASE(test_status_bar_right_aligns_message) {
    rdu::model::Snapshot snap;
    snap.status_message = "Refresh complete!";
    Canvas canvas(80, 1);
    canvas.clear();

    widgets::StatusBar bar;
    bar.render(canvas, LayoutRect{0, 0, 80, 1}, snap);

    std::string text = row_text(canvas, 0);
    ASSERT_TRUE(text.rfind("Sort mode: size descending", 0) == 0);
    ASSERT_EQ(text.substr(text.size() - 17), std::string("Refresh complete!"));
}

TEST_CASE(test_entry_list_row_format) {
    rdu::model::Snapshot snap;
    snap.current_size = 200;
    snap.entries = {{"dir", 150, true}, {"a.txt", 50, false}};
    snap.selection = 0;

    Canvas canvas(60, 3);
    canvas.clear();
    widgets::EntryList list;
    list.render(canvas, LayoutRect{0, 0, 60, 3}, snap);

    std::string second = row_text(canvas, 1);
    ASSERT_TRUE(second.rfind("      50 B |  25.0% | ██▌        |  a.txt", 0) == 0);

    std::string first = row_text(canvas, 0);
    ASSERT_TRUE(first.rfind("     150 B |  75.0% | ███████▌   | /dir", 0) == 0);
    ASSERT_TRUE(canvas.at(0, 0).style == rdu::config::ThemeManager::get_theme().selection);
    ASSERT_FALSE(canvas.at(0, 1).style == rdu::config::ThemeManager::get_theme().selection);
}

TEST_CASE(test_entry_list_column_layout) {
    rdu::model::Snapshot snap;
    snap.current_size = 1;
    snap.entries = {{"x", 1, false}};

    Canvas canvas(60, 1);
    canvas.clear();
    widgets::EntryList list;
    list.render(canvas, LayoutRect{0, 0, 60, 1}, snap);

    // size | percent% | bar | name, with fixed column widths
    const int percent_at = widgets::EntryList::SIZE_COLUMNS + 3;
    const int bar_at = percent_at + widgets::EntryList::PERCENT_COLUMNS + 1 + 3;
    const int name_at = bar_at + widgets::EntryList::BAR_COLUMNS + 3;
    ASSERT_EQ(canvas.at(widgets::EntryList::SIZE_COLUMNS + 1, 0).content, std::string("|"));
    ASSERT_EQ(canvas.at(percent_at + widgets::EntryList::PERCENT_COLUMNS, 0).content, std::string("%"));
    ASSERT_EQ(canvas.at(bar_at, 0).content, std::string("█"));
    ASSERT_EQ(canvas.at(name_at + 1, 0).content, std::string("x"));
}

TEST_CASE(test_entry_list_scrolls_to_selection) {
    rdu::model::Snapshot snap;
    snap.current_size = 100;
    for (int i = 0; i < 20; ++i) {
        snap.entries.push_back({"f" + std::to_string(i), 5, false});
    }

    Canvas canvas(50, 5);
    widgets::EntryList list;

    snap.selection = 12;
    list.render(canvas, LayoutRect{0, 0, 50, 5}, snap);
    ASSERT_EQ(list.scroll_offset(), 8);

    snap.selection = 3;
    list.render(canvas, LayoutRect{0, 0, 50, 5}, snap);
    ASSERT_EQ(list.scroll_offset(), 3);

    ASSERT_EQ(widgets::EntryList::percent_of(5, 0), 0.0);
}

TEST_CASE(test_help_overlay_is_centered) {
    rdu::model::Snapshot snap;
    Canvas canvas(80, 40);
    canvas.clear();

    widgets::HelpOverlay help;
    help.render(canvas, LayoutRect{0, 0, 80, 40}, snap);
    ASSERT_EQ(canvas.at(19, 5).content, std::string(" "));  // hidden: nothing drawn

    help.set_visible(true);
    help.render(canvas, LayoutRect{0, 0, 80, 40}, snap);
    int left = (80 - widgets::HelpOverlay::BOX_WIDTH) / 2;
    int top = (40 - 29) / 2;
    ASSERT_EQ(canvas.at(left, top).content, std::string("┌"));
    ASSERT_EQ(canvas.at(left + widgets::HelpOverlay::BOX_WIDTH - 1, top).content, std::string("┐"));
}

TEST_CASE(test_keys_drive_navigator) {
    Navigator nav(sample_tree(), null_builder);
    rdu::config::KeyMap keymap;
    Renderer renderer(nav, keymap);

    renderer.handle_input_event(key("j"));
    ASSERT_EQ(nav.selection(), std::optional<size_t>(1));
    renderer.handle_input_event(key("H"));
    ASSERT_EQ(nav.selection(), std::optional<size_t>(0));

    renderer.handle_input_event(key("enter"));
    ASSERT_EQ(nav.current()->name, std::string("dir"));
    renderer.handle_input_event(key("backspace"));
    ASSERT_EQ(nav.current()->name, std::string("r"));

    renderer.handle_input_event(key("c"));
    ASSERT_TRUE(nav.sort_mode() == rdu::model::SortMode::ItemCount);
    ASSERT_EQ(nav.status_message(), std::optional<std::string>("Sort: count desc"));

    // Any key press drops the previous status
    renderer.handle_input_event(key("z"));
    ASSERT_FALSE(nav.status_message().has_value());
    ASSERT_FALSE(renderer.should_quit());
}

TEST_CASE(test_help_overlay_key_handling) {
    Navigator nav(sample_tree(), null_builder);
    rdu::config::KeyMap keymap;
    Renderer renderer(nav, keymap);

    renderer.handle_input_event(key("?"));
    ASSERT_TRUE(renderer.is_help_visible());

    // Keys close the overlay and are otherwise ignored
    renderer.handle_input_event(key("j"));
    ASSERT_FALSE(renderer.is_help_visible());
    ASSERT_EQ(nav.selection(), std::optional<size_t>(0));

    renderer.handle_input_event(key("?"));
    renderer.handle_input_event(key("?"));
    ASSERT_FALSE(renderer.is_help_visible());

    renderer.handle_input_event(key("?"));
    renderer.handle_input_event(key("escape"));
    ASSERT_FALSE(renderer.is_help_visible());
    ASSERT_FALSE(renderer.should_quit());

    renderer.handle_input_event(key("?"));
    renderer.handle_input_event(key("q"));
    ASSERT_TRUE(renderer.should_quit());
}

TEST_CASE(test_escape_quits_without_overlay) {
    Navigator nav(sample_tree(), null_builder);
    rdu::config::KeyMap keymap;
    Renderer renderer(nav, keymap);

    renderer.handle_input_event(key("escape"));
    ASSERT_TRUE(renderer.should_quit());
}

TEST_CASE(test_diff_canvas_only_changed_cells) {
    Canvas prev(10, 2);
    prev.clear();
    Canvas next = prev;
    ASSERT_EQ(Renderer::diff_canvas(next, prev), std::string(""));

    next.draw_text(3, 1, "hi", Style{Color::Green, Color::Default, Attribute::None});
    std::string out = Renderer::diff_canvas(next, prev);
    ASSERT_EQ(out, std::string("\033[2;4H\033[0;32mhi\033[0m"));
}

int main() {
    return rdu::test::TestRunner::instance().run_all("ui");
}
