#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace rdu::ui {

namespace {
    constexpr int MIN_TERMINAL_COLS = 20;
    constexpr int MIN_TERMINAL_ROWS = 4;

    std::string style_sequence(const Style& style) {
        std::string seq = "\033[0";
        if (has_attribute(style.attr, Attribute::Bold)) seq += ";1";
        if (has_attribute(style.attr, Attribute::Dim)) seq += ";2";
        if (has_attribute(style.attr, Attribute::Reverse)) seq += ";7";

        int fg = sgr_color_code(style.fg, false);
        if (fg >= 0) seq += ";" + std::to_string(fg);
        int bg = sgr_color_code(style.bg, true);
        if (bg >= 0) seq += ";" + std::to_string(bg);

        seq += "m";
        return seq;
    }
}

Renderer::Renderer(backend::Navigator& navigator, const config::KeyMap& keymap)
    : navigator_(navigator),
      keymap_(keymap),
      canvas_(1, 1),
      prev_canvas_(1, 1) {
    title_bar_ = std::make_unique<widgets::TitleBar>();
    directory_info_ = std::make_unique<widgets::DirectoryInfo>();
    entry_list_ = std::make_unique<widgets::EntryList>();
    status_bar_ = std::make_unique<widgets::StatusBar>();
    help_overlay_ = std::make_unique<widgets::HelpOverlay>();
}

Renderer::~Renderer() = default;

void Renderer::compute_layout(int cols, int rows) {
    // Vertical stack: fixed rows first, the list takes the remainder
    struct Slot {
        LayoutRect* rect;
        SizeConstraints constraints;
    };
    std::vector<Slot> slots = {
        {&title_rect_, title_bar_->get_constraints()},
        {&info_rect_, directory_info_->get_constraints()},
        {&list_rect_, entry_list_->get_constraints()},
        {&status_rect_, status_bar_->get_constraints()},
    };

    int fixed_rows = 0;
    int flexible = 0;
    for (const auto& slot : slots) {
        if (slot.constraints.is_fixed()) {
            fixed_rows += *slot.constraints.max_height;
        } else {
            ++flexible;
        }
    }
    int remaining = std::max(0, rows - fixed_rows);

    int y = 0;
    for (auto& slot : slots) {
        int height = slot.constraints.is_fixed() ? *slot.constraints.max_height
                                                 : remaining / std::max(1, flexible);
        height = std::min(height, std::max(0, rows - y));
        *slot.rect = LayoutRect{0, y, cols, height};
        y += height;
    }
}

std::string Renderer::diff_canvas(const Canvas& canvas, const Canvas& prev) {
    std::string output;
    bool have_style = false;
    Style current_style;
    int cursor_x = -1, cursor_y = -1;

    for (int y = 0; y < canvas.height(); ++y) {
        for (int x = 0; x < canvas.width(); ++x) {
            const auto& cell = canvas.at(x, y);
            if (cell == prev.at(x, y)) continue;
            if (cell.content.empty()) continue;  // right half of a wide character

            if (x != cursor_x || y != cursor_y) {
                output += "\033[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
            }
            if (!have_style || cell.style != current_style) {
                output += style_sequence(cell.style);
                current_style = cell.style;
                have_style = true;
            }

            output += cell.content;
            bool wide = x + 1 < canvas.width() && canvas.at(x + 1, y).content.empty();
            cursor_x = x + (wide ? 2 : 1);
            cursor_y = y;
        }
    }

    if (have_style) {
        output += "\033[0m";
    }
    return output;
}

void Renderer::flush_canvas() {
    auto& terminal = Terminal::instance();

    std::string output = diff_canvas(canvas_, prev_canvas_);
    if (!output.empty()) {
        terminal.write_raw(std::move(output));
    }

    // Save for next diff
    prev_canvas_ = canvas_;
}

void Renderer::render(bool force_redraw) {
    auto& terminal = Terminal::instance();

    int cols = std::max(terminal.get_terminal_width(), MIN_TERMINAL_COLS);
    int rows = std::max(terminal.get_terminal_height(), MIN_TERMINAL_ROWS);

    bool size_changed = (cols != canvas_.width() || rows != canvas_.height());
    if (size_changed || force_redraw || needs_full_redraw_) {
        canvas_.resize(cols, rows);
        prev_canvas_.resize(cols, rows);
        // Force every cell to differ so the whole frame is repainted
        prev_canvas_.clear(Cell{"", Style{}});
        terminal.clear_screen();
        needs_full_redraw_ = false;
    }

    canvas_.clear();
    compute_layout(cols, rows);

    auto snap = navigator_.snapshot();

    title_bar_->render(canvas_, title_rect_, snap);
    directory_info_->render(canvas_, info_rect_, snap);
    entry_list_->render(canvas_, list_rect_, snap);
    status_bar_->render(canvas_, status_rect_, snap);

    if (help_overlay_->is_visible()) {
        LayoutRect fullscreen_rect{0, 0, cols, rows};
        help_overlay_->render(canvas_, fullscreen_rect, snap);
    }

    flush_canvas();
}

void Renderer::handle_input() {
    auto event = Terminal::instance().read_input();
    if (event.empty()) {
        return;
    }
    handle_input_event(event);
}

void Renderer::handle_input_event(const InputEvent& event) {
    if (event.type == InputEvent::Type::Resize) {
        needs_full_redraw_ = true;
        return;
    }
    if (event.type != InputEvent::Type::KeyPress) {
        return;
    }

    util::Logger::debug("Renderer: Key " + event.key_name);

    // Status messages last until the next key press
    navigator_.clear_status();

    std::string action = keymap_.lookup_action(event.key_name);

    if (help_overlay_->is_visible()) {
        if (action == "quit" && event.key_name != "escape") {
            should_quit_ = true;
        } else {
            // Any other key, Esc and '?' included, just closes the overlay
            help_overlay_->set_visible(false);
        }
        return;
    }

    if (action.empty()) {
        return;
    }
    dispatch_action(action);
}

void Renderer::dispatch_action(const std::string& action) {
    if (action == "quit") {
        util::Logger::info("Renderer: Quit requested");
        should_quit_ = true;
    } else if (action == "toggle_help") {
        help_overlay_->toggle();
    } else if (action == "next") {
        navigator_.next();
    } else if (action == "previous") {
        navigator_.previous();
    } else if (action == "page_down") {
        navigator_.page_down();
    } else if (action == "page_up") {
        navigator_.page_up();
    } else if (action == "go_to_first") {
        navigator_.go_to_first();
    } else if (action == "go_to_last") {
        navigator_.go_to_last();
    } else if (action == "enter_dir") {
        navigator_.enter_dir();
    } else if (action == "go_up") {
        navigator_.go_up();
    } else if (action == "refresh") {
        refresh_current();
    } else if (action == "sort_size") {
        navigator_.toggle_sort_by_size();
    } else if (action == "sort_mtime") {
        navigator_.toggle_sort_by_mtime();
    } else if (action == "sort_count") {
        navigator_.toggle_sort_by_count();
    } else {
        util::Logger::warn("Renderer: Unhandled action " + action);
    }
}

void Renderer::refresh_current() {
    // The rescan blocks; put the notice on screen before it starts
    navigator_.set_status("Rescanning...");
    auto& terminal = Terminal::instance();
    if (terminal.is_initialized()) {
        render();
        terminal.flush();
    }
    navigator_.refresh();
}

bool Renderer::should_quit() const {
    return should_quit_;
}

}  // namespace rdu::ui
