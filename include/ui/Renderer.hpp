#pragma once

#include "backend/Navigator.hpp"
#include "config/KeyMap.hpp"
#include "ui/Canvas.hpp"
#include "ui/InputEvent.hpp"
#include "ui/widgets/TitleBar.hpp"
#include "ui/widgets/DirectoryInfo.hpp"
#include "ui/widgets/EntryList.hpp"
#include "ui/widgets/StatusBar.hpp"
#include "ui/widgets/HelpOverlay.hpp"
#include <memory>
#include <string>
#include <vector>

namespace rdu::ui {

class Renderer {
public:
    Renderer(backend::Navigator& navigator, const config::KeyMap& keymap);
    ~Renderer();

    void render(bool force_redraw = false);
    void handle_input();
    void handle_input_event(const InputEvent& event);
    bool should_quit() const;
    bool is_help_visible() const { return help_overlay_->is_visible(); }

    // Canvas cells -> escape sequences, only for cells that differ from prev
    static std::string diff_canvas(const Canvas& canvas, const Canvas& prev);

private:
    void dispatch_action(const std::string& action);
    void refresh_current();

    backend::Navigator& navigator_;
    const config::KeyMap& keymap_;
    bool should_quit_ = false;
    bool needs_full_redraw_ = true;

    // Canvas for rendering
    Canvas canvas_;
    Canvas prev_canvas_;  // For diffing (reduces flicker)

    // Widget rectangles (computed each frame based on terminal size)
    LayoutRect title_rect_;
    LayoutRect info_rect_;
    LayoutRect list_rect_;
    LayoutRect status_rect_;

    // Widgets
    std::unique_ptr<widgets::TitleBar> title_bar_;
    std::unique_ptr<widgets::DirectoryInfo> directory_info_;
    std::unique_ptr<widgets::EntryList> entry_list_;
    std::unique_ptr<widgets::StatusBar> status_bar_;
    std::unique_ptr<widgets::HelpOverlay> help_overlay_;

    // Layout computation
    void compute_layout(int width, int height);

    // Canvas -> Terminal rendering
    void flush_canvas();
};

}  // namespace rdu::ui
