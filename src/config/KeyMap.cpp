#include "config/KeyMap.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace rdu::config {

KeyMap::KeyMap() {
    load_default_keybinds();
}

void KeyMap::load_default_keybinds() {
    bindings_["j"] = "next";
    bindings_["down"] = "next";
    bindings_["k"] = "previous";
    bindings_["up"] = "previous";

    bindings_["ctrl+d"] = "page_down";
    bindings_["pagedown"] = "page_down";
    bindings_["ctrl+u"] = "page_up";
    bindings_["pageup"] = "page_up";

    bindings_["H"] = "go_to_first";
    bindings_["home"] = "go_to_first";
    bindings_["G"] = "go_to_last";
    bindings_["end"] = "go_to_last";

    bindings_["enter"] = "enter_dir";
    bindings_["right"] = "enter_dir";
    bindings_["l"] = "enter_dir";
    bindings_["o"] = "enter_dir";

    bindings_["backspace"] = "go_up";
    bindings_["left"] = "go_up";
    bindings_["h"] = "go_up";
    bindings_["u"] = "go_up";

    bindings_["r"] = "refresh";
    bindings_["s"] = "sort_size";
    bindings_["m"] = "sort_mtime";
    bindings_["c"] = "sort_count";

    bindings_["?"] = "toggle_help";
    bindings_["q"] = "quit";
    bindings_["escape"] = "quit";
}

void KeyMap::add_binding(const std::string& action, const std::string& key_sequence) {
    bindings_[key_sequence] = action;
}

void KeyMap::load_from_config(const std::unordered_map<std::string, std::string>& keybinds) {
    for (const auto& [action, key] : keybinds) {
        if (!is_known_action(action)) {
            util::Logger::warn("KeyMap: Unknown action '" + action + "' in keybinds");
            continue;
        }
        if (key.empty()) {
            util::Logger::warn("KeyMap: Empty key for action '" + action + "'");
            continue;
        }
        add_binding(action, key);
        util::Logger::debug("KeyMap: Bound " + key + " -> " + action);
    }
}

std::string KeyMap::lookup_action(const std::string& key_sequence) const {
    auto it = bindings_.find(key_sequence);
    if (it != bindings_.end()) {
        return it->second;
    }
    return "";
}

const std::vector<std::string>& KeyMap::known_actions() {
    static const std::vector<std::string> actions = {
        "next", "previous", "page_down", "page_up", "go_to_first", "go_to_last",
        "enter_dir", "go_up", "refresh", "sort_size", "sort_mtime", "sort_count",
        "toggle_help", "quit"
    };
    return actions;
}

bool KeyMap::is_known_action(const std::string& action) {
    const auto& actions = known_actions();
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

}  // namespace rdu::config
