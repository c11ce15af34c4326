#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace rdu::config {

// Key name (as produced by ui::Terminal, e.g. "j", "down", "ctrl+d") -> action
class KeyMap {
public:
    KeyMap();

    void load_default_keybinds();
    void add_binding(const std::string& action, const std::string& key_sequence);
    void load_from_config(const std::unordered_map<std::string, std::string>& keybinds);
    std::string lookup_action(const std::string& key_sequence) const;

    // Every action the browser understands, for validating configured bindings
    static const std::vector<std::string>& known_actions();
    static bool is_known_action(const std::string& action);

private:
    std::unordered_map<std::string, std::string> bindings_;
};

}  // namespace rdu::config
